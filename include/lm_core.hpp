// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lm_core.hpp
 * @brief Shared macros and version information for the Lumen scanner.
 */

#pragma once

#include <cstdio>

namespace lumen {

constexpr const char* VERSION = "0.1.0";

} // namespace lumen

// Debug utilities
#ifdef LM_DEBUG
    #define LM_DEBUG_SCAN(fmt, ...) \
        std::fprintf(stderr, "[SCAN] " fmt "\n", ##__VA_ARGS__)
#else
    #define LM_DEBUG_SCAN(fmt, ...)
#endif
