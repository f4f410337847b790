// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lm_cursor.hpp
 * @brief Forward cursor over source text with unbounded lookahead.
 */

#pragma once

#include <cstddef>
#include <string_view>

namespace lumen {

class SourceCursor {
public:
    explicit SourceCursor(std::string_view source)
        : source_(source) {}

    bool at_end() const { return current_ >= source_.size(); }

    // True if a character exists `ahead` positions past the cursor.
    bool has(size_t ahead = 0) const;

    // Character `ahead` positions past the cursor, '\0' past the end.
    // Never consumes.
    char peek(size_t ahead = 0) const;

    // Consumes one character. Must not be called at end.
    char next();

    size_t offset() const { return current_; }
    size_t remaining() const { return source_.size() - current_; }

private:
    std::string_view source_;
    size_t current_{0};
};

} // namespace lumen
