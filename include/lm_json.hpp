// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lm_json.hpp
 * @brief JSON export of tokens and scan errors.
 *
 * Used by tooling (editors, test fixtures) that consumes a scan pass as
 * data rather than through the C++ API.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "lm_result.hpp"
#include "lm_scanner.hpp"
#include "lm_token.hpp"

namespace lumen {

using json = nlohmann::json;

// {"kind", "line", "column"} plus "text" or "value" for payload kinds
json token_to_json(const Token& token);
json tokens_to_json(const TokenStream& tokens);

// {"error", "message", "line", "column", "text"}
json scan_error_to_json(const ScanError& error);

// {"ok": true, "tokens": [...]} or {"ok": false, "error": {...}}
json scan_result_to_json(const ScanResult<TokenStream>& result);

} // namespace lumen
