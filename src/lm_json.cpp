// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include "lm_json.hpp"

namespace lumen {

json token_to_json(const Token& token) {
    json item;
    item["kind"] = TokenUtils::kind_name(token.kind());
    item["line"] = token.position.line;
    item["column"] = token.position.column;

    switch (token.kind()) {
        case LexemeKind::Identifier:
        case LexemeKind::StringLiteral:
            item["text"] = token.lexeme.text();
            break;
        case LexemeKind::NumberLiteral:
            item["value"] = token.lexeme.number();
            break;
        default:
            break;
    }
    return item;
}

json tokens_to_json(const TokenStream& tokens) {
    json arr = json::array();
    for (const auto& token : tokens) {
        arr.push_back(token_to_json(token));
    }
    return arr;
}

json scan_error_to_json(const ScanError& error) {
    return {
        {"error", ScanError::kind_name(error.kind)},
        {"message", error.to_string()},
        {"line", error.position.line},
        {"column", error.position.column},
        {"text", error.text},
    };
}

json scan_result_to_json(const ScanResult<TokenStream>& result) {
    json out;
    out["ok"] = result.ok();
    if (result.ok()) {
        out["tokens"] = tokens_to_json(result.value());
    } else {
        out["error"] = scan_error_to_json(result.error());
    }
    return out;
}

} // namespace lumen
