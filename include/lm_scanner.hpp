// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lm_scanner.hpp
 * @brief Scanner state machine and the scan_all() driver.
 *
 * Scanner produces one Token per scan_token() call, including the
 * internal-only Whitespace, Comment and Eof kinds. scan_all() runs a full
 * pass, drops the internal kinds and stops at the first error.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "lm_cursor.hpp"
#include "lm_result.hpp"
#include "lm_token.hpp"

namespace lumen {

// Scanner configuration
struct ScannerConfig {
    bool keep_trivia = false;   // keep Whitespace/Comment tokens in scan_all()
    bool enable_debug = false;  // print a pass summary to stderr
};

class Scanner {
public:
    // The source must outlive the scanner. Tokens never reference it.
    explicit Scanner(std::string_view source, ScannerConfig config = {});

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    ScanResult<Token> scan_token();

    const Position& position() const { return current_position_; }
    const ScannerConfig& config() const { return config_; }
    size_t bytes_consumed() const { return source_.offset(); }

private:
    SourceCursor source_;
    std::string current_string_;
    Position current_position_;
    ScannerConfig config_;

    char advance();
    bool match(char expected);
    void advance_until_newline();
    void consume_utf8_tail(char lead);

    ScanResult<Token> make_token(Lexeme lexeme);
    ScanResult<Token> make_error(ScanErrorKind kind, Position position, std::string text);

    ScanResult<Token> scan_string();
    ScanResult<Token> scan_number();
    ScanResult<Token> scan_identifier();

    static bool is_digit(char c);
    static bool is_alpha(char c);
    static bool is_alpha_numeric(char c);
    static bool is_whitespace(char c);
    static bool is_continuation_byte(char c);
    static size_t utf8_sequence_length(char lead);
};

// Restartable, peekable token sequence produced by scan_all().
class TokenStream {
public:
    using const_iterator = std::vector<Token>::const_iterator;

    TokenStream() = default;
    explicit TokenStream(std::vector<Token> tokens)
        : tokens_(std::move(tokens)) {}

    // nullptr past the end
    const Token* peek(size_t ahead = 0) const;
    const Token* next();
    void reset() { cursor_ = 0; }
    bool at_end() const { return cursor_ >= tokens_.size(); }

    size_t size() const { return tokens_.size(); }
    bool empty() const { return tokens_.empty(); }
    const Token& operator[](size_t index) const { return tokens_.at(index); }

    const_iterator begin() const { return tokens_.begin(); }
    const_iterator end() const { return tokens_.end(); }
    const std::vector<Token>& tokens() const { return tokens_; }

private:
    std::vector<Token> tokens_;
    size_t cursor_{0};
};

// Scans the whole source. Either every non-internal token in source
// order, or the first error with no partial output.
ScanResult<TokenStream> scan_all(std::string_view source, const ScannerConfig& config = {});

} // namespace lumen
