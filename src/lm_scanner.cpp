// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lm_scanner.cpp
 * @brief Scanner implementation.
 *
 * Every consumed character goes through advance(), which appends it to the
 * accumulation buffer and moves the position. Tokens snapshot the position
 * when they are constructed, i.e. after their last character.
 */

#include "lm_scanner.hpp"
#include "lm_core.hpp"

#include <charconv>
#include <iostream>
#include <limits>
#include <system_error>

namespace lumen {

Scanner::Scanner(std::string_view source, ScannerConfig config)
    : source_(source), config_(config) {}

// ---- Character helpers ----

bool Scanner::is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool Scanner::is_alpha(char c) {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           c == '_';
}

bool Scanner::is_alpha_numeric(char c) {
    return is_alpha(c) || is_digit(c);
}

bool Scanner::is_whitespace(char c) {
    return c == ' ' || c == '\r' || c == '\t' || c == '\n';
}

char Scanner::advance() {
    char c = source_.next();
    current_string_.push_back(c);
    if (c == '\n') {
        current_position_.advance_line();
    } else if (!is_continuation_byte(c)) {
        // Columns count characters; UTF-8 continuation bytes do not move them
        current_position_.advance_column();
    }
    return c;
}

bool Scanner::is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t Scanner::utf8_sequence_length(char lead) {
    const auto b = static_cast<unsigned char>(lead);
    if (b < 0x80) return 1;
    if ((b & 0xE0) == 0xC0) return 2;
    if ((b & 0xF0) == 0xE0) return 3;
    if ((b & 0xF8) == 0xF0) return 4;
    return 1;
}

void Scanner::consume_utf8_tail(char lead) {
    for (size_t i = 1; i < utf8_sequence_length(lead); ++i) {
        if (source_.at_end() || !is_continuation_byte(source_.peek())) break;
        advance();
    }
}

bool Scanner::match(char expected) {
    if (source_.at_end() || source_.peek() != expected) return false;
    advance();
    return true;
}

void Scanner::advance_until_newline() {
    while (!source_.at_end()) {
        if (advance() == '\n') break;
    }
}

// ---- Token constructors ----

ScanResult<Token> Scanner::make_token(Lexeme lexeme) {
    Token token(std::move(lexeme), current_position_);
    LM_DEBUG_SCAN("%s", token.to_string().c_str());
    return token;
}

ScanResult<Token> Scanner::make_error(ScanErrorKind kind, Position position, std::string text) {
    ScanError error{kind, position, std::move(text)};
    LM_DEBUG_SCAN("error: %s", error.to_string().c_str());
    return error;
}

// ---- Literals & identifiers ----

ScanResult<Token> Scanner::scan_string() {
    // Drop the opening quote
    current_string_.pop_back();
    const Position start = current_position_;

    for (;;) {
        if (source_.at_end()) {
            return make_error(ScanErrorKind::UnterminatedString, start, "\"" + current_string_);
        }
        if (source_.peek() == '"') break;
        advance();
    }

    // Consume and drop the closing quote
    advance();
    current_string_.pop_back();
    return make_token(Lexeme::string_literal(current_string_));
}

ScanResult<Token> Scanner::scan_number() {
    bool seen_dot = false;
    for (;;) {
        char c = source_.peek();
        if (is_digit(c)) {
            advance();
        } else if (c == '.' && !seen_dot && is_digit(source_.peek(1))) {
            seen_dot = true;
            advance();
        } else {
            break;
        }
    }

    // Buffer holds only digits and at most one interior dot
    double value = 0.0;
    const char* start = current_string_.data();
    const char* end = start + current_string_.size();
    auto [ptr, ec] = std::from_chars(start, end, value);
    if (ec == std::errc::result_out_of_range) {
        value = std::numeric_limits<double>::infinity();
    }
    return make_token(Lexeme::number_literal(value));
}

ScanResult<Token> Scanner::scan_identifier() {
    while (is_alpha_numeric(source_.peek())) advance();

    LexemeKind kind = TokenUtils::keyword_kind(current_string_);
    if (kind == LexemeKind::Identifier) {
        return make_token(Lexeme::identifier(current_string_));
    }
    return make_token(Lexeme(kind));
}

// ---- Main scan ----

ScanResult<Token> Scanner::scan_token() {
    current_string_.clear();

    if (source_.at_end()) {
        return make_token(Lexeme(LexemeKind::Eof));
    }

    char c = advance();

    if (is_whitespace(c)) return make_token(Lexeme(LexemeKind::Whitespace));
    if (is_digit(c)) return scan_number();
    if (is_alpha(c)) return scan_identifier();

    switch (c) {
        case '(': return make_token(Lexeme(LexemeKind::LeftParen));
        case ')': return make_token(Lexeme(LexemeKind::RightParen));
        case '{': return make_token(Lexeme(LexemeKind::LeftBrace));
        case '}': return make_token(Lexeme(LexemeKind::RightBrace));
        case ',': return make_token(Lexeme(LexemeKind::Comma));
        case '.': return make_token(Lexeme(LexemeKind::Dot));
        case '-': return make_token(Lexeme(LexemeKind::Minus));
        case '+': return make_token(Lexeme(LexemeKind::Plus));
        case ';': return make_token(Lexeme(LexemeKind::Semicolon));
        case '*': return make_token(Lexeme(LexemeKind::Star));

        case '!':
            return make_token(Lexeme(match('=') ? LexemeKind::BangEqual : LexemeKind::Bang));
        case '=':
            return make_token(Lexeme(match('=') ? LexemeKind::EqualEqual : LexemeKind::Equal));
        case '>':
            return make_token(Lexeme(match('=') ? LexemeKind::GreaterEqual : LexemeKind::Greater));
        case '<':
            return make_token(Lexeme(match('=') ? LexemeKind::LessEqual : LexemeKind::Less));

        case '/':
            if (match('/')) {
                // Line comment, through the newline or end of input
                advance_until_newline();
                return make_token(Lexeme(LexemeKind::Comment));
            }
            return make_token(Lexeme(LexemeKind::Slash));

        case '"':
            return scan_string();

        default:
            // Report the whole character, not just its lead byte
            consume_utf8_tail(c);
            return make_error(ScanErrorKind::UnknownCharacter, current_position_, current_string_);
    }
}

// ---- TokenStream ----

const Token* TokenStream::peek(size_t ahead) const {
    if (cursor_ >= tokens_.size() || ahead >= tokens_.size() - cursor_) return nullptr;
    return &tokens_[cursor_ + ahead];
}

const Token* TokenStream::next() {
    if (at_end()) return nullptr;
    return &tokens_[cursor_++];
}

// ---- Driver ----

ScanResult<TokenStream> scan_all(std::string_view source, const ScannerConfig& config) {
    Scanner scanner(source, config);
    std::vector<Token> tokens;
    size_t trivia = 0;

    for (;;) {
        ScanResult<Token> result = scanner.scan_token();
        if (!result) {
            if (config.enable_debug) {
                std::cerr << "[scan] failed: " << result.error().to_string() << "\n";
            }
            return result.error();
        }

        Token token = result.take_value();
        switch (token.kind()) {
            case LexemeKind::Eof:
                if (config.enable_debug) {
                    std::cerr << "[scan] " << tokens.size() << " tokens, "
                              << trivia << " trivia dropped, "
                              << scanner.bytes_consumed() << " bytes\n";
                }
                return TokenStream(std::move(tokens));

            case LexemeKind::Whitespace:
            case LexemeKind::Comment:
                if (config.keep_trivia) {
                    tokens.push_back(std::move(token));
                } else {
                    trivia++;
                }
                break;

            default:
                tokens.push_back(std::move(token));
                break;
        }
    }
}

} // namespace lumen
