// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lm_token.hpp
 * @brief Source positions, lexemes and tokens.
 *
 * A Lexeme is a closed tagged variant: a LexemeKind plus an optional
 * payload (identifier/string text or a number). A Token pairs a Lexeme
 * with the Position at which the scanner produced it.
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace lumen {

// 1-based line/column.
struct Position {
    uint32_t line{1};
    uint32_t column{1};

    static Position reset() { return Position{1, 1}; }

    void advance_column() { column++; }

    void advance_line() {
        line++;
        column = 1;
    }

    bool operator==(const Position& other) const {
        return line == other.line && column == other.column;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }

    std::string to_string() const;
};

// Lexeme kinds
enum class LexemeKind : uint8_t {
    // Punctuation
    LeftParen,      // (
    RightParen,     // )
    LeftBrace,      // {
    RightBrace,     // }
    Comma,          // ,
    Dot,            // .
    Minus,          // -
    Plus,           // +
    Semicolon,      // ;
    Slash,          // /
    Star,           // *

    // One/two-character operators
    Bang,           // !
    BangEqual,      // !=
    Equal,          // =
    EqualEqual,     // ==
    Greater,        // >
    GreaterEqual,   // >=
    Less,           // <
    LessEqual,      // <=

    // Payload carriers
    Identifier,
    StringLiteral,
    NumberLiteral,

    // Keywords
    And,
    Class,
    Else,
    False,
    For,
    Func,
    If,
    Let,
    Nil,
    Or,
    Print,
    Return,
    Super,
    This,
    True,
    While,

    // Internal only, never returned by scan_all()
    Comment,
    Whitespace,
    Eof,
};

class Lexeme {
public:
    using Payload = std::variant<std::monostate, std::string, double>;

    // Throws std::invalid_argument for kinds that carry a payload.
    explicit Lexeme(LexemeKind kind);

    static Lexeme identifier(std::string text);
    static Lexeme string_literal(std::string text);
    static Lexeme number_literal(double value);

    LexemeKind kind() const { return kind_; }
    bool is(LexemeKind kind) const { return kind_ == kind; }

    // Identifier/StringLiteral text. Throws std::bad_variant_access otherwise.
    const std::string& text() const { return std::get<std::string>(payload_); }
    // NumberLiteral value. Throws std::bad_variant_access otherwise.
    double number() const { return std::get<double>(payload_); }

    bool operator==(const Lexeme& other) const {
        return kind_ == other.kind_ && payload_ == other.payload_;
    }
    bool operator!=(const Lexeme& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    Lexeme(LexemeKind kind, Payload payload)
        : kind_(kind), payload_(std::move(payload)) {}

    LexemeKind kind_;
    Payload payload_;
};

struct Token {
    Lexeme lexeme;
    Position position;

    Token(Lexeme lex, Position pos)
        : lexeme(std::move(lex)), position(pos) {}

    LexemeKind kind() const { return lexeme.kind(); }

    bool operator==(const Token& other) const {
        return lexeme == other.lexeme && position == other.position;
    }

    std::string to_string() const;
};

// Token utilities
class TokenUtils {
public:
    static const char* kind_name(LexemeKind kind);
    static bool has_payload(LexemeKind kind);
    static bool is_keyword(LexemeKind kind);
    static bool is_internal(LexemeKind kind);

    // Reserved word lookup; Identifier when the text is not reserved
    static LexemeKind keyword_kind(std::string_view str);
    static bool is_keyword(std::string_view str);
};

std::ostream& operator<<(std::ostream& os, const Position& pos);
std::ostream& operator<<(std::ostream& os, const Lexeme& lexeme);
std::ostream& operator<<(std::ostream& os, const Token& token);

} // namespace lumen
