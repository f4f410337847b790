// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include "lm_token.hpp"

#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace lumen {

std::string Position::to_string() const {
    return std::to_string(line) + ":" + std::to_string(column);
}

// ---- Lexeme ----

Lexeme::Lexeme(LexemeKind kind)
    : kind_(kind) {
    if (TokenUtils::has_payload(kind)) {
        throw std::invalid_argument(std::string("Lexeme kind ") +
                                    TokenUtils::kind_name(kind) + " requires a payload");
    }
}

Lexeme Lexeme::identifier(std::string text) {
    return Lexeme(LexemeKind::Identifier, Payload(std::move(text)));
}

Lexeme Lexeme::string_literal(std::string text) {
    return Lexeme(LexemeKind::StringLiteral, Payload(std::move(text)));
}

Lexeme Lexeme::number_literal(double value) {
    return Lexeme(LexemeKind::NumberLiteral, Payload(value));
}

std::string Lexeme::to_string() const {
    std::ostringstream out;
    out << TokenUtils::kind_name(kind_);
    switch (kind_) {
        case LexemeKind::Identifier:
            out << " '" << text() << "'";
            break;
        case LexemeKind::StringLiteral:
            out << " \"" << text() << "\"";
            break;
        case LexemeKind::NumberLiteral:
            out << " " << number();
            break;
        default:
            break;
    }
    return out.str();
}

// ---- Token ----

std::string Token::to_string() const {
    return lexeme.to_string() + " at line " + position.to_string();
}

// ---- TokenUtils ----

const char* TokenUtils::kind_name(LexemeKind kind) {
    switch (kind) {
        case LexemeKind::LeftParen:     return "LEFT_PAREN";
        case LexemeKind::RightParen:    return "RIGHT_PAREN";
        case LexemeKind::LeftBrace:     return "LEFT_BRACE";
        case LexemeKind::RightBrace:    return "RIGHT_BRACE";
        case LexemeKind::Comma:         return "COMMA";
        case LexemeKind::Dot:           return "DOT";
        case LexemeKind::Minus:         return "MINUS";
        case LexemeKind::Plus:          return "PLUS";
        case LexemeKind::Semicolon:     return "SEMICOLON";
        case LexemeKind::Slash:         return "SLASH";
        case LexemeKind::Star:          return "STAR";
        case LexemeKind::Bang:          return "BANG";
        case LexemeKind::BangEqual:     return "BANG_EQUAL";
        case LexemeKind::Equal:         return "EQUAL";
        case LexemeKind::EqualEqual:    return "EQUAL_EQUAL";
        case LexemeKind::Greater:       return "GREATER";
        case LexemeKind::GreaterEqual:  return "GREATER_EQUAL";
        case LexemeKind::Less:          return "LESS";
        case LexemeKind::LessEqual:     return "LESS_EQUAL";
        case LexemeKind::Identifier:    return "IDENTIFIER";
        case LexemeKind::StringLiteral: return "STRING";
        case LexemeKind::NumberLiteral: return "NUMBER";
        case LexemeKind::And:           return "AND";
        case LexemeKind::Class:         return "CLASS";
        case LexemeKind::Else:          return "ELSE";
        case LexemeKind::False:         return "FALSE";
        case LexemeKind::For:           return "FOR";
        case LexemeKind::Func:          return "FUNC";
        case LexemeKind::If:            return "IF";
        case LexemeKind::Let:           return "LET";
        case LexemeKind::Nil:           return "NIL";
        case LexemeKind::Or:            return "OR";
        case LexemeKind::Print:         return "PRINT";
        case LexemeKind::Return:        return "RETURN";
        case LexemeKind::Super:         return "SUPER";
        case LexemeKind::This:          return "THIS";
        case LexemeKind::True:          return "TRUE";
        case LexemeKind::While:         return "WHILE";
        case LexemeKind::Comment:       return "COMMENT";
        case LexemeKind::Whitespace:    return "WHITESPACE";
        case LexemeKind::Eof:           return "EOF";
    }
    return "UNKNOWN";
}

bool TokenUtils::has_payload(LexemeKind kind) {
    return kind == LexemeKind::Identifier ||
           kind == LexemeKind::StringLiteral ||
           kind == LexemeKind::NumberLiteral;
}

bool TokenUtils::is_keyword(LexemeKind kind) {
    return kind >= LexemeKind::And && kind <= LexemeKind::While;
}

bool TokenUtils::is_internal(LexemeKind kind) {
    return kind == LexemeKind::Comment ||
           kind == LexemeKind::Whitespace ||
           kind == LexemeKind::Eof;
}

LexemeKind TokenUtils::keyword_kind(std::string_view str) {
    static const std::unordered_map<std::string_view, LexemeKind> keywords = {
        {"and", LexemeKind::And},
        {"class", LexemeKind::Class},
        {"else", LexemeKind::Else},
        {"false", LexemeKind::False},
        {"for", LexemeKind::For},
        {"func", LexemeKind::Func},
        {"if", LexemeKind::If},
        {"let", LexemeKind::Let},
        {"nil", LexemeKind::Nil},
        {"or", LexemeKind::Or},
        {"print", LexemeKind::Print},
        {"return", LexemeKind::Return},
        {"super", LexemeKind::Super},
        {"this", LexemeKind::This},
        {"true", LexemeKind::True},
        {"while", LexemeKind::While},
    };

    auto it = keywords.find(str);
    if (it != keywords.end()) {
        return it->second;
    }
    return LexemeKind::Identifier;
}

bool TokenUtils::is_keyword(std::string_view str) {
    return keyword_kind(str) != LexemeKind::Identifier;
}

std::ostream& operator<<(std::ostream& os, const Position& pos) {
    return os << pos.to_string();
}

std::ostream& operator<<(std::ostream& os, const Lexeme& lexeme) {
    return os << lexeme.to_string();
}

std::ostream& operator<<(std::ostream& os, const Token& token) {
    return os << token.to_string();
}

} // namespace lumen
