#include <gtest/gtest.h>
#include "test_helpers.hpp"

#include <stdexcept>
#include <variant>

using namespace lumen;
using namespace lumen::test;

// ============================================================================
// Position
// ============================================================================

TEST(PositionTests, ResetStartsAtOneOne) {
    Position p = Position::reset();
    EXPECT_EQ(p.line, 1u);
    EXPECT_EQ(p.column, 1u);
    EXPECT_EQ(p, Position{});
}

TEST(PositionTests, AdvanceColumn) {
    Position p = Position::reset();
    p.advance_column();
    p.advance_column();
    EXPECT_EQ(p, pos(1, 3));
}

TEST(PositionTests, AdvanceLineResetsColumn) {
    Position p = Position::reset();
    p.advance_column();
    p.advance_column();
    p.advance_line();
    EXPECT_EQ(p, pos(2, 1));
    EXPECT_EQ(p.to_string(), "2:1");
}

// ============================================================================
// Lexeme
// ============================================================================

TEST(LexemeTests, FixedKindsCarryNoPayload) {
    Lexeme l(LexemeKind::LessEqual);
    EXPECT_EQ(l.kind(), LexemeKind::LessEqual);
    EXPECT_THROW((void)l.text(), std::bad_variant_access);
    EXPECT_THROW((void)l.number(), std::bad_variant_access);
}

TEST(LexemeTests, PayloadKindsRequireFactory) {
    EXPECT_THROW({ Lexeme l(LexemeKind::Identifier); (void)l; }, std::invalid_argument);
    EXPECT_THROW({ Lexeme l(LexemeKind::StringLiteral); (void)l; }, std::invalid_argument);
    EXPECT_THROW({ Lexeme l(LexemeKind::NumberLiteral); (void)l; }, std::invalid_argument);
}

TEST(LexemeTests, Payloads) {
    EXPECT_EQ(ident("foo").text(), "foo");
    EXPECT_EQ(str("a b").text(), "a b");
    EXPECT_DOUBLE_EQ(num(12.5).number(), 12.5);
    EXPECT_THROW((void)num(1).text(), std::bad_variant_access);
}

TEST(LexemeTests, EqualityComparesKindAndPayload) {
    EXPECT_EQ(ident("x"), ident("x"));
    EXPECT_NE(ident("x"), ident("y"));
    EXPECT_NE(ident("x"), str("x"));
    EXPECT_EQ(num(2), num(2.0));
    EXPECT_EQ(lex(LexemeKind::Let), lex(LexemeKind::Let));
    EXPECT_NE(lex(LexemeKind::Let), lex(LexemeKind::If));
}

TEST(LexemeTests, ToString) {
    EXPECT_EQ(lex(LexemeKind::Semicolon).to_string(), "SEMICOLON");
    EXPECT_EQ(ident("x").to_string(), "IDENTIFIER 'x'");
    EXPECT_EQ(str("hi").to_string(), "STRING \"hi\"");
    EXPECT_EQ(num(12.5).to_string(), "NUMBER 12.5");
}

TEST(TokenTests, ToStringIncludesPosition) {
    Token t(ident("x"), pos(1, 6));
    EXPECT_EQ(t.to_string(), "IDENTIFIER 'x' at line 1:6");
    EXPECT_EQ(t.kind(), LexemeKind::Identifier);
}

// ============================================================================
// TokenUtils
// ============================================================================

TEST(TokenUtilsTests, KeywordLookup) {
    EXPECT_EQ(TokenUtils::keyword_kind("and"), LexemeKind::And);
    EXPECT_EQ(TokenUtils::keyword_kind("or"), LexemeKind::Or);
    EXPECT_EQ(TokenUtils::keyword_kind("print"), LexemeKind::Print);
    EXPECT_EQ(TokenUtils::keyword_kind("return"), LexemeKind::Return);
    EXPECT_EQ(TokenUtils::keyword_kind("super"), LexemeKind::Super);
    EXPECT_EQ(TokenUtils::keyword_kind("let"), LexemeKind::Let);
    EXPECT_EQ(TokenUtils::keyword_kind("while"), LexemeKind::While);
}

TEST(TokenUtilsTests, NonKeywordsAreIdentifiers) {
    EXPECT_EQ(TokenUtils::keyword_kind("ohile"), LexemeKind::Identifier);
    EXPECT_EQ(TokenUtils::keyword_kind("lf"), LexemeKind::Identifier);
    EXPECT_EQ(TokenUtils::keyword_kind("Let"), LexemeKind::Identifier);
    EXPECT_EQ(TokenUtils::keyword_kind("f"), LexemeKind::Identifier);
    EXPECT_EQ(TokenUtils::keyword_kind(""), LexemeKind::Identifier);
    EXPECT_FALSE(TokenUtils::is_keyword("classy"));
    EXPECT_TRUE(TokenUtils::is_keyword("class"));
}

TEST(TokenUtilsTests, KindClassification) {
    EXPECT_TRUE(TokenUtils::is_keyword(LexemeKind::And));
    EXPECT_TRUE(TokenUtils::is_keyword(LexemeKind::While));
    EXPECT_FALSE(TokenUtils::is_keyword(LexemeKind::Identifier));
    EXPECT_FALSE(TokenUtils::is_keyword(LexemeKind::Comment));

    EXPECT_TRUE(TokenUtils::is_internal(LexemeKind::Comment));
    EXPECT_TRUE(TokenUtils::is_internal(LexemeKind::Whitespace));
    EXPECT_TRUE(TokenUtils::is_internal(LexemeKind::Eof));
    EXPECT_FALSE(TokenUtils::is_internal(LexemeKind::Slash));

    EXPECT_TRUE(TokenUtils::has_payload(LexemeKind::NumberLiteral));
    EXPECT_FALSE(TokenUtils::has_payload(LexemeKind::Nil));
}

TEST(TokenUtilsTests, KindNames) {
    EXPECT_STREQ(TokenUtils::kind_name(LexemeKind::LeftParen), "LEFT_PAREN");
    EXPECT_STREQ(TokenUtils::kind_name(LexemeKind::GreaterEqual), "GREATER_EQUAL");
    EXPECT_STREQ(TokenUtils::kind_name(LexemeKind::Func), "FUNC");
    EXPECT_STREQ(TokenUtils::kind_name(LexemeKind::Eof), "EOF");
}
