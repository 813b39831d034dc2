#include <gtest/gtest.h>

#include <stdexcept>

#include "SourceManager.hpp"
#include "lexer.hpp"
#include "token.hpp"

// Helper to get token types from source
std::vector<TokenType> getTokenTypes(const std::string& source) {
    Lexer lexer(source, "<test>");
    auto tokens = lexer.tokenize();
    std::vector<TokenType> types;
    for (const auto& tok : tokens) {
        types.push_back(tok.type);
    }
    return types;
}

// Basic tokenization
TEST(LexerTest, TokenizesNumbers) {
    Lexer lexer("123", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 1);
    EXPECT_EQ(tokens[0].type, TokenType::NUMBER);
    EXPECT_EQ(tokens[0].value, "123");
}

TEST(LexerTest, TokenizesFloats) {
    Lexer lexer("3.14", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 1);
    EXPECT_EQ(tokens[0].type, TokenType::NUMBER);
    EXPECT_EQ(tokens[0].value, "3.14");
}

TEST(LexerTest, DotWithoutDigitsIsNotANumber) {
    // '.' is not a token of the language
    Lexer lexer("3.", "<test>");
    EXPECT_THROW(lexer.tokenize(), std::runtime_error);
}

TEST(LexerTest, TokenizesIdentifiers) {
    Lexer lexer("lessThan _tmp2", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 2);
    EXPECT_EQ(tokens[0].type, TokenType::IDENTIFIER);
    EXPECT_EQ(tokens[0].value, "lessThan");
    EXPECT_EQ(tokens[1].type, TokenType::IDENTIFIER);
    EXPECT_EQ(tokens[1].value, "_tmp2");
}

// Keywords
TEST(LexerTest, TokenizesKeywords) {
    auto types = getTokenTypes("let if else loop async await return break try catch");
    ASSERT_EQ(types.size(), 11u);
    EXPECT_EQ(types[0], TokenType::LET);
    EXPECT_EQ(types[1], TokenType::IF);
    EXPECT_EQ(types[2], TokenType::ELSE);
    EXPECT_EQ(types[3], TokenType::LOOP);
    EXPECT_EQ(types[4], TokenType::ASYNC);
    EXPECT_EQ(types[5], TokenType::AWAIT);
    EXPECT_EQ(types[6], TokenType::RETURN);
    EXPECT_EQ(types[7], TokenType::BREAK);
    EXPECT_EQ(types[8], TokenType::TRY);
    EXPECT_EQ(types[9], TokenType::CATCH);
    EXPECT_EQ(types[10], TokenType::EOF_TOKEN);
}

TEST(LexerTest, TokenizesBooleansAndNull) {
    Lexer lexer("true false null", "<test>");
    auto tokens = lexer.tokenize();

    EXPECT_EQ(tokens[0].type, TokenType::BOOLEAN);
    EXPECT_EQ(tokens[0].value, "true");
    EXPECT_EQ(tokens[1].type, TokenType::BOOLEAN);
    EXPECT_EQ(tokens[1].value, "false");
    EXPECT_EQ(tokens[2].type, TokenType::NULL_LITERAL);
}

// Strings
TEST(LexerTest, TokenizesDoubleQuotedStrings) {
    Lexer lexer("\"hello world\"", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 1);
    EXPECT_EQ(tokens[0].type, TokenType::STRING);
    EXPECT_EQ(tokens[0].value, "hello world");
}

TEST(LexerTest, UnescapesStrings) {
    Lexer lexer(R"("a\n\"b\"\\")", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 1);
    EXPECT_EQ(tokens[0].value, "a\n\"b\"\\");
}

TEST(LexerTest, UnterminatedStringThrows) {
    Lexer lexer("\"never closed", "<test>");
    EXPECT_THROW(lexer.tokenize(), std::runtime_error);
}

TEST(LexerTest, UnknownEscapeThrows) {
    Lexer lexer(R"("\q")", "<test>");
    EXPECT_THROW(lexer.tokenize(), std::runtime_error);
}

// Punctuation
TEST(LexerTest, TokenizesPunctuation) {
    auto types = getTokenTypes("( ) { } [ ] , ; : =");
    std::vector<TokenType> expected = {
        TokenType::OPENPARENTHESIS, TokenType::CLOSEPARENTHESIS,
        TokenType::OPENBRACE, TokenType::CLOSEBRACE,
        TokenType::OPENBRACKET, TokenType::CLOSEBRACKET,
        TokenType::COMMA, TokenType::SEMICOLON, TokenType::COLON,
        TokenType::ASSIGN, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, UnexpectedCharacterReportsLocation) {
    Lexer lexer("let x = 1;\nlet y = 2 + 3;", "prog.upl");
    try {
        lexer.tokenize();
        FAIL() << "expected a lexer error";
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("prog.upl:2:11"), std::string::npos) << msg;
        EXPECT_NE(msg.find("'+'"), std::string::npos) << msg;
    }
}

// Comments and whitespace
TEST(LexerTest, SkipsLineComments) {
    auto types = getTokenTypes("// nothing here\nlet // trailing\n");
    ASSERT_EQ(types.size(), 2u);
    EXPECT_EQ(types[0], TokenType::LET);
    EXPECT_EQ(types[1], TokenType::EOF_TOKEN);
}

TEST(LexerTest, TracksLinesAndColumns) {
    Lexer lexer("let a = 1;\n  print(a);", "<test>");
    auto tokens = lexer.tokenize();

    // print
    ASSERT_GE(tokens.size(), 6u);
    EXPECT_EQ(tokens[5].value, "print");
    EXPECT_EQ(tokens[5].line(), 2);
    EXPECT_EQ(tokens[5].col(), 3);
}

TEST(LexerTest, SourceManagerQuotesOffendingLine) {
    std::string src = "let a = 1;\nlet b = #;\n";
    SourceManager mgr("<test>", src);
    Lexer lexer(src, "<test>", &mgr);
    try {
        lexer.tokenize();
        FAIL() << "expected a lexer error";
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find(" * 2 | let b = #;"), std::string::npos) << msg;
        EXPECT_NE(msg.find("^"), std::string::npos) << msg;
    }
}

TEST(LexerTest, EmptySourceYieldsOnlyEof) {
    auto types = getTokenTypes("");
    ASSERT_EQ(types.size(), 1u);
    EXPECT_EQ(types[0], TokenType::EOF_TOKEN);
}
