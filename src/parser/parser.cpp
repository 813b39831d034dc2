// src/parser/parser.cpp
#include "parser.hpp"

#include <stdexcept>

Parser::Parser(const std::vector<Token>& tokens) : tokens(tokens) {}

// Return current token or EOF token
Token Parser::peek() const {
    if (position < tokens.size()) return tokens[position];
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

Token Parser::peek_next(size_t offset) const {
    if (position + offset < tokens.size()) {
        return tokens[position + offset];
    }
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

// Consume and return the next token or EOF token
Token Parser::consume() {
    if (position < tokens.size()) return tokens[position++];
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

bool Parser::match(TokenType t) {
    if (peek().type == t) {
        consume();
        return true;
    }
    return false;
}

void Parser::fail(const Token& at, const std::string& errMsg) const {
    std::string found = at.type == TokenType::EOF_TOKEN ? "end of input" : "'" + at.value + "'";
    throw std::runtime_error(
        "Parse error at " + at.loc.to_string() + ": " + errMsg + " (found " + found + ")" +
        "\n--> Traced at:\n" + at.loc.get_line_trace());
}

Token Parser::expect(TokenType t, const std::string& errMsg) {
    if (peek().type != t) {
        fail(peek(), errMsg);
    }
    return consume();
}

std::unique_ptr<ProgramNode> Parser::parse() {
    auto program = std::make_unique<ProgramNode>();
    if (!tokens.empty()) program->token = tokens.front();

    while (peek().type != TokenType::EOF_TOKEN) {
        // stray semicolons are empty statements
        if (match(TokenType::SEMICOLON)) continue;
        program->body.push_back(parse_statement());
    }
    return program;
}

StatementList Parser::parse_block() {
    expect(TokenType::OPENBRACE, "Expected '{' to open block");
    StatementList body;
    while (peek().type != TokenType::CLOSEBRACE && peek().type != TokenType::EOF_TOKEN) {
        if (match(TokenType::SEMICOLON)) continue;
        body.push_back(parse_statement());
    }
    expect(TokenType::CLOSEBRACE, "Expected '}' to close block");
    return body;
}
