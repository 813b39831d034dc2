#pragma once
#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

class Parser {
   public:
    Parser(const std::vector<Token>& tokens);
    std::unique_ptr<ProgramNode> parse();

   private:
    std::vector<Token> tokens;
    size_t position = 0;

    Token peek() const;
    Token peek_next(size_t offset = 1) const;

    Token consume();
    bool match(TokenType t);
    Token expect(TokenType t, const std::string& errMsg);
    [[noreturn]] void fail(const Token& at, const std::string& errMsg) const;

    // expressions
    std::unique_ptr<ExpressionNode> parse_expression();
    std::unique_ptr<ExpressionNode> parse_primary();
    std::unique_ptr<ExpressionNode> parse_call(std::unique_ptr<IdentifierNode> callee);
    std::unique_ptr<ExpressionNode> parse_array_expression();
    std::unique_ptr<ExpressionNode> parse_record_expression();

    // statements
    std::unique_ptr<StatementNode> parse_statement();
    std::unique_ptr<StatementNode> parse_variable_declaration();
    std::unique_ptr<StatementNode> parse_identifier_statement();
    std::unique_ptr<StatementNode> parse_if_statement();
    std::unique_ptr<StatementNode> parse_loop_statement();
    std::unique_ptr<StatementNode> parse_async_function();
    std::unique_ptr<StatementNode> parse_return_statement();
    std::unique_ptr<StatementNode> parse_try_catch();

    // function declaration `name(a, b) { ... }`, entered after the name
    std::unique_ptr<FunctionDeclarationNode> parse_function_rest(const Token& nameTok, bool is_async);
    std::vector<std::string> parse_parameter_list();

    // '{' statement* '}'
    StatementList parse_block();
};
