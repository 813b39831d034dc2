#include <stdexcept>

#include "parser.hpp"

std::unique_ptr < StatementNode > Parser::parse_statement() {
  Token t = peek();

  switch (t.type) {
    case TokenType::LET:
      consume();
      return parse_variable_declaration();
    case TokenType::IF:
      consume();
      return parse_if_statement();
    case TokenType::LOOP:
      consume();
      return parse_loop_statement();
    case TokenType::ASYNC:
      consume();
      return parse_async_function();
    case TokenType::RETURN:
      consume();
      return parse_return_statement();
    case TokenType::BREAK: {
      Token kwTok = consume();
      auto node = std::make_unique < BreakStatementNode > ();
      node->token = kwTok;
      expect(TokenType::SEMICOLON, "Expected ';' after 'break'");
      return node;
    }
    case TokenType::TRY:
      consume();
      return parse_try_catch();
    case TokenType::IDENTIFIER:
      return parse_identifier_statement();
    default:
      break;
  }

  // expression statement
  auto exprStmt = std::make_unique < ExpressionStatementNode > ();
  exprStmt->token = t;
  exprStmt->expression = parse_expression();
  expect(TokenType::SEMICOLON, "Expected ';' after expression");
  return exprStmt;
}

std::unique_ptr < StatementNode > Parser::parse_variable_declaration() {
  // 'let' already consumed
  Token kwTok = tokens[position - 1];
  Token idTok = expect(TokenType::IDENTIFIER, "Expected identifier after 'let'");
  expect(TokenType::ASSIGN, "Expected '=' after variable name");

  auto node = std::make_unique < VariableDeclarationNode > ();
  node->token = kwTok;
  node->identifier = idTok.value;
  node->value = parse_expression();
  expect(TokenType::SEMICOLON, "Expected ';' after variable declaration");
  return node;
}

// Statements that start with an identifier:
//   name = expr;
//   save "file";
//   name(a, b) { ... }     function declaration
//   name(args);            call statement
std::unique_ptr < StatementNode > Parser::parse_identifier_statement() {
  Token idTok = peek();

  if (peek_next().type == TokenType::ASSIGN) {
    consume();  // identifier
    consume();  // '='
    auto node = std::make_unique < AssignmentNode > ();
    node->token = idTok;
    node->identifier = idTok.value;
    node->value = parse_expression();
    expect(TokenType::SEMICOLON, "Expected ';' after assignment");
    return node;
  }

  if (idTok.value == "save" && peek_next().type == TokenType::STRING) {
    consume();  // 'save'
    Token pathTok = consume();

    auto callee = std::make_unique < IdentifierNode > ();
    callee->name = idTok.value;
    callee->token = idTok;

    auto path = std::make_unique < StringLiteralNode > ();
    path->value = pathTok.value;
    path->token = pathTok;

    auto call = std::make_unique < CallExpressionNode > ();
    call->token = idTok;
    call->callee = std::move(callee);
    call->arguments.push_back(std::move(path));

    auto stmt = std::make_unique < ExpressionStatementNode > ();
    stmt->token = idTok;
    stmt->expression = std::move(call);
    expect(TokenType::SEMICOLON, "Expected ';' after save statement");
    return stmt;
  }

  if (peek_next().type == TokenType::OPENPARENTHESIS) {
    // A parenthesised list of bare identifiers followed by '{' declares a function.
    size_t look = position + 2;
    bool params_only = true;
    bool expect_name = true;
    while (look < tokens.size() && tokens[look].type != TokenType::CLOSEPARENTHESIS) {
      TokenType lt = tokens[look].type;
      if (expect_name && lt == TokenType::IDENTIFIER) {
        expect_name = false;
      } else if (!expect_name && lt == TokenType::COMMA) {
        expect_name = true;
      } else {
        params_only = false;
        break;
      }
      ++look;
    }
    if (params_only && look + 1 < tokens.size() && tokens[look].type == TokenType::CLOSEPARENTHESIS &&
      tokens[look + 1].type == TokenType::OPENBRACE) {
      consume();  // name
      return parse_function_rest(idTok, false);
    }
  }

  auto exprStmt = std::make_unique < ExpressionStatementNode > ();
  exprStmt->token = idTok;
  exprStmt->expression = parse_expression();
  expect(TokenType::SEMICOLON, "Expected ';' after expression");
  return exprStmt;
}

std::unique_ptr < StatementNode > Parser::parse_if_statement() {
  Token kwTok = tokens[position - 1];

  auto node = std::make_unique < IfStatementNode > ();
  node->token = kwTok;
  node->condition = parse_expression();
  node->then_body = parse_block();

  if (match(TokenType::ELSE)) {
    node->has_else = true;
    if (peek().type == TokenType::IF) {
      // else if: the nested if becomes the whole else body
      consume();
      node->else_body.push_back(parse_if_statement());
    } else {
      node->else_body = parse_block();
    }
  }
  return node;
}

std::unique_ptr < StatementNode > Parser::parse_loop_statement() {
  Token kwTok = tokens[position - 1];

  auto node = std::make_unique < LoopStatementNode > ();
  node->token = kwTok;
  if (match(TokenType::OPENPARENTHESIS)) {
    node->condition = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after loop condition");
  }
  node->body = parse_block();
  return node;
}

std::unique_ptr < StatementNode > Parser::parse_async_function() {
  Token nameTok = expect(TokenType::IDENTIFIER, "Expected function name after 'async'");
  return parse_function_rest(nameTok, true);
}

std::vector < std::string > Parser::parse_parameter_list() {
  expect(TokenType::OPENPARENTHESIS, "Expected '(' after function name");
  std::vector < std::string > params;
  if (peek().type != TokenType::CLOSEPARENTHESIS) {
    do {
      Token p = expect(TokenType::IDENTIFIER, "Expected parameter name");
      params.push_back(p.value);
    } while (match(TokenType::COMMA));
  }
  expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after parameters");
  return params;
}

std::unique_ptr < FunctionDeclarationNode > Parser::parse_function_rest(const Token& nameTok, bool is_async) {
  auto fn = std::make_unique < FunctionDeclarationNode > ();
  fn->token = nameTok;
  fn->name = nameTok.value;
  fn->is_async = is_async;
  fn->parameters = parse_parameter_list();
  fn->body = parse_block();
  return fn;
}

std::unique_ptr < StatementNode > Parser::parse_return_statement() {
  // 'return' already consumed
  Token kwTok = tokens[position - 1];

  auto retNode = std::make_unique < ReturnStatementNode > ();
  retNode->token = kwTok;

  if (peek().type != TokenType::SEMICOLON && peek().type != TokenType::CLOSEBRACE) {
    retNode->value = parse_expression();
  }
  expect(TokenType::SEMICOLON, "Expected ';' after return");
  return retNode;
}

std::unique_ptr < StatementNode > Parser::parse_try_catch() {
  Token kwTok = tokens[position - 1];

  auto node = std::make_unique < TryCatchNode > ();
  node->token = kwTok;
  node->tryBlock = parse_block();

  expect(TokenType::CATCH, "Expected 'catch' after try block");
  if (match(TokenType::OPENPARENTHESIS)) {
    node->errorVar = expect(TokenType::IDENTIFIER, "Expected error variable name in catch").value;
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after catch variable");
  } else {
    node->errorVar = expect(TokenType::IDENTIFIER, "Expected error variable name after 'catch'").value;
  }
  node->catchBlock = parse_block();
  return node;
}
