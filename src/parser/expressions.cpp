#include <stdexcept>

#include "parser.hpp"

std::unique_ptr < ExpressionNode > Parser::parse_expression() {
   if (peek().type == TokenType::AWAIT) {
      Token awaitTok = consume();
      auto node = std::make_unique < AwaitExpressionNode > ();
      node->token = awaitTok;
      node->expression = parse_expression();
      return node;
   }
   return parse_primary();
}

std::unique_ptr < ExpressionNode > Parser::parse_primary() {
   Token t = peek();

   if (t.type == TokenType::NUMBER) {
      Token numTok = consume();
      auto n = std::make_unique < NumericLiteralNode > ();
      n->value = std::stod(numTok.value);
      n->token = numTok;
      return n;
   }

   if (t.type == TokenType::STRING) {
      Token s = consume();
      auto node = std::make_unique < StringLiteralNode > ();
      node->value = s.value;
      node->token = s;
      return node;
   }

   if (t.type == TokenType::BOOLEAN) {
      Token b = consume();
      auto node = std::make_unique < BooleanLiteralNode > ();
      node->value = (b.value == "true");
      node->token = b;
      return node;
   }

   if (t.type == TokenType::NULL_LITERAL) {
      auto node = std::make_unique < NullNode > ();
      node->token = consume();
      return node;
   }

   if (t.type == TokenType::IDENTIFIER) {
      Token idTok = consume();
      auto id = std::make_unique < IdentifierNode > ();
      id->name = idTok.value;
      id->token = idTok;
      if (peek().type == TokenType::OPENPARENTHESIS) {
         return parse_call(std::move(id));
      }
      return id;
   }

   if (t.type == TokenType::OPENBRACKET) {
      return parse_array_expression();
   }

   if (t.type == TokenType::OPENBRACE) {
      return parse_record_expression();
   }

   if (t.type == TokenType::OPENPARENTHESIS) {
      consume();
      auto inner = parse_expression();
      expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after expression");
      return inner;
   }

   fail(t, "Unexpected token in expression");
}

std::unique_ptr < ExpressionNode > Parser::parse_call(std::unique_ptr < IdentifierNode > callee) {
   expect(TokenType::OPENPARENTHESIS, "Expected '(' to start call");

   auto call = std::make_unique < CallExpressionNode > ();
   call->token = callee->token;
   call->callee = std::move(callee);

   if (peek().type != TokenType::CLOSEPARENTHESIS) {
      do {
         call->arguments.push_back(parse_expression());
      } while (match(TokenType::COMMA));
   }
   expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after call arguments");
   return call;
}

std::unique_ptr < ExpressionNode > Parser::parse_array_expression() {
   Token openTok = consume();  // '['
   auto arr = std::make_unique < ArrayExpressionNode > ();
   arr->token = openTok;

   while (peek().type != TokenType::CLOSEBRACKET) {
      arr->elements.push_back(parse_expression());
      if (!match(TokenType::COMMA)) break;
   }
   expect(TokenType::CLOSEBRACKET, "Expected ']' to close array literal");
   return arr;
}

std::unique_ptr < ExpressionNode > Parser::parse_record_expression() {
   Token openTok = consume();  // '{'
   auto rec = std::make_unique < RecordExpressionNode > ();
   rec->token = openTok;

   while (peek().type != TokenType::CLOSEBRACE) {
      Token keyTok = peek();
      if (keyTok.type != TokenType::STRING && keyTok.type != TokenType::IDENTIFIER) {
         fail(keyTok, "Expected string or identifier as record key");
      }
      consume();
      expect(TokenType::COLON, "Expected ':' after record key");
      rec->fields.emplace_back(keyTok.value, parse_expression());
      if (!match(TokenType::COMMA)) break;
   }
   expect(TokenType::CLOSEBRACE, "Expected '}' to close record literal");
   return rec;
}
