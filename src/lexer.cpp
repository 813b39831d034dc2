#include "lexer.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

std::string token_type_name(TokenType t) {
    switch (t) {
        case TokenType::LET: return "LET";
        case TokenType::RETURN: return "RETURN";
        case TokenType::BREAK: return "BREAK";
        case TokenType::ASYNC: return "ASYNC";
        case TokenType::AWAIT: return "AWAIT";
        case TokenType::IF: return "IF";
        case TokenType::ELSE: return "ELSE";
        case TokenType::LOOP: return "LOOP";
        case TokenType::TRY: return "TRY";
        case TokenType::CATCH: return "CATCH";
        case TokenType::IDENTIFIER: return "IDENTIFIER";
        case TokenType::NUMBER: return "NUMBER";
        case TokenType::STRING: return "STRING";
        case TokenType::BOOLEAN: return "BOOLEAN";
        case TokenType::NULL_LITERAL: return "NULL";
        case TokenType::SEMICOLON: return "';'";
        case TokenType::COMMA: return "','";
        case TokenType::COLON: return "':'";
        case TokenType::OPENPARENTHESIS: return "'('";
        case TokenType::CLOSEPARENTHESIS: return "')'";
        case TokenType::OPENBRACE: return "'{'";
        case TokenType::CLOSEBRACE: return "'}'";
        case TokenType::OPENBRACKET: return "'['";
        case TokenType::CLOSEBRACKET: return "']'";
        case TokenType::ASSIGN: return "'='";
        case TokenType::EOF_TOKEN: return "end of input";
        case TokenType::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

Lexer::Lexer(const std::string& source, const std::string& filename, const SourceManager* mgr)
    : src(source), filename(filename), i(0), line(1), col(1), src_mgr(mgr) {}

bool Lexer::eof() const {
    return i >= src.size();
}

char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else {
        col++;
    }
    return c;
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    TokenLocation loc(filename.empty() ? "<input>" : filename, tok_line, tok_col, len, src_mgr);
    out.emplace_back(type, value, loc);
}

void Lexer::error(const std::string& msg, int tok_line, int tok_col) const {
    TokenLocation loc(filename.empty() ? "<input>" : filename, tok_line, tok_col, 1, src_mgr);
    throw std::runtime_error("Lexer error at " + loc.to_string() + ": " + msg + "\n--> Traced at:\n" + loc.get_line_trace());
}

void Lexer::skip_line_comment() {
    while (!eof() && peek() != '\n') advance();
}

void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    while (std::isdigit(static_cast<unsigned char>(peek()))) advance();

    // fractional part only when a digit follows the dot
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        advance();
        while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
    }

    std::string text = src.substr(start_index, i - start_index);
    add_token(out, TokenType::NUMBER, text, tok_line, tok_col);
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    static const std::unordered_map<std::string, TokenType> keywords = {
        {"let", TokenType::LET},
        {"return", TokenType::RETURN},
        {"break", TokenType::BREAK},
        {"async", TokenType::ASYNC},
        {"await", TokenType::AWAIT},
        {"if", TokenType::IF},
        {"else", TokenType::ELSE},
        {"loop", TokenType::LOOP},
        {"try", TokenType::TRY},
        {"catch", TokenType::CATCH},
        {"true", TokenType::BOOLEAN},
        {"false", TokenType::BOOLEAN},
        {"null", TokenType::NULL_LITERAL},
    };

    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') advance();

    std::string word = src.substr(start_index, i - start_index);
    auto it = keywords.find(word);
    add_token(out, it != keywords.end() ? it->second : TokenType::IDENTIFIER, word, tok_line, tok_col);
}

void Lexer::scan_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    // skip opening quote
    advance();
    std::string val;

    while (true) {
        if (eof() || peek() == '\n') {
            error("unterminated string literal", tok_line, tok_col);
        }
        char c = peek();
        if (c == '"') {
            advance();
            break;
        }

        if (c == '\\') {
            advance();  // consume backslash
            char nxt = advance();
            switch (nxt) {
                case 'n': val.push_back('\n'); break;
                case 't': val.push_back('\t'); break;
                case 'r': val.push_back('\r'); break;
                case '"': val.push_back('"'); break;
                case '\\': val.push_back('\\'); break;
                default: {
                    std::ostringstream ss;
                    ss << "unknown escape sequence '\\" << nxt << "'";
                    error(ss.str(), line, col - 2);
                }
            }
            continue;
        }

        val.push_back(advance());
    }

    add_token(out, TokenType::STRING, val, tok_line, tok_col, static_cast<int>(i - start_index));
}

void Lexer::scan_token(std::vector<Token>& out) {
    char c = peek();

    if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f') {
        advance();
        return;
    }

    if (c == '/' && peek(1) == '/') {
        skip_line_comment();
        return;
    }

    int tok_line = line;
    int tok_col = col;
    size_t start_index = i;

    if (std::isdigit(static_cast<unsigned char>(c))) {
        scan_number(out, tok_line, tok_col, start_index);
        return;
    }

    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        scan_identifier_or_keyword(out, tok_line, tok_col, start_index);
        return;
    }

    if (c == '"') {
        scan_string(out, tok_line, tok_col, start_index);
        return;
    }

    TokenType type = TokenType::UNKNOWN;
    switch (c) {
        case '(': type = TokenType::OPENPARENTHESIS; break;
        case ')': type = TokenType::CLOSEPARENTHESIS; break;
        case '{': type = TokenType::OPENBRACE; break;
        case '}': type = TokenType::CLOSEBRACE; break;
        case '[': type = TokenType::OPENBRACKET; break;
        case ']': type = TokenType::CLOSEBRACKET; break;
        case ',': type = TokenType::COMMA; break;
        case ';': type = TokenType::SEMICOLON; break;
        case ':': type = TokenType::COLON; break;
        case '=': type = TokenType::ASSIGN; break;
        default: {
            std::ostringstream ss;
            ss << "unexpected character '" << c << "'";
            error(ss.str(), tok_line, tok_col);
        }
    }

    advance();
    add_token(out, type, std::string(1, c), tok_line, tok_col, 1);
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;

    // skip UTF-8 BOM if present
    if (src.size() >= 3 && (unsigned char)src[0] == 0xEF && (unsigned char)src[1] == 0xBB && (unsigned char)src[2] == 0xBF) {
        i = 3;
    }

    while (!eof()) scan_token(out);

    // final EOF token
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);

    return out;
}
