#pragma once

#include <algorithm>
#include <string>

#include "SourceManager.hpp"

// Token types (keep in sync with the lexer keyword table)
enum class TokenType {
    // -----------------------
    // Declaration / statements
    // -----------------------
    LET,
    RETURN,
    BREAK,

    //-----------------------
    // asynchronous
    //-----------------------
    ASYNC,
    AWAIT,

    // -----------------------
    // Control-flow
    // -----------------------
    IF,
    ELSE,
    LOOP,

    // -----------------------
    // Error handling
    // -----------------------
    TRY,
    CATCH,

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    NUMBER,
    STRING,
    BOOLEAN,
    NULL_LITERAL,

    // -----------------------
    // Punctuation
    // -----------------------
    SEMICOLON,
    COMMA,
    COLON,
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACE,
    CLOSEBRACE,
    OPENBRACKET,
    CLOSEBRACKET,

    ASSIGN,
    EOF_TOKEN,
    UNKNOWN
};

std::string token_type_name(TokenType t);

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<input>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in characters

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(mgr) {}

    int end_col() const { return col + std::max(0, length - 1); }

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location
struct Token {
    TokenType type = TokenType::UNKNOWN;
    std::string value;  // raw text / unescaped string contents
    TokenLocation loc;

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }

    std::string debug_string() const {
        return loc.to_string() + " " + token_type_name(type) + " [" + value + "]";
    }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col);
}
