#pragma once

#include <string>

#include "SourceManager.hpp"

// Token types produced by the s-expression lexer
enum class TokenType {
    // -----------------------
    // Structure
    // -----------------------
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    QUOTE,  // ' shorthand for (quote x)

    // -----------------------
    // Literals & identifiers
    // -----------------------
    NUMBER,
    BOOLEAN,  // #t / #f
    SYMBOL,

    // -----------------------
    // Miscellaneous
    // -----------------------
    EOF_TOKEN
};

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<repl>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in characters

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(mgr) {}

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location
struct Token {
    TokenType type = TokenType::EOF_TOKEN;
    std::string value;  // raw lexeme
    TokenLocation loc;

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
    int length() const { return loc.length; }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col);
}
