#include "lexer.hpp"

#include <cctype>

#include "LispError.hpp"

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename, const SourceManager* mgr)
    : src(source), filename(filename), i(0), line(1), col(1), src_mgr(mgr) {
}

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

bool Lexer::is_delimiter(char c) {
    return c == '\0' || c == '(' || c == ')' || c == '\'' || c == ';' ||
        std::isspace(static_cast<unsigned char>(c));
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col) {
    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, static_cast<int>(value.size()), src_mgr);
    out.emplace_back(type, value, loc);
}

void Lexer::skip_line_comment() {
    while (!eof() && peek() != '\n') advance();
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;
    while (!eof()) {
        scan_token(out);
    }
    add_token(out, TokenType::EOF_TOKEN, "", line, col);
    return out;
}

void Lexer::scan_token(std::vector<Token>& out) {
    char c = peek();
    int tok_line = line;
    int tok_col = col;

    if (std::isspace(static_cast<unsigned char>(c))) {
        advance();
        return;
    }

    switch (c) {
        case ';':
            skip_line_comment();
            return;
        case '(':
            advance();
            add_token(out, TokenType::OPENPARENTHESIS, "(", tok_line, tok_col);
            return;
        case ')':
            advance();
            add_token(out, TokenType::CLOSEPARENTHESIS, ")", tok_line, tok_col);
            return;
        case '\'':
            advance();
            add_token(out, TokenType::QUOTE, "'", tok_line, tok_col);
            return;
        case '#':
            scan_hash(out, tok_line, tok_col);
            return;
        default:
            scan_atom(out, tok_line, tok_col);
            return;
    }
}

// #t and #f are the only hash literals.
void Lexer::scan_hash(std::vector<Token>& out, int tok_line, int tok_col) {
    std::string text;
    while (!is_delimiter(peek())) text.push_back(advance());

    if (text == "#t" || text == "#f") {
        add_token(out, TokenType::BOOLEAN, text, tok_line, tok_col);
        return;
    }
    throw ParseError("Invalid literal '" + text + "' (expected #t or #f)",
        TokenLocation(filename.empty() ? "<repl>" : filename, tok_line, tok_col, static_cast<int>(text.size()), src_mgr));
}

// Integer if it is an optional sign followed by digits, symbol otherwise.
void Lexer::scan_atom(std::vector<Token>& out, int tok_line, int tok_col) {
    std::string text;
    while (!is_delimiter(peek())) text.push_back(advance());
    if (text.empty()) {
        advance();
        throw ParseError("Unexpected character in input",
            TokenLocation(filename.empty() ? "<repl>" : filename, tok_line, tok_col, 1, src_mgr));
    }

    size_t start = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    bool numeric = text.size() > start;
    for (size_t k = start; k < text.size() && numeric; ++k) {
        if (!std::isdigit(static_cast<unsigned char>(text[k]))) numeric = false;
    }

    add_token(out, numeric ? TokenType::NUMBER : TokenType::SYMBOL, text, tok_line, tok_col);
}
