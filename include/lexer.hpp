#pragma once

#include <string>
#include <vector>

#include "SourceManager.hpp"
#include "token.hpp"

class Lexer {
   public:
    Lexer(const std::string& source, const std::string& filename = "", const SourceManager* mgr = nullptr);
    std::vector<Token> tokenize();

   private:
    const std::string src;
    const std::string filename;
    size_t i = 0;
    int line = 1;
    int col = 1;

    const SourceManager* src_mgr;

    // helpers
    bool eof() const;
    char peek(size_t offset = 0) const;
    char advance();
    static bool is_delimiter(char c);

    void add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col);

    void scan_token(std::vector<Token>& out);
    void scan_hash(std::vector<Token>& out, int tok_line, int tok_col);
    void scan_atom(std::vector<Token>& out, int tok_line, int tok_col);

    void skip_line_comment();
};
