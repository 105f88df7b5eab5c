#pragma once
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

class Parser {
   public:
    Parser(const std::vector<Token>& tokens);

    // every top-level expression, in order
    std::vector<Value> parse();

    // exactly one expression; trailing input is an error
    Value parse_one();

   private:
    std::vector<Token> tokens;
    size_t position = 0;

    const Token& peek() const;
    Token consume();
    void expect(TokenType t, const std::string& errMsg);

    Value parse_expression();
    Value parse_list(const Token& open);
    Value parse_quote(const Token& quote);
    Value parse_number(const Token& tok);
};

// Convenience entry points: lex and parse source text in one step.
Value parse(const std::string& source, const std::string& filename = "<input>");
std::vector<Value> parse_all(const std::string& source, const std::string& filename = "<input>");
