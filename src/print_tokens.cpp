#include <iostream>
#include <string>
#include <unordered_map>

#include "print_debug.hpp"

std::string token_name(TokenType t) {
    static const std::unordered_map<TokenType, std::string> names = {
        {TokenType::OPENPARENTHESIS, "OPENPARENTHESIS"}, {TokenType::CLOSEPARENTHESIS, "CLOSEPARENTHESIS"},
        {TokenType::QUOTE, "QUOTE"}, {TokenType::NUMBER, "NUMBER"}, {TokenType::BOOLEAN, "BOOLEAN"},
        {TokenType::SYMBOL, "SYMBOL"}, {TokenType::EOF_TOKEN, "EOF_TOKEN"}};
    auto it = names.find(t);
    if (it != names.end()) return it->second;
    return "TOKEN(?)";
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& os) {
    os << "---- TOKEN DUMP (" << tokens.size() << " tokens) ----\n";
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];
        os << i << ": " << token_name(tok.type)
           << " value='" << tok.value << "'"
           << " file='" << tok.filename() << "'"
           << " line=" << tok.line() << " col=" << tok.col() << "\n";
    }
    os << "---- END TOKEN DUMP ----\n";
}

void print_tokens(const std::vector<Token>& tokens) {
    print_tokens(tokens, std::cerr);
}
