#pragma once
#include <iosfwd>
#include <string>
#include <vector>

#include "token.hpp"

std::string token_name(TokenType t);

void print_tokens(const std::vector<Token>& tokens, std::ostream& os);
void print_tokens(const std::vector<Token>& tokens);
