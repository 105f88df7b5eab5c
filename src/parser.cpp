#include "parser.hpp"

#include <stdexcept>

#include "LispError.hpp"
#include "SourceManager.hpp"
#include "lexer.hpp"

Parser::Parser(const std::vector<Token>& tokens) : tokens(tokens) {
    if (this->tokens.empty() || this->tokens.back().type != TokenType::EOF_TOKEN) {
        TokenLocation loc = this->tokens.empty() ? TokenLocation("<eof>", 0, 0, 0) : this->tokens.back().loc;
        this->tokens.emplace_back(TokenType::EOF_TOKEN, "", loc);
    }
}

// Current token; the stream always ends with EOF_TOKEN
const Token& Parser::peek() const {
    return position < tokens.size() ? tokens[position] : tokens.back();
}

Token Parser::consume() {
    Token tok = peek();
    if (position < tokens.size() - 1) position++;
    return tok;
}

void Parser::expect(TokenType t, const std::string& errMsg) {
    if (peek().type != t) {
        throw ParseError(errMsg, peek().loc, peek().type == TokenType::EOF_TOKEN);
    }
    consume();
}

// ---------- parse entry ----------
std::vector<Value> Parser::parse() {
    std::vector<Value> program;
    while (peek().type != TokenType::EOF_TOKEN) {
        program.push_back(parse_expression());
    }
    return program;
}

Value Parser::parse_one() {
    Value v = parse_expression();
    expect(TokenType::EOF_TOKEN, "Expected EOF after expression, found '" + peek().value + "'");
    return v;
}

Value Parser::parse_expression() {
    Token tok = consume();
    switch (tok.type) {
        case TokenType::OPENPARENTHESIS:
            return parse_list(tok);
        case TokenType::QUOTE:
            return parse_quote(tok);
        case TokenType::NUMBER:
            return parse_number(tok);
        case TokenType::BOOLEAN:
            return make_boolean(tok.value == "#t");
        case TokenType::SYMBOL:
            return make_symbol(tok.value);
        case TokenType::CLOSEPARENTHESIS:
            throw ParseError("Unexpected ')'", tok.loc);
        case TokenType::EOF_TOKEN:
            throw ParseError("Unexpected end of input, expected an expression", tok.loc, true);
    }
    throw ParseError("Unexpected token '" + tok.value + "'", tok.loc);
}

Value Parser::parse_list(const Token& open) {
    std::vector<Value> elems;
    while (peek().type != TokenType::CLOSEPARENTHESIS) {
        if (peek().type == TokenType::EOF_TOKEN) {
            throw ParseError("Expected ')' to close list opened at " + open.loc.to_string(), peek().loc, true);
        }
        elems.push_back(parse_expression());
    }
    consume();  // ')'
    return make_list(std::move(elems));
}

// 'x reads as (quote x)
Value Parser::parse_quote(const Token& quote) {
    if (peek().type == TokenType::EOF_TOKEN) {
        throw ParseError("Expected expression after quote", quote.loc, true);
    }
    if (peek().type == TokenType::CLOSEPARENTHESIS) {
        throw ParseError("Unexpected ')' after quote", peek().loc);
    }
    Value quoted = parse_expression();
    return make_list({make_symbol("quote"), quoted});
}

Value Parser::parse_number(const Token& tok) {
    try {
        size_t idx = 0;
        long long n = std::stoll(tok.value, &idx, 10);
        if (idx != tok.value.size()) {
            throw ParseError("Invalid integer literal '" + tok.value + "'", tok.loc);
        }
        return make_integer(static_cast<Integer>(n));
    } catch (const std::out_of_range&) {
        throw ParseError("Integer literal '" + tok.value + "' is out of range", tok.loc);
    } catch (const std::invalid_argument&) {
        throw ParseError("Invalid integer literal '" + tok.value + "'", tok.loc);
    }
}

// ---------- convenience ----------

std::vector<Value> parse_all(const std::string& source, const std::string& filename) {
    SourceManager mgr(filename, source);
    Lexer lexer(source, filename, &mgr);
    Parser parser(lexer.tokenize());
    return parser.parse();
}

Value parse(const std::string& source, const std::string& filename) {
    SourceManager mgr(filename, source);
    Lexer lexer(source, filename, &mgr);
    Parser parser(lexer.tokenize());
    return parser.parse_one();
}
