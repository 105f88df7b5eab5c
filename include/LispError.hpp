#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

enum class ErrorKind {
    Arity,           // wrong number of arguments to a form or closure
    Type,            // operand has the wrong shape
    EmptyList,       // head/tail of ()
    UnboundSymbol,   // lookup exhausted the environment chain
    NotCallable,     // applying something that is not a closure
    InvalidAST,      // value matches no evaluable shape
    DivisionByZero,  // `/` or `mod` with a zero divisor
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Arity: return "ArityError";
        case ErrorKind::Type: return "TypeError";
        case ErrorKind::EmptyList: return "EmptyListError";
        case ErrorKind::UnboundSymbol: return "UnboundSymbolError";
        case ErrorKind::NotCallable: return "NotCallableError";
        case ErrorKind::InvalidAST: return "InvalidASTError";
        case ErrorKind::DivisionByZero: return "DivisionByZeroError";
    }
    return "LispError";
}

// Semantic error raised during evaluation. Never caught by the evaluator
// itself; it unwinds to whichever driver called evaluate().
class LispError : public std::runtime_error {
   public:
    LispError(ErrorKind kind,
        const std::string& message,
        const std::string& form = "") : std::runtime_error(format_message(kind, message, form)),
                                        kind_(kind),
                                        message_(message) {}

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }

   private:
    ErrorKind kind_;
    std::string message_;

    static std::string format_message(ErrorKind kind,
        const std::string& message,
        const std::string& form) {
        std::string out = std::string(error_kind_name(kind)) + ": " + message;
        if (!form.empty()) out += "\n --> in: " + form;
        return out;
    }
};

// Malformed source text. Raised by the lexer and parser, distinct from LispError.
// `incomplete` is set when the reader ran out of input, so more text could still fix it.
class ParseError : public std::runtime_error {
   public:
    ParseError(const std::string& message,
        const TokenLocation& loc,
        bool incomplete = false) : std::runtime_error(format_message(message, loc)),
                                   loc_(loc),
                                   incomplete_(incomplete) {}

    const TokenLocation& location() const { return loc_; }
    bool incomplete() const { return incomplete_; }

   private:
    TokenLocation loc_;
    bool incomplete_;

    static std::string format_message(const std::string& message,
        const TokenLocation& loc) {
        return "ParseError at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
    }
};
