#pragma once

#include <iostream>
#include <string>

#include "LispError.hpp"
#include "evaluator.hpp"

void run_repl_mode();

// Count of '(' not yet closed, ignoring comments. Negative when there are more ')'.
int unclosed_paren_depth(const std::string& s);

bool is_blank_or_spaces(const std::string& s);

// True when reading failed only because the input ended early, so another line may complete it.
bool is_incomplete_input(const ParseError& e);

// Line-by-line REPL state: input is accumulated until every '(' has been
// closed, then read as a sequence of forms and each one is evaluated in the
// session's root environment. Errors discard the current input only;
// bindings made before the error stay.
class ReplSession {
   public:
    ReplSession(std::ostream& out, std::ostream& err, bool use_color = false);

    // Returns true when the line completed the pending input (evaluated or
    // reported as an error), false when more lines are needed.
    bool feed(const std::string& line);

    bool pending() const { return !buffer.empty(); }
    Evaluator& evaluator() { return eval; }

   private:
    std::string buffer;
    std::ostream& out;
    std::ostream& err;
    bool use_color;
    Evaluator eval;

    void run_buffer();
};
