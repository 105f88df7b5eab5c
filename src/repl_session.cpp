#include <cctype>
#include <vector>

#include "SourceManager.hpp"
#include "colors.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "repl.hpp"

int unclosed_paren_depth(const std::string& s) {
    int depth = 0;
    bool in_comment = false;
    for (char c : s) {
        if (in_comment) {
            if (c == '\n') in_comment = false;
            continue;
        }
        if (c == ';')
            in_comment = true;
        else if (c == '(')
            ++depth;
        else if (c == ')')
            --depth;
    }
    return depth;
}

bool is_blank_or_spaces(const std::string& s) {
    for (unsigned char c : s)
        if (!std::isspace(c)) return false;
    return true;
}

bool is_incomplete_input(const ParseError& e) {
    return e.incomplete();
}

ReplSession::ReplSession(std::ostream& out, std::ostream& err, bool use_color)
    : out(out), err(err), use_color(use_color), eval(out) {
}

bool ReplSession::feed(const std::string& line) {
    buffer += line;
    buffer.push_back('\n');

    if (is_blank_or_spaces(buffer)) {
        buffer.clear();
        return true;
    }

    // keep reading while a list is still open
    if (unclosed_paren_depth(buffer) > 0) {
        return false;
    }

    run_buffer();
    return !pending();
}

void ReplSession::run_buffer() {
    try {
        SourceManager mgr("<repl>", buffer);
        Lexer lexer(buffer, "<repl>", &mgr);
        Parser parser(lexer.tokenize());
        std::vector<Value> forms = parser.parse();
        buffer.clear();

        for (const auto& form : forms) {
            Value v = eval.evaluate(form, eval.global());
            if (!eval.is_void(v)) {
                std::string text = eval.value_to_string(v);
                out << (use_color ? Color::cyan + text + Color::reset : text) << "\n";
            }
        }
    } catch (const ParseError& e) {
        if (is_incomplete_input(e)) {
            return;
        }
        err << Evaluator::cerr_colored(e.what(), use_color) << std::endl;
        buffer.clear();
    } catch (const LispError& e) {
        err << Evaluator::cerr_colored(e.what(), use_color) << std::endl;
        buffer.clear();
    }
}
