#include "printer.hpp"

#include <sstream>

#include "evaluator.hpp"

static void write_value(std::ostringstream& ss, const Value& v) {
    if (is_nil(v)) {
        ss << "nil";
    } else if (is_integer(v)) {
        ss << std::get<Integer>(v);
    } else if (is_boolean(v)) {
        ss << (std::get<bool>(v) ? "#t" : "#f");
    } else if (is_symbol(v)) {
        ss << std::get<Symbol>(v).name;
    } else if (is_closure(v)) {
        const ClosurePtr& fn = std::get<ClosurePtr>(v);
        ss << "<closure/" << (fn ? fn->arity() : 0) << ">";
    } else if (is_list(v)) {
        const ListValue& list = as_list(v);
        if (list.size() == 2 && is_symbol(list.elements[0]) &&
            std::get<Symbol>(list.elements[0]).name == "quote") {
            ss << "'";
            write_value(ss, list.elements[1]);
            return;
        }
        ss << "(";
        for (size_t i = 0; i < list.size(); ++i) {
            if (i > 0) ss << " ";
            write_value(ss, list.elements[i]);
        }
        ss << ")";
    } else {
        ss << "<invalid>";
    }
}

std::string unparse(const Value& v) {
    std::ostringstream ss;
    write_value(ss, v);
    return ss.str();
}
