// src/evaluator/EvaluatorHelper.cpp
#include <cstdint>
#include <limits>

#include "colors.hpp"
#include "evaluator.hpp"
#include "printer.hpp"

namespace {

// Two's-complement wraparound without signed overflow.
Integer wrapping(std::uint64_t bits) {
    return static_cast<Integer>(bits);
}

}  // namespace

std::string Evaluator::value_to_string(const Value& v) {
    return unparse(v);
}

bool Evaluator::is_void(const Value& v) {
    return is_nil(v);
}

std::string Evaluator::cerr_colored(const std::string& s, bool use_color) {
    std::string err_str = use_color ? (Color::bright_red + "Error: " + Color::reset) : "Error: ";
    std::string ss = use_color ? (Color::bright_black + s + Color::reset) : s;
    return err_str + ss;
}

bool Evaluator::to_bool(const Value& v) {
    if (is_boolean(v)) return std::get<bool>(v);
    if (is_integer(v)) return std::get<Integer>(v) != 0;
    if (is_nil(v)) return false;
    if (is_list(v)) return !as_list(v).empty();
    return true;  // symbols and closures
}

Integer Evaluator::to_integer(const Value& v, Command cmd, const Value& form) {
    if (is_integer(v)) {
        return std::get<Integer>(v);
    }
    throw LispError(ErrorKind::Type,
        std::string(command_name(cmd)) + " expects integer operands, got " + unparse(v),
        unparse(form));
}

const ListValue& Evaluator::to_list(const Value& v, Command cmd, const Value& form) {
    if (is_list(v)) {
        return as_list(v);
    }
    std::string what = cmd == Command::Cons ? " expects a list as its second argument, got "
                                            : " expects a list as argument, got ";
    throw LispError(ErrorKind::Type, command_name(cmd) + what + unparse(v), unparse(form));
}

// ----------------- arithmetic -----------------

Value Evaluator::eval_arithmetic(Command cmd, const Args& args, const Value& form, const EnvPtr& env) {
    Integer x = to_integer(evaluate(args[0], env), cmd, form);
    Integer y = to_integer(evaluate(args[1], env), cmd, form);

    auto ux = static_cast<std::uint64_t>(x);
    auto uy = static_cast<std::uint64_t>(y);

    switch (cmd) {
        case Command::Add:
            return make_integer(wrapping(ux + uy));
        case Command::Subtract:
            return make_integer(wrapping(ux - uy));
        case Command::Multiply:
            return make_integer(wrapping(ux * uy));
        case Command::Divide:
        case Command::Mod: {
            if (y == 0) {
                throw LispError(ErrorKind::DivisionByZero,
                    std::string(command_name(cmd)) + " by zero",
                    unparse(form));
            }
            // the one quotient that does not fit: INT64_MIN / -1
            if (x == std::numeric_limits<Integer>::min() && y == -1) {
                return make_integer(cmd == Command::Divide ? x : 0);
            }
            return make_integer(cmd == Command::Divide ? x / y : x % y);
        }
        case Command::Greater:
            return make_boolean(x > y);
        case Command::Less:
            return make_boolean(x < y);
        default:
            break;
    }

    throw LispError(ErrorKind::InvalidAST, std::string("Invalid arithmetic command ") + command_name(cmd), unparse(form));
}

// ----------------- list operators -----------------

Value Evaluator::eval_list_op(Command cmd, const Args& args, const Value& form, const EnvPtr& env) {
    if (cmd == Command::Cons) {
        Value head = evaluate(args[0], env);
        Value rest = evaluate(args[1], env);
        const ListValue& tail = to_list(rest, cmd, form);

        std::vector<Value> elems;
        elems.reserve(tail.size() + 1);
        elems.push_back(std::move(head));
        elems.insert(elems.end(), tail.elements.begin(), tail.elements.end());
        return make_list(std::move(elems));
    }

    Value arg = evaluate(args[0], env);
    const ListValue& list = to_list(arg, cmd, form);

    switch (cmd) {
        case Command::Empty:
            return make_boolean(list.empty());
        case Command::Head:
        case Command::Tail:
            if (list.empty()) {
                throw LispError(ErrorKind::EmptyList,
                    std::string(command_name(cmd)) + " expects a non-empty list",
                    unparse(form));
            }
            if (cmd == Command::Head) {
                return list.elements.front();
            }
            return make_list(std::vector<Value>(list.elements.begin() + 1, list.elements.end()));
        default:
            break;
    }

    throw LispError(ErrorKind::InvalidAST, std::string("Invalid list command ") + command_name(cmd), unparse(form));
}
