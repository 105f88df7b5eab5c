// src/evaluator/Commands.cpp
// Special forms. Arity has already been checked by evaluate_command.
#include "evaluator.hpp"
#include "printer.hpp"

Value Evaluator::eval_quote(const Args& args) {
    return args[0];
}

Value Evaluator::eval_atom(const Args& args, const EnvPtr& env) {
    return make_boolean(is_atom(evaluate(args[0], env)));
}

Value Evaluator::eval_eq(const Args& args, const EnvPtr& env) {
    Value left = evaluate(args[0], env);
    Value right = evaluate(args[1], env);
    return make_boolean(values_equal(left, right));
}

Value Evaluator::eval_if(const Args& args, const EnvPtr& env) {
    Value predicate = evaluate(args[0], env);
    if (to_bool(predicate)) {
        return evaluate(args[1], env);
    }
    return evaluate(args[2], env);
}

Value Evaluator::eval_define(const Args& args, const Value& form, const EnvPtr& env) {
    if (!is_symbol(args[0])) {
        throw LispError(ErrorKind::Type,
            "define expects a symbol as its first argument, got " + unparse(args[0]),
            unparse(form));
    }

    Value value = evaluate(args[1], env);
    env->set(std::get<Symbol>(args[0]), value);
    return make_nil();
}

Value Evaluator::eval_print(const Args& args, const EnvPtr& env) {
    Value v = evaluate(args[0], env);
    out << unparse(v) << std::endl;
    return v;
}
