// src/evaluator/FunctionCall.cpp
#include <sstream>

#include "evaluator.hpp"
#include "printer.hpp"

Value Evaluator::eval_lambda(const Args& args, const Value& form, const EnvPtr& env) {
    const Value& params = args[0];
    const Value& body = args[1];

    if (!is_list(params)) {
        throw LispError(ErrorKind::Type,
            "lambda expects a parameter list as its first argument, got " + unparse(params),
            unparse(form));
    }

    const ListValue& plist = as_list(params);

    // A lambda without parameters is not deferred: its body runs right away
    // and the result takes the place of the function.
    if (plist.empty()) {
        return evaluate(body, env);
    }

    std::vector<Symbol> names;
    names.reserve(plist.size());
    for (const auto& p : plist.elements) {
        if (!is_symbol(p)) {
            throw LispError(ErrorKind::Type,
                "lambda parameters must be symbols, got " + unparse(p),
                unparse(form));
        }
        names.push_back(std::get<Symbol>(p));
    }

    return ClosurePtr(std::make_shared<const Closure>(std::move(names), body, env));
}

Value Evaluator::apply_closure(ClosurePtr fn, const Args& args, const Value& form, const EnvPtr& caller_env) {
    if (!fn) {
        throw LispError(ErrorKind::NotCallable, "Attempt to call a null function", unparse(form));
    }

    if (fn->arity() != args.size()) {
        std::ostringstream ss;
        ss << fn->arity() << " parameters expected by function, " << args.size() << " passed";
        throw LispError(ErrorKind::Arity, ss.str(), unparse(form));
    }

    // call-by-value, left to right, in the caller's environment
    std::vector<Value> values;
    values.reserve(args.size());
    for (const auto& expr : args) {
        values.push_back(evaluate(expr, caller_env));
    }

    Environment::Bindings bindings;
    for (size_t i = 0; i < fn->params.size(); ++i) {
        // a repeated parameter name keeps the last argument
        bindings[fn->params[i].name] = std::move(values[i]);
    }

    EnvPtr local = fn->env->extend(std::move(bindings));
    return evaluate(fn->body, local);
}
