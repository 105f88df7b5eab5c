//src/evaluator/Environment.cpp
#include "evaluator.hpp"

// ----------------- Environment methods -----------------

bool Environment::has(const std::string& name) const {
    auto it = values.find(name);
    if (it != values.end()) return true;
    if (parent) return parent->has(name);
    return false;
}

const Value& Environment::lookup(const Symbol& sym) const {
    const Environment* env = this;
    while (env) {
        auto it = env->values.find(sym.name);
        if (it != env->values.end()) return it->second;
        env = env->parent.get();
    }
    throw LispError(ErrorKind::UnboundSymbol, "Symbol '" + sym.name + "' is not defined");
}

void Environment::set(const Symbol& sym, const Value& value) {
    // Always binds in this environment, even when a parent already has the name.
    values[sym.name] = value;
}

EnvPtr Environment::extend(Bindings bindings) {
    return std::make_shared<Environment>(shared_from_this(), std::move(bindings));
}
