#pragma once

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "LispError.hpp"
#include "ast.hpp"

// Forward declaration
class Environment;

// Environment
using EnvPtr = std::shared_ptr<Environment>;

// A function value: formal parameters, the unevaluated body and the
// environment that was current when the lambda form ran. The environment is
// shared, never copied, so later `define`s in it are visible to the body.
struct Closure {
    std::vector<Symbol> params;
    Value body;
    EnvPtr env;

    Closure(std::vector<Symbol> p, Value b, EnvPtr e)
        : params(std::move(p)), body(std::move(b)), env(std::move(e)) {}

    size_t arity() const { return params.size(); }
};

class Environment : public std::enable_shared_from_this<Environment> {
   public:
    using Bindings = std::unordered_map<std::string, Value>;

    explicit Environment(EnvPtr parent = nullptr, Bindings bindings = {})
        : values(std::move(bindings)), parent(std::move(parent)) {
    }

    // check if name exists in this environment or any parent
    bool has(const std::string& name) const;

    // searches up the chain. Throws UnboundSymbolError if not found.
    const Value& lookup(const Symbol& sym) const;

    // set variable in the current environment (creates or replaces); parents are untouched
    void set(const Symbol& sym, const Value& value);

    // new child environment whose local bindings are exactly `bindings`
    EnvPtr extend(Bindings bindings);

    // local bindings only
    const Bindings& bindings() const { return values; }
    const EnvPtr& parent_env() const { return parent; }

   private:
    // map from name -> value
    Bindings values;
    const EnvPtr parent;
};

// ----------------- command dispatch -----------------

enum class Command {
    // special forms
    Quote,
    Atom,
    Eq,
    If,
    Define,
    Lambda,
    Print,
    // arithmetic
    Add,
    Subtract,
    Multiply,
    Divide,
    Mod,
    Greater,
    Less,
    // list operators
    Cons,
    Head,
    Tail,
    Empty,
};

enum class CommandFamily {
    SpecialForm,
    Arithmetic,
    ListOp,
};

// Fixed table of recognized leading symbols. Anything else falls through to
// closure application.
std::optional<Command> lookup_command(const std::string& name);
CommandFamily command_family(Command cmd);
const char* command_name(Command cmd);
// Number of arguments the command requires.
size_t command_arity(Command cmd);

// Non-owning view over the argument expressions of a form (the list minus its head).
class Args {
   public:
    Args(const std::vector<Value>& elems, size_t offset)
        : first_(elems.data() + offset), count_(elems.size() > offset ? elems.size() - offset : 0) {}

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    const Value& operator[](size_t i) const { return first_[i]; }
    const Value* begin() const { return first_; }
    const Value* end() const { return first_ + count_; }

   private:
    const Value* first_;
    size_t count_;
};

class Evaluator {
   public:
    // `out` receives the output of the print form.
    explicit Evaluator(std::ostream& out = std::cout);

    // Evaluate one AST in the given environment.
    Value evaluate(const Value& ast, const EnvPtr& env);

    // Evaluate each top-level form in order in the root environment; returns the last result.
    Value evaluate_program(const std::vector<Value>& forms);

    EnvPtr global() const { return global_env; }

    std::string value_to_string(const Value& v);
    bool is_void(const Value& v);
    // "Error: " label plus message, in ANSI colors when `use_color` is set.
    static std::string cerr_colored(const std::string& s, bool use_color);

    // #f, 0, () and nil are false; everything else is true
    static bool to_bool(const Value& v);

   private:
    EnvPtr global_env;
    std::ostream& out;

    Value evaluate_list(const Value& form, const EnvPtr& env);
    Value evaluate_command(Command cmd, const Value& form, const EnvPtr& env);

    // special forms (Commands.cpp)
    Value eval_quote(const Args& args);
    Value eval_atom(const Args& args, const EnvPtr& env);
    Value eval_eq(const Args& args, const EnvPtr& env);
    Value eval_if(const Args& args, const EnvPtr& env);
    Value eval_define(const Args& args, const Value& form, const EnvPtr& env);
    Value eval_print(const Args& args, const EnvPtr& env);

    // functions (FunctionCall.cpp)
    Value eval_lambda(const Args& args, const Value& form, const EnvPtr& env);
    Value apply_closure(ClosurePtr fn, const Args& args, const Value& form, const EnvPtr& caller_env);

    // primitives (EvaluatorHelper.cpp)
    Value eval_arithmetic(Command cmd, const Args& args, const Value& form, const EnvPtr& env);
    Value eval_list_op(Command cmd, const Args& args, const Value& form, const EnvPtr& env);
    Integer to_integer(const Value& v, Command cmd, const Value& form);
    const ListValue& to_list(const Value& v, Command cmd, const Value& form);
};
