// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include <array>
#include <sstream>

#include "printer.hpp"

Evaluator::Evaluator(std::ostream& out) : global_env(std::make_shared<Environment>(nullptr)), out(out) {
}

// ----------------- Command table -----------------

namespace {

struct CommandEntry {
    const char* name;
    Command cmd;
    CommandFamily family;
    size_t arity;
};

constexpr std::array<CommandEntry, static_cast<size_t>(Command::Empty) + 1> kCommands = {{
    {"quote", Command::Quote, CommandFamily::SpecialForm, 1},
    {"atom", Command::Atom, CommandFamily::SpecialForm, 1},
    {"eq", Command::Eq, CommandFamily::SpecialForm, 2},
    {"if", Command::If, CommandFamily::SpecialForm, 3},
    {"define", Command::Define, CommandFamily::SpecialForm, 2},
    {"lambda", Command::Lambda, CommandFamily::SpecialForm, 2},
    {"print", Command::Print, CommandFamily::SpecialForm, 1},
    {"+", Command::Add, CommandFamily::Arithmetic, 2},
    {"-", Command::Subtract, CommandFamily::Arithmetic, 2},
    {"*", Command::Multiply, CommandFamily::Arithmetic, 2},
    {"/", Command::Divide, CommandFamily::Arithmetic, 2},
    {"mod", Command::Mod, CommandFamily::Arithmetic, 2},
    {">", Command::Greater, CommandFamily::Arithmetic, 2},
    {"<", Command::Less, CommandFamily::Arithmetic, 2},
    {"cons", Command::Cons, CommandFamily::ListOp, 2},
    {"head", Command::Head, CommandFamily::ListOp, 1},
    {"tail", Command::Tail, CommandFamily::ListOp, 1},
    {"empty", Command::Empty, CommandFamily::ListOp, 1},
}};

// entry_for indexes the table by enum value
constexpr bool table_in_enum_order() {
    for (size_t i = 0; i < kCommands.size(); ++i) {
        if (static_cast<size_t>(kCommands[i].cmd) != i) return false;
    }
    return true;
}
static_assert(table_in_enum_order(), "kCommands must list every Command in enum order");

const CommandEntry& entry_for(Command cmd) {
    return kCommands[static_cast<size_t>(cmd)];
}

}  // namespace

std::optional<Command> lookup_command(const std::string& name) {
    static const std::unordered_map<std::string, Command> index = [] {
        std::unordered_map<std::string, Command> m;
        for (const auto& e : kCommands) m.emplace(e.name, e.cmd);
        return m;
    }();
    auto it = index.find(name);
    if (it == index.end()) return std::nullopt;
    return it->second;
}

CommandFamily command_family(Command cmd) { return entry_for(cmd).family; }
const char* command_name(Command cmd) { return entry_for(cmd).name; }
size_t command_arity(Command cmd) { return entry_for(cmd).arity; }

// ----------------- Program evaluation -----------------

Value Evaluator::evaluate_program(const std::vector<Value>& forms) {
    Value last = make_nil();
    for (const auto& form : forms) {
        last = evaluate(form, global_env);
    }
    return last;
}

Value Evaluator::evaluate(const Value& ast, const EnvPtr& env) {
    if (is_symbol(ast)) {
        return env->lookup(std::get<Symbol>(ast));
    }
    if (is_boolean(ast) || is_integer(ast)) {
        return ast;
    }
    if (is_closure(ast)) {
        // A bare closure is a call with no arguments.
        static const std::vector<Value> no_args;
        return apply_closure(std::get<ClosurePtr>(ast), Args(no_args, 0), ast, env);
    }
    if (is_list(ast) && !as_list(ast).empty()) {
        return evaluate_list(ast, env);
    }

    throw LispError(ErrorKind::InvalidAST, "Cannot evaluate " + unparse(ast));
}

Value Evaluator::evaluate_list(const Value& form, const EnvPtr& env) {
    const std::vector<Value>& elems = as_list(form).elements;
    const Value& first = elems.front();
    Args rest(elems, 1);

    if (is_symbol(first)) {
        const Symbol& sym = std::get<Symbol>(first);
        if (auto cmd = lookup_command(sym.name)) {
            return evaluate_command(*cmd, form, env);
        }

        // A non-keyword head names a function; apply what it resolves to
        // directly instead of rewriting the form.
        Value fn = env->lookup(sym);
        if (!is_closure(fn)) {
            throw LispError(ErrorKind::NotCallable,
                "Symbol '" + sym.name + "' must evaluate to a function, got " + unparse(fn),
                unparse(form));
        }
        return apply_closure(std::get<ClosurePtr>(fn), rest, form, env);
    }

    if (is_closure(first)) {
        return apply_closure(std::get<ClosurePtr>(first), rest, form, env);
    }

    Value head = evaluate(first, env);
    if (is_closure(head)) {
        return apply_closure(std::get<ClosurePtr>(head), rest, form, env);
    }

    // Not callable: the head was evaluated for effect only. With nothing
    // after it its value is the result; otherwise the remaining forms are
    // evaluated as a list of their own, which is what makes
    // ((define ...) (print ...)) run as a sequence. Do not extend this rule.
    if (rest.empty()) {
        return head;
    }
    return evaluate(make_list(std::vector<Value>(rest.begin(), rest.end())), env);
}

Value Evaluator::evaluate_command(Command cmd, const Value& form, const EnvPtr& env) {
    Args args(as_list(form).elements, 1);

    size_t expected = command_arity(cmd);
    if (args.size() != expected) {
        std::ostringstream ss;
        ss << command_name(cmd) << " expects exactly " << expected
           << (expected == 1 ? " argument" : " arguments") << ", got " << args.size();
        throw LispError(ErrorKind::Arity, ss.str(), unparse(form));
    }

    switch (command_family(cmd)) {
        case CommandFamily::Arithmetic:
            return eval_arithmetic(cmd, args, form, env);
        case CommandFamily::ListOp:
            return eval_list_op(cmd, args, form, env);
        case CommandFamily::SpecialForm:
            break;
    }

    switch (cmd) {
        case Command::Quote: return eval_quote(args);
        case Command::Atom: return eval_atom(args, env);
        case Command::Eq: return eval_eq(args, env);
        case Command::If: return eval_if(args, env);
        case Command::Define: return eval_define(args, form, env);
        case Command::Lambda: return eval_lambda(args, form, env);
        case Command::Print: return eval_print(args, env);
        default: break;
    }

    throw LispError(ErrorKind::InvalidAST, std::string("Unhandled command ") + command_name(cmd), unparse(form));
}
