#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// The reader produces values of this type and the evaluator consumes and
// returns them: in this language the AST and the runtime values are the same
// tree.

using Integer = std::int64_t;

// Opaque name token. Two symbols are the same symbol when their names match.
struct Symbol {
    std::string name;

    bool operator==(const Symbol& other) const { return name == other.name; }
    bool operator!=(const Symbol& other) const { return name != other.name; }
};

// Forward-declare ListValue so Value can hold a pointer to it (avoids recursive-instantiation issues)
struct ListValue;
using ListPtr = std::shared_ptr<const ListValue>;

// Closure is defined in evaluator.hpp next to Environment.
struct Closure;
using ClosurePtr = std::shared_ptr<const Closure>;

// std::monostate is the no-value result of `define` (printed as nil).
using Value = std::variant<
    std::monostate,
    Integer,
    bool,
    Symbol,
    ListPtr,
    ClosurePtr>;

// Lists are immutable once built; evaluation never rewrites them in place.
struct ListValue {
    std::vector<Value> elements;

    ListValue() = default;
    explicit ListValue(std::vector<Value> elems) : elements(std::move(elems)) {}

    size_t size() const { return elements.size(); }
    bool empty() const { return elements.empty(); }
};

// ----------------- construction helpers -----------------

inline Value make_integer(Integer n) { return Value(std::in_place_type<Integer>, n); }
inline Value make_boolean(bool b) { return Value(std::in_place_type<bool>, b); }
inline Value make_symbol(const std::string& name) { return Symbol{name}; }
inline Value make_nil() { return std::monostate{}; }

inline Value make_list(std::vector<Value> elems = {}) {
    return ListPtr(std::make_shared<const ListValue>(std::move(elems)));
}

// ----------------- classification -----------------

inline bool is_nil(const Value& v) { return std::holds_alternative<std::monostate>(v); }
inline bool is_integer(const Value& v) { return std::holds_alternative<Integer>(v); }
inline bool is_boolean(const Value& v) { return std::holds_alternative<bool>(v); }
inline bool is_symbol(const Value& v) { return std::holds_alternative<Symbol>(v); }
inline bool is_closure(const Value& v) { return std::holds_alternative<ClosurePtr>(v); }

inline bool is_list(const Value& v) {
    return std::holds_alternative<ListPtr>(v) && std::get<ListPtr>(v) != nullptr;
}

inline bool is_atom(const Value& v) {
    return is_integer(v) || is_boolean(v) || is_symbol(v);
}

// Caller must have checked is_list(v).
inline const ListValue& as_list(const Value& v) { return *std::get<ListPtr>(v); }

// Structural equality: same alternative, lists compared element-wise,
// closures compared by identity. A boolean never equals an integer.
bool values_equal(const Value& a, const Value& b);
