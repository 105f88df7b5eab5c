#include "ast.hpp"

bool values_equal(const Value& a, const Value& b) {
    if (a.index() != b.index()) return false;

    if (is_nil(a)) return true;
    if (is_integer(a)) return std::get<Integer>(a) == std::get<Integer>(b);
    if (is_boolean(a)) return std::get<bool>(a) == std::get<bool>(b);
    if (is_symbol(a)) return std::get<Symbol>(a) == std::get<Symbol>(b);
    if (is_closure(a)) return std::get<ClosurePtr>(a) == std::get<ClosurePtr>(b);

    const ListPtr& la = std::get<ListPtr>(a);
    const ListPtr& lb = std::get<ListPtr>(b);
    if (la == lb) return true;
    if (!la || !lb) return false;
    if (la->size() != lb->size()) return false;
    for (size_t i = 0; i < la->size(); ++i) {
        if (!values_equal(la->elements[i], lb->elements[i])) return false;
    }
    return true;
}
