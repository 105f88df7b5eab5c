#pragma once
#include <string>

#include "ast.hpp"

// Text form of a value, readable back by the parser except for closures and nil.
//   integers   42, -7
//   booleans   #t, #f
//   lists      (a b c), ()   and (quote x) as 'x
//   closures   <closure/N>   N = parameter count
//   nil        nil
std::string unparse(const Value& v);
