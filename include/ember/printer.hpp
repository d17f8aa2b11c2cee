#pragma once
#include <string>
#include "ember/expr.hpp"

namespace ember {

// Debug rendering of a tree. Groupings show up as "( ... )" exactly where the
// source had them; no other parentheses are added, so the output need not
// re-parse to the same tree.
std::string render(const ExprArena& arena, ExprId id);
std::string render(const Ast& ast);

} // namespace ember
