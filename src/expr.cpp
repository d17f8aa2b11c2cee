#include <ember/expr.hpp>

#include <limits>
#include <string>
#include <utility>

namespace ember {

ExprId ExprArena::add(ExprNode node) {
    if (nodes_.size() >= std::numeric_limits<ExprId>::max())
        throw std::length_error("Expression arena is full");
    nodes_.push_back(Expr{std::move(node)});
    return static_cast<ExprId>(nodes_.size() - 1);
}

const Expr& ExprArena::at(ExprId id) const {
    if (id >= nodes_.size())
        throw std::out_of_range("Bad expression handle " + std::to_string(id));
    return nodes_[id];
}

} // namespace ember
