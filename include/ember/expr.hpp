#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include <ember/token.hpp>

namespace ember {

/// Handle of a node inside an ExprArena.
using ExprId = std::uint32_t;

struct Literal {
    Value value;
};

// Kept as its own node so "(a)" and "a" stay distinguishable.
struct Grouping {
    ExprId expression;
};

struct Unary {
    Token op; // '-' or '!'
    ExprId expression;
};

struct Binary {
    ExprId left;
    Token op;
    ExprId right;
};

// cond ? then : else
struct Condition {
    ExprId expression;
    ExprId then_expression;
    ExprId else_expression;
};

using ExprNode = std::variant<Literal, Grouping, Unary, Binary, Condition>;

struct Expr {
    ExprNode node;

    template <class T>
    bool is() const { return std::holds_alternative<T>(node); }

    template <class T>
    const T& as() const { return std::get<T>(node); }
};

/// Node pool for one parse. Every node of a tree lives here and is released
/// together with the arena; children are referenced by handle, each handle by
/// exactly one parent.
class ExprArena {
public:
    ExprId add(ExprNode node);

    const Expr& at(ExprId id) const;

    std::size_t size() const noexcept { return nodes_.size(); }
    bool empty() const noexcept { return nodes_.empty(); }
    void clear() noexcept { nodes_.clear(); }

private:
    std::vector<Expr> nodes_;
};

class Parser;

/// A successfully parsed expression together with the arena that owns it.
/// Only Parser creates one, so root() always names a node of arena().
class Ast {
public:
    const ExprArena& arena() const noexcept { return arena_; }
    ExprId root() const noexcept { return root_; }
    const Expr& root_expr() const { return arena_.at(root_); }

private:
    friend class Parser;
    Ast(ExprArena arena, ExprId root) : arena_(std::move(arena)), root_(root) {}

    ExprArena arena_;
    ExprId root_;
};

} // namespace ember
