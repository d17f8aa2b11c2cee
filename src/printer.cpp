#include "ember/printer.hpp"
#include <fmt/format.h>

namespace ember {

namespace {

class Printer {
public:
    explicit Printer(const ExprArena& arena) : arena_(arena) {}

    std::string print(ExprId id) const {
        return std::visit(*this, arena_.at(id).node);
    }

    std::string operator()(const Literal& e) const {
        return to_string(e.value);
    }
    std::string operator()(const Grouping& e) const {
        return fmt::format("( {} )", print(e.expression));
    }
    std::string operator()(const Unary& e) const {
        return e.op.lexeme + print(e.expression);
    }
    std::string operator()(const Binary& e) const {
        return fmt::format("{} {} {}", print(e.left), e.op.lexeme, print(e.right));
    }
    std::string operator()(const Condition& e) const {
        return fmt::format("{} ? {} : {}", print(e.expression), print(e.then_expression), print(e.else_expression));
    }

private:
    const ExprArena& arena_;
};

} // namespace

std::string render(const ExprArena& arena, ExprId id) {
    return Printer(arena).print(id);
}

std::string render(const Ast& ast) {
    return render(ast.arena(), ast.root());
}

} // namespace ember
