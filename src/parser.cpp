#include "ember/parser.hpp"
#include <string>
#include <utility>
#include <fmt/format.h>

namespace ember {

static std::string describe(const Token& t) {
    if (t.kind == TokKind::Eof) return "end of input";
    return fmt::format("{} '{}'", kind_name(t.kind), escape(t.lexeme));
}

static std::string error_message(ParseErrorKind kind, const Token& found, TokKind expected) {
    switch (kind) {
        case ParseErrorKind::UnexpectedToken:
            return fmt::format("Expected {} but found {}.", kind_name(expected), describe(found));
        case ParseErrorKind::ExpectedExpression:
            return fmt::format("Expected expression but found {}.", describe(found));
        case ParseErrorKind::TooDeep:
            return fmt::format("Expression nested deeper than {} levels at {}.", Parser::kMaxNesting, describe(found));
    }
    return "Parse error.";
}

ParseError::ParseError(ParseErrorKind kind, Token found, TokKind expected)
    : std::runtime_error(error_message(kind, found, expected)),
      kind_(kind),
      found_(std::move(found)),
      expected_(expected) {}

namespace {

// Counts one level of recursive descent for as long as it lives.
class NestingGuard {
public:
    NestingGuard(std::size_t& depth, const Token& at) : depth_(depth) {
        if (depth_ >= Parser::kMaxNesting) throw ParseError(ParseErrorKind::TooDeep, at);
        ++depth_;
    }
    ~NestingGuard() { --depth_; }

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

private:
    std::size_t& depth_;
};

} // namespace

Parser::Parser(const std::vector<Token>& tokens) {
    tokens_.reserve(tokens.size() + 1);
    for (const auto& t : tokens) {
        if (t.kind == TokKind::Comment) continue;
        tokens_.push_back(t);
        if (t.kind == TokKind::Eof) break;
    }
    if (tokens_.empty() || tokens_.back().kind != TokKind::Eof) {
        Token eof{TokKind::Eof};
        if (!tokens_.empty()) {
            eof.line = tokens_.back().line;
            eof.column = tokens_.back().column + static_cast<int>(tokens_.back().lexeme.size());
        }
        tokens_.push_back(std::move(eof));
    }
}

Ast Parser::parse() {
    current_ = 0;
    depth_ = 0;
    arena_.clear();

    ExprId root = expression();
    consume(TokKind::Eof);

    Ast ast(std::move(arena_), root);
    arena_ = ExprArena{};
    return ast;
}

void Parser::synchronize() {
    advance();

    while (!is_end()) {
        if (previous().kind == TokKind::Semicolon) return;

        switch (peek().kind) {
            case TokKind::Class:
            case TokKind::For:
            case TokKind::Fn:
            case TokKind::If:
            case TokKind::Print:
            case TokKind::Return:
            case TokKind::Var:
            case TokKind::While:
                return;
            default:
                break;
        }
        advance();
    }
}

// Eof is never stepped over, so peek() stays in range.
const Token& Parser::advance() {
    if (is_end()) return peek();
    ++current_;
    return previous();
}

bool Parser::match(std::initializer_list<TokKind> kinds) {
    for (TokKind k : kinds) {
        if (check(k)) {
            advance();
            return true;
        }
    }
    return false;
}

const Token& Parser::consume(TokKind kind) {
    if (check(kind)) return advance();
    throw ParseError(ParseErrorKind::UnexpectedToken, peek(), kind);
}

ExprId Parser::expression() {
    return comma();
}

// Loosest binder: "a, b ? c : d" is (a, (b ? c : d)).
ExprId Parser::comma() {
    ExprId left = ternary();
    while (match({TokKind::Comma})) {
        Token op = previous();
        ExprId right = ternary();
        left = arena_.add(Binary{left, std::move(op), right});
    }
    return left;
}

// The then-branch takes a full expression, the else-branch recurses into
// ternary, which makes "a ? b : c ? d : e" group as a ? b : (c ? d : e).
ExprId Parser::ternary() {
    ExprId cond = equality();
    if (match({TokKind::Question})) {
        NestingGuard guard(depth_, previous());
        ExprId then_expr = expression();
        consume(TokKind::Colon);
        ExprId else_expr = ternary();
        return arena_.add(Condition{cond, then_expr, else_expr});
    }
    return cond;
}

ExprId Parser::equality() {
    ExprId left = comparison();
    while (match({TokKind::EqualEqual, TokKind::BangEqual})) {
        Token op = previous();
        ExprId right = comparison();
        left = arena_.add(Binary{left, std::move(op), right});
    }
    return left;
}

ExprId Parser::comparison() {
    ExprId left = term();
    while (match({TokKind::Greater, TokKind::GreaterEqual, TokKind::Less, TokKind::LessEqual})) {
        Token op = previous();
        ExprId right = term();
        left = arena_.add(Binary{left, std::move(op), right});
    }
    return left;
}

ExprId Parser::term() {
    ExprId left = factor();
    while (match({TokKind::Plus, TokKind::Minus})) {
        Token op = previous();
        ExprId right = factor();
        left = arena_.add(Binary{left, std::move(op), right});
    }
    return left;
}

ExprId Parser::factor() {
    ExprId left = unary();
    while (match({TokKind::Star, TokKind::Slash})) {
        Token op = previous();
        ExprId right = unary();
        left = arena_.add(Binary{left, std::move(op), right});
    }
    return left;
}

ExprId Parser::unary() {
    if (match({TokKind::Minus, TokKind::Bang})) {
        Token op = previous();
        NestingGuard guard(depth_, op);
        ExprId operand = unary();
        return arena_.add(Unary{std::move(op), operand});
    }
    return primary();
}

ExprId Parser::primary() {
    if (match({TokKind::Number, TokKind::String, TokKind::True, TokKind::False, TokKind::Nil})) {
        // literal values were attached by the lexer
        return arena_.add(Literal{previous().literal});
    }

    if (match({TokKind::LeftParen})) {
        NestingGuard guard(depth_, previous());
        ExprId inner = expression();
        consume(TokKind::RightParen);
        return arena_.add(Grouping{inner});
    }

    throw ParseError(ParseErrorKind::ExpectedExpression, peek());
}

Ast parse(const std::vector<Token>& tokens) {
    Parser parser(tokens);
    return parser.parse();
}

} // namespace ember
