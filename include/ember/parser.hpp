#pragma once
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <vector>
#include "ember/expr.hpp"
#include "ember/token.hpp"

namespace ember {

enum class ParseErrorKind {
    UnexpectedToken,    // a required token was missing; expected() names it
    ExpectedExpression, // no expression could start at found()
    TooDeep,            // nesting passed Parser::kMaxNesting at found()
};

class ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, Token found, TokKind expected = TokKind::Eof);

    ParseErrorKind kind() const noexcept { return kind_; }
    const Token& found() const noexcept { return found_; }
    TokKind expected() const noexcept { return expected_; }

private:
    ParseErrorKind kind_;
    Token found_;
    TokKind expected_;
};

/// Recursive-descent parser over a scanned token list.
///
/// Comment tokens are dropped on construction and a trailing Eof is added if
/// missing, so peek() always has a token to return.
class Parser {
public:
    // Unary chains, groupings and ternary branches may nest this deep.
    static constexpr std::size_t kMaxNesting = 256;

    explicit Parser(const std::vector<Token>& tokens);

    /// Parse the whole token list as a single expression.
    /// Throws ParseError on the first mismatch; the nodes built so far are
    /// released with this parser.
    Ast parse();

    /// Error recovery for statement sequences: skip the offending token, then
    /// everything up to and including the next ';', stopping early in front
    /// of a statement keyword or Eof.
    void synchronize();

    const Token& peek() const { return tokens_[current_]; }
    bool is_end() const { return peek().kind == TokKind::Eof; }

private:
    ExprId expression();
    ExprId comma();
    ExprId ternary();
    ExprId equality();
    ExprId comparison();
    ExprId term();
    ExprId factor();
    ExprId unary();
    ExprId primary();

    const Token& previous() const { return tokens_[current_ - 1]; }
    const Token& advance();
    bool check(TokKind kind) const { return peek().kind == kind; }
    bool match(std::initializer_list<TokKind> kinds);
    const Token& consume(TokKind kind);

    std::vector<Token> tokens_;
    std::size_t current_{0};
    std::size_t depth_{0};
    ExprArena arena_{};
};

/// Shorthand for Parser(tokens).parse().
Ast parse(const std::vector<Token>& tokens);

} // namespace ember
