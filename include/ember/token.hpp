#pragma once
#include <string>
#include <string_view>
#include <variant>

namespace ember {

enum class TokKind {
    // single-character punctuation
    LeftParen, RightParen,
    LeftBrace, RightBrace,
    Comma, Dot, Minus, Plus, Semicolon, Star, Slash,
    Question, Colon,

    // one or two character operators
    Bang, BangEqual,
    Equal, EqualEqual,
    Less, LessEqual,
    Greater, GreaterEqual,

    // literals
    Ident,
    String,
    Number,

    // keywords
    And, Class, Else, False, For, Fn, If, Nil, Or,
    Print, Return, Super, This, True, Var, While,

    Comment,
    Eof,
};

struct Nil {};

inline bool operator==(Nil, Nil) { return true; }
inline bool operator!=(Nil, Nil) { return false; }

// std::monostate marks a token without a literal.
using Value = std::variant<std::monostate, double, std::string, bool, Nil>;

struct Token {
    TokKind kind{TokKind::Eof};
    std::string lexeme{};
    Value literal{};
    int line{1};
    int column{1};
};

/// Upper-case kind name as used in diagnostics, e.g. "RIGHT_PAREN".
std::string_view kind_name(TokKind kind);

/// Default text form of a literal value: shortest round-trip numbers,
/// strings verbatim, "true"/"false", "nil", and "" when absent.
std::string to_string(const Value& value);

/// Lexeme text fit for a one-line message: newline, carriage return and tab
/// become \n, \r and \t.
std::string escape(std::string_view text);

} // namespace ember
