#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "ember/token.hpp"

namespace ember {

enum class ScanErrorKind {
    UnterminatedString,
    UnterminatedBlockComment,
    UnexpectedCharacter,
    InvalidNumber,
};

struct ScanError {
    ScanErrorKind kind{};
    int line{1};
    int column{1};
    std::string message{};
};

struct ScanResult {
    std::vector<Token> tokens;
    std::vector<ScanError> errors; // lexical problems; scanning went on past each one
};

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    // Single pass over the whole source. The token list always ends with Eof.
    ScanResult scan();

private:
    void scan_token();
    void line_comment();
    void block_comment();
    void string_literal();
    void number_literal();
    void identifier();

    bool is_end() const { return current_ >= s_.size(); }
    char peek() const { return is_end() ? '\0' : s_[current_]; }
    char peek_next() const { return current_ + 1 >= s_.size() ? '\0' : s_[current_ + 1]; }
    char advance();
    bool match(char expected);

    std::string_view lexeme() const { return s_.substr(start_, current_ - start_); }
    void add_token(TokKind kind, Value literal = {});
    void add_error(ScanErrorKind kind, std::string message);

    std::string_view s_;
    std::size_t start_{0};
    std::size_t current_{0};
    int line_{1};
    int column_{1};
    int start_line_{1};
    int start_column_{1};
    ScanResult out_{};
};

/// Shorthand for Lexer(source).scan().
ScanResult scan(std::string_view source);

} // namespace ember
