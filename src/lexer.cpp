#include "ember/lexer.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <unordered_map>
#include <fmt/format.h>

namespace ember {

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}
static bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}
static bool is_ident_char(char c) {
    return is_ident_start(c) || is_digit(c);
}

static std::string_view trim_left(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return s.substr(i);
}
static std::string_view trim(std::string_view s) {
    s = trim_left(s);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

static TokKind keyword_or_ident(std::string_view text) {
    static const std::unordered_map<std::string_view, TokKind> keywords = {
        {"and", TokKind::And},       {"class", TokKind::Class},   {"else", TokKind::Else},
        {"false", TokKind::False},   {"for", TokKind::For},       {"fn", TokKind::Fn},
        {"if", TokKind::If},         {"nil", TokKind::Nil},       {"or", TokKind::Or},
        {"print", TokKind::Print},   {"return", TokKind::Return}, {"super", TokKind::Super},
        {"this", TokKind::This},     {"true", TokKind::True},     {"var", TokKind::Var},
        {"while", TokKind::While},
    };
    auto it = keywords.find(text);
    return it == keywords.end() ? TokKind::Ident : it->second;
}

ScanResult Lexer::scan() {
    out_ = ScanResult{};
    start_ = current_ = 0;
    line_ = column_ = 1;

    while (!is_end()) {
        start_ = current_;
        start_line_ = line_;
        start_column_ = column_;
        scan_token();
    }

    start_ = current_;
    start_line_ = line_;
    start_column_ = column_;
    add_token(TokKind::Eof);
    return std::move(out_);
}

char Lexer::advance() {
    char c = s_[current_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

bool Lexer::match(char expected) {
    if (is_end() || s_[current_] != expected) return false;
    advance();
    return true;
}

void Lexer::add_token(TokKind kind, Value literal) {
    Token t{kind};
    t.lexeme = std::string(lexeme());
    t.literal = std::move(literal);
    t.line = start_line_;
    t.column = start_column_;
    out_.tokens.push_back(std::move(t));
}

void Lexer::add_error(ScanErrorKind kind, std::string message) {
    out_.errors.push_back(ScanError{kind, start_line_, start_column_, std::move(message)});
}

void Lexer::scan_token() {
    char c = advance();

    switch (c) {
        case '(': add_token(TokKind::LeftParen); return;
        case ')': add_token(TokKind::RightParen); return;
        case '{': add_token(TokKind::LeftBrace); return;
        case '}': add_token(TokKind::RightBrace); return;
        case ',': add_token(TokKind::Comma); return;
        case '.': add_token(TokKind::Dot); return;
        case '-': add_token(TokKind::Minus); return;
        case '+': add_token(TokKind::Plus); return;
        case ';': add_token(TokKind::Semicolon); return;
        case '*': add_token(TokKind::Star); return;
        case '?': add_token(TokKind::Question); return;
        case ':': add_token(TokKind::Colon); return;

        case '!': add_token(match('=') ? TokKind::BangEqual : TokKind::Bang); return;
        case '=': add_token(match('=') ? TokKind::EqualEqual : TokKind::Equal); return;
        case '<': add_token(match('=') ? TokKind::LessEqual : TokKind::Less); return;
        case '>': add_token(match('=') ? TokKind::GreaterEqual : TokKind::Greater); return;

        case '/':
            if (match('/')) line_comment();
            else if (match('*')) block_comment();
            else add_token(TokKind::Slash);
            return;

        case '"': string_literal(); return;

        case ' ':
        case '\t':
        case '\r':
        case '\n': // advance() already counted the line
            return;

        default: break;
    }

    if (is_digit(c)) {
        number_literal();
        return;
    }
    if (is_ident_start(c)) {
        identifier();
        return;
    }

    if (std::isprint(static_cast<unsigned char>(c))) {
        add_error(ScanErrorKind::UnexpectedCharacter, fmt::format("Unexpected character '{}'.", c));
    } else {
        add_error(ScanErrorKind::UnexpectedCharacter,
                  fmt::format("Unexpected character (byte 0x{:02X}).", static_cast<unsigned char>(c)));
    }
}

// "//" consumed. Stops before the newline so it is counted by the main loop.
void Lexer::line_comment() {
    while (!is_end() && peek() != '\n') advance();
    std::string_view body = lexeme().substr(2);
    add_token(TokKind::Comment, std::string(trim_left(body)));
}

// "/*" consumed. Block comments nest; each "/*" must be closed by its own "*/".
void Lexer::block_comment() {
    int depth = 1;
    while (!is_end()) {
        if (peek() == '/' && peek_next() == '*') {
            advance();
            advance();
            ++depth;
        } else if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            if (--depth == 0) break;
        } else {
            advance();
        }
    }

    if (depth > 0) {
        add_error(ScanErrorKind::UnterminatedBlockComment,
                  fmt::format("Unterminated block comment ({} level{} still open).", depth, depth == 1 ? "" : "s"));
        return;
    }

    std::string_view text = lexeme();
    std::string_view body = text.substr(2, text.size() - 4);
    add_token(TokKind::Comment, std::string(trim(body)));
}

// Opening quote consumed. No escape sequences; newlines are part of the string.
void Lexer::string_literal() {
    while (!is_end() && peek() != '"') advance();

    if (is_end()) {
        add_error(ScanErrorKind::UnterminatedString, "Unterminated string.");
        return;
    }

    advance(); // closing "
    std::string_view text = lexeme();
    add_token(TokKind::String, std::string(text.substr(1, text.size() - 2)));
}

void Lexer::number_literal() {
    while (is_digit(peek())) advance();

    // A trailing '.' without a digit after it belongs to the next token.
    if (peek() == '.' && is_digit(peek_next())) {
        advance();
        while (is_digit(peek())) advance();
    }

    std::string text(lexeme());
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || (errno == ERANGE && std::isinf(v))) {
        add_error(ScanErrorKind::InvalidNumber, fmt::format("Invalid number '{}'.", text));
        return;
    }
    add_token(TokKind::Number, v);
}

void Lexer::identifier() {
    while (is_ident_char(peek())) advance();

    TokKind kind = keyword_or_ident(lexeme());
    switch (kind) {
        case TokKind::True:  add_token(kind, true); break;
        case TokKind::False: add_token(kind, false); break;
        case TokKind::Nil:   add_token(kind, Nil{}); break;
        default:             add_token(kind); break;
    }
}

ScanResult scan(std::string_view source) {
    return Lexer(source).scan();
}

} // namespace ember
