#include "ember/diagnostics.hpp"
#include <variant>
#include <fmt/format.h>

namespace ember {

std::string_view error_kind_name(ScanErrorKind kind) {
    switch (kind) {
        case ScanErrorKind::UnterminatedString:       return "UNTERMINATED_STRING";
        case ScanErrorKind::UnterminatedBlockComment: return "UNTERMINATED_BLOCK_COMMENT";
        case ScanErrorKind::UnexpectedCharacter:      return "UNEXPECTED_CHARACTER";
        case ScanErrorKind::InvalidNumber:            return "INVALID_NUMBER";
    }
    return "UNKNOWN";
}

std::string_view error_kind_name(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::UnexpectedToken:    return "UNEXPECTED_TOKEN";
        case ParseErrorKind::ExpectedExpression: return "EXPECTED_EXPRESSION";
        case ParseErrorKind::TooDeep:            return "NESTING_TOO_DEEP";
    }
    return "UNKNOWN";
}

std::string format_diagnostic(const ScanError& err) {
    return fmt::format("[line {}:{}] Error: {}", err.line, err.column, err.message);
}

std::string format_diagnostic(const ParseError& err) {
    const Token& at = err.found();
    if (at.kind == TokKind::Eof)
        return fmt::format("[line {}:{}] Error at end: {}", at.line, at.column, err.what());
    return fmt::format("[line {}:{}] Error at '{}': {}", at.line, at.column, escape(at.lexeme), err.what());
}

std::string format_token(const Token& tok) {
    std::string out = fmt::format("{} '{}'", kind_name(tok.kind), escape(tok.lexeme));
    if (!std::holds_alternative<std::monostate>(tok.literal)) {
        out += ' ';
        out += escape(to_string(tok.literal));
    }
    out += fmt::format(" @{}:{}", tok.line, tok.column);
    return out;
}

void report(std::FILE* out, const std::string& line) {
    fmt::print(out, "{}\n", line);
    std::fflush(out);
}

} // namespace ember
