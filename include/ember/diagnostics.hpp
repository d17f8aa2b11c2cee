#pragma once
#include <cstdio>
#include <string>
#include "ember/lexer.hpp"
#include "ember/parser.hpp"
#include "ember/token.hpp"

namespace ember {

std::string_view error_kind_name(ScanErrorKind kind);
std::string_view error_kind_name(ParseErrorKind kind);

// "[line 3:7] Error: Unexpected character '@'."
std::string format_diagnostic(const ScanError& err);

// "[line 1:7] Error at end: Expected RIGHT_PAREN but found end of input."
std::string format_diagnostic(const ParseError& err);

// Token dump line, e.g. "NUMBER '12.5' 12.5 @1:3".
std::string format_token(const Token& tok);

// Writes one diagnostic line to `out`.
void report(std::FILE* out, const std::string& line);

} // namespace ember
