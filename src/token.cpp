#include "ember/token.hpp"

#include <fmt/format.h>

namespace ember {

std::string_view kind_name(TokKind kind) {
    switch (kind) {
        case TokKind::LeftParen:    return "LEFT_PAREN";
        case TokKind::RightParen:   return "RIGHT_PAREN";
        case TokKind::LeftBrace:    return "LEFT_BRACE";
        case TokKind::RightBrace:   return "RIGHT_BRACE";
        case TokKind::Comma:        return "COMMA";
        case TokKind::Dot:          return "DOT";
        case TokKind::Minus:        return "MINUS";
        case TokKind::Plus:         return "PLUS";
        case TokKind::Semicolon:    return "SEMICOLON";
        case TokKind::Star:         return "STAR";
        case TokKind::Slash:        return "SLASH";
        case TokKind::Question:     return "QUESTION";
        case TokKind::Colon:        return "COLON";
        case TokKind::Bang:         return "BANG";
        case TokKind::BangEqual:    return "BANG_EQUAL";
        case TokKind::Equal:        return "EQUAL";
        case TokKind::EqualEqual:   return "EQUAL_EQUAL";
        case TokKind::Less:         return "LESS";
        case TokKind::LessEqual:    return "LESS_EQUAL";
        case TokKind::Greater:      return "GREATER";
        case TokKind::GreaterEqual: return "GREATER_EQUAL";
        case TokKind::Ident:        return "IDENT";
        case TokKind::String:       return "STRING";
        case TokKind::Number:       return "NUMBER";
        case TokKind::And:          return "AND";
        case TokKind::Class:        return "CLASS";
        case TokKind::Else:         return "ELSE";
        case TokKind::False:        return "FALSE";
        case TokKind::For:          return "FOR";
        case TokKind::Fn:           return "FN";
        case TokKind::If:           return "IF";
        case TokKind::Nil:          return "NIL";
        case TokKind::Or:           return "OR";
        case TokKind::Print:        return "PRINT";
        case TokKind::Return:       return "RETURN";
        case TokKind::Super:        return "SUPER";
        case TokKind::This:         return "THIS";
        case TokKind::True:         return "TRUE";
        case TokKind::Var:          return "VAR";
        case TokKind::While:        return "WHILE";
        case TokKind::Comment:      return "COMMENT";
        case TokKind::Eof:          return "EOF";
    }
    return "UNKNOWN";
}

std::string to_string(const Value& value) {
    if (std::holds_alternative<double>(value)) return fmt::format("{}", std::get<double>(value));
    if (std::holds_alternative<std::string>(value)) return std::get<std::string>(value);
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value) ? "true" : "false";
    if (std::holds_alternative<Nil>(value)) return "nil";
    return {};
}

std::string escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c;
        }
    }
    return out;
}

} // namespace ember
