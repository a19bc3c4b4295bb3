/**
 * Name: unihir::lex::Token
 * Purpose: Token structure with source location and text.
 */
#pragma once

#include <string>
#include "lexer/TokenKind.h"

namespace unihir::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // original text; string tokens hold the unquoted value
    std::string file{};
    int line{1}; // 1-based line number
    int col{1}; // 1-based column at token start

    bool is(const TokenKind k, const char *t) const { return kind == k && text == t; }
};

} // namespace unihir::lex
