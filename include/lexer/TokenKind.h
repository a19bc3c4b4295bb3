/**
 * Name: unihir::lex::TokenKind
 * Purpose: Token kinds shared by the Python and C dialects.
 */
#pragma once

namespace unihir::lex {

enum class TokenKind {
    End, // EOF
    Newline, // end of a non-empty line

    Ident,
    Int,
    Float,
    String, // "..." or '...' (Python); "..." (C)
    Char, // 'c' (C only)
    Directive, // whole preprocessor line (C only)

    LParen, // (
    RParen, // )
    LBracket, // [
    RBracket, // ]
    LBrace, // {
    RBrace, // }
    Comma, // ,
    Colon, // :
    Semicolon, // ;
    Dot, // .
    Ellipsis, // ...
    Arrow, // ->
    Star, // *
    Minus, // -
    Equal, // =
    Punct // any other operator character
};

const char *to_string(TokenKind k);

} // namespace unihir::lex
