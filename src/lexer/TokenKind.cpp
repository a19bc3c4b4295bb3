/**
 * Name: unihir::lex::TokenKind helpers
 * Purpose: Implementation for TokenKind utilities.
 */
#include "lexer/TokenKind.h"

namespace unihir::lex {
    const char *to_string(const TokenKind k) {
        switch (k) {
            case TokenKind::End: return "End";
            case TokenKind::Newline: return "Newline";
            case TokenKind::Ident: return "Ident";
            case TokenKind::Int: return "Int";
            case TokenKind::Float: return "Float";
            case TokenKind::String: return "String";
            case TokenKind::Char: return "Char";
            case TokenKind::Directive: return "Directive";
            case TokenKind::LParen: return "LParen";
            case TokenKind::RParen: return "RParen";
            case TokenKind::LBracket: return "LBracket";
            case TokenKind::RBracket: return "RBracket";
            case TokenKind::LBrace: return "LBrace";
            case TokenKind::RBrace: return "RBrace";
            case TokenKind::Comma: return "Comma";
            case TokenKind::Colon: return "Colon";
            case TokenKind::Semicolon: return "Semicolon";
            case TokenKind::Dot: return "Dot";
            case TokenKind::Ellipsis: return "Ellipsis";
            case TokenKind::Arrow: return "Arrow";
            case TokenKind::Star: return "Star";
            case TokenKind::Minus: return "Minus";
            case TokenKind::Equal: return "Equal";
            case TokenKind::Punct: return "Punct";
            default: return "unknown";
        }
    }
} // namespace unihir::lex
