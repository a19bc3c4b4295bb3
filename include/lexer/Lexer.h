/**
 * Name: unihir::lex::Lexer
 * Purpose: Tokenize Python or C source text for the tracer frontends.
 * Theory of Operation:
 *   Lines are read from each pushed source in order and tokenized
 *   eagerly on first access. Blank and comment-only lines produce no
 *   tokens; every other line ends in a Newline token. In the C dialect block
 *   comments may span lines and a line starting with '#' becomes a single
 *   Directive token. Malformed input (unterminated string or comment)
 *   throws exceptions::FrontendError carrying "file:line:col".
 */
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "lexer/SourceLines.h"
#include "lexer/Token.h"

namespace unihir::lex {

enum class Dialect { Python, C };

class Lexer {
public:
    explicit Lexer(const Dialect dialect) : dialect_(dialect) {}

    void pushString(const std::string& text, const std::string& name);

    const Token& peek(size_t lookahead = 0);

    Token next();

    std::vector<Token> tokens();

private:
    Dialect dialect_;
    bool finalized_{false};
    std::vector<Token> tokens_{};
    size_t pos_{0};

    struct State {
        explicit State(SourceLines source) : src(std::move(source)) {}

        SourceLines src;
        std::string line{};
        size_t index{0};
        int lineNo{0};
        bool inBlockComment{false};
        int commentLine{0};
        int commentCol{0};
    };

    std::vector<SourceLines> inputs_{};

    bool readNextLine(State& state);
    bool skipSpaceAndComments(State& state); // false when the line is exhausted
    Token scanOne(State& state);
    Token scanString(State& state, char quote);
    Token scanNumber(State& state);
    Token makeTok(const State& state, TokenKind kind, size_t start, size_t endExclusive) const;

    void buildAll();
};

} // namespace unihir::lex
