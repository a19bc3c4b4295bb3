/**
 * Name: unihir::lex::SourceLines
 * Purpose: Line cursor over one in-memory source text.
 * Theory of Operation:
 *   Owns the text and hands it out one line at a time without the line
 *   terminator; "\r\n" and "\n" both end a line. A final line without a
 *   terminator is still returned. lineNo() is the 1-based number of the
 *   line most recently returned.
 */
#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace unihir::lex {

class SourceLines {
public:
    SourceLines(std::string text, std::string name) : text_(std::move(text)), name_(std::move(name)) {}

    bool readLine(std::string& out); // false once the text is exhausted

    const std::string& name() const { return name_; }
    int lineNo() const { return lineNo_; }

private:
    std::string text_;
    std::string name_;
    size_t offset_{0};
    int lineNo_{0};
};

} // namespace unihir::lex
