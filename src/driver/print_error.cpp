#include "driver/Transpiler.h"
#include "diag/Diagnostic.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace unihir::driver {
    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kYellow = "\033[33m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_header(const diag::Diagnostic &diag, const bool color, std::ostream &err) {
        if (diag.file.empty()) { return; }
        if (color) { err << kBold; }
        err << diag.file;
        if (diag.line > 0) { err << ":" << diag.line << ":" << diag.col; }
        err << ": ";
        if (color) { err << kReset; }
    }

    static void print_label(const diag::Diagnostic &diag, const bool color, std::ostream &err) {
        const bool isError = diag.severity == diag::Severity::Error;
        if (color) { err << (isError ? kRed : kYellow); }
        err << diag::to_string(diag.severity) << ": ";
        if (color) { err << kReset; }
    }

    // Prints up to `context` lines on each side of the offending line, with a
    // caret under its column.
    static void print_source_with_caret(const diag::Diagnostic &diag, const int context, std::ostream &err) {
        if (diag.file.empty() || diag.line <= 0 || diag.col <= 0) { return; }
        std::ifstream input(diag.file);
        if (!input) { return; }
        std::vector<std::string> lines;
        std::string lineStr;
        while (std::getline(input, lineStr)) { lines.push_back(lineStr); }
        if (static_cast<size_t>(diag.line) > lines.size()) { return; }
        const int first = std::max(1, diag.line - context);
        const int last = std::min(static_cast<int>(lines.size()), diag.line + context);
        for (int cur = first; cur <= last; ++cur) {
            err << "  " << lines[static_cast<size_t>(cur - 1)] << "\n";
            if (cur == diag.line) {
                err << "  " << std::string(static_cast<size_t>(diag.col - 1), ' ') << "^\n";
            }
        }
    }

    void Transpiler::print_error(const diag::Diagnostic &diag, const bool color, const int context,
                                 std::ostream &err) {
        print_header(diag, color, err);
        print_label(diag, color, err);
        err << diag.message << "\n";
        print_source_with_caret(diag, context, err);
    }

    static bool parse_positive(const std::string_view text, int &value) {
        if (text.empty() || text.size() > 9) { return false; }
        value = 0;
        for (const char ch : text) {
            if (std::isdigit(static_cast<unsigned char>(ch)) == 0) { return false; }
            value = value * 10 + (ch - '0');
        }
        return value > 0;
    }

    diag::Diagnostic Transpiler::diagnostic_from_message(const std::string &message) {
        diag::Diagnostic out{message, {}, 0, 0, diag::Severity::Error};
        // file:line:col: text
        const auto sep = message.find(": ");
        if (sep == std::string::npos) { return out; }
        const std::string_view head{message.data(), sep};
        const auto colPos = head.rfind(':');
        if (colPos == std::string_view::npos) { return out; }
        const auto linePos = head.rfind(':', colPos == 0 ? 0 : colPos - 1);
        if (linePos == std::string_view::npos || linePos == 0) { return out; }
        int line = 0;
        int col = 0;
        if (!parse_positive(head.substr(linePos + 1, colPos - linePos - 1), line)) { return out; }
        if (!parse_positive(head.substr(colPos + 1), col)) { return out; }
        out.file = std::string(head.substr(0, linePos));
        out.line = line;
        out.col = col;
        out.message = message.substr(sep + 2);
        return out;
    }
} // namespace unihir::driver
