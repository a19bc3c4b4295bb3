/***
 * Name: unihir::debugger::Command (impl)
 * Purpose: Tokenize one REPL line into a Command, resolving aliases and arguments.
 */
#include "debugger/Command.h"

#include <cctype>
#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace unihir::debugger {

static std::vector<std::string> splitWords(const std::string_view line) {
  std::istringstream iss{std::string(line)};
  std::vector<std::string> words;
  std::string word;
  while (iss >> word) { words.push_back(word); }
  return words;
}

static std::string lower(std::string s) {
  for (auto& c : s) { c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
  return s;
}

static std::string joinFrom(const std::vector<std::string>& words, const size_t first) {
  std::string out;
  for (size_t i = first; i < words.size(); ++i) {
    if (i != first) { out += ' '; }
    out += words[i];
  }
  return out;
}

static bool parseBreak(const std::vector<std::string>& words, Command& out, std::string& err) {
  if (words.size() < 2) { err = "break requires a breakpoint type"; return false; }
  const std::string kind = lower(words[1]);
  out.kind = Command::Kind::Break;
  if (kind == "boundary") {
    out.breakpoint = Breakpoint::boundary();
    return true;
  }
  if (kind == "phase") {
    if (words.size() < 3) { err = "break phase requires phase name"; return false; }
    out.breakpoint = Breakpoint::phase(joinFrom(words, 2));
    return true;
  }
  if (kind == "function" || kind == "fn") {
    if (words.size() < 3) { err = "break function requires function name"; return false; }
    out.breakpoint = Breakpoint::function(words[2]);
    return true;
  }
  err = "Unknown breakpoint type: '" + words[1] + "'";
  return false;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool parseCommand(const std::string_view line, Command& out, std::string& err) {
  out = Command{};
  const auto words = splitWords(line);
  if (words.empty()) { return true; } // empty line steps
  const std::string cmd = lower(words[0]);
  if (cmd == "step" || cmd == "s") { out.kind = Command::Kind::Step; return true; }
  if (cmd == "continue" || cmd == "c") { out.kind = Command::Kind::Continue; return true; }
  if (cmd == "visualize" || cmd == "v") { out.kind = Command::Kind::Visualize; return true; }
  if (cmd == "inspect" || cmd == "i") {
    if (words.size() < 2) { err = "inspect requires a target"; return false; }
    out.kind = Command::Kind::Inspect;
    out.target = joinFrom(words, 1);
    return true;
  }
  if (cmd == "break" || cmd == "b") { return parseBreak(words, out, err); }
  if (cmd == "list" || cmd == "l") { out.kind = Command::Kind::List; return true; }
  if (cmd == "clear") {
    if (words.size() < 2) { err = "clear requires breakpoint number"; return false; }
    const std::string& num = words[1];
    if (num.empty() || num.size() > 9) { err = "Invalid breakpoint number"; return false; }
    size_t value = 0;
    for (const char c : num) {
      if (std::isdigit(static_cast<unsigned char>(c)) == 0) { err = "Invalid breakpoint number"; return false; }
      value = value * 10 + static_cast<size_t>(c - '0');
    }
    out.kind = Command::Kind::Clear;
    out.index = value;
    return true;
  }
  if (cmd == "help" || cmd == "h" || cmd == "?") { out.kind = Command::Kind::Help; return true; }
  if (cmd == "quit" || cmd == "q" || cmd == "exit") { out.kind = Command::Kind::Quit; return true; }
  err = "Unknown command: '" + words[0] + "'. Type 'help' for commands.";
  return false;
}

} // namespace unihir::debugger
