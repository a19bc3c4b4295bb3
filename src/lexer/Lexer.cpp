/***
 * Name: unihir::lex::Lexer
 * Purpose: Tokenize Python or C source into a single token stream.
 */
#include "lexer/Lexer.h"

#include <cctype>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "unihir/exceptions/frontend_error.h"

namespace unihir::lex {

static bool isIdentStart(char chr) { return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
static bool isIdentChar(char chr) { return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
static bool isDigit(char chr) { return std::isdigit(static_cast<unsigned char>(chr)) != 0; }

static bool isStringPrefix(const std::string& text) {
  if (text.empty() || text.size() > 2) { return false; }
  for (const char c : text) {
    if (c != 'r' && c != 'R' && c != 'b' && c != 'B' && c != 'u' && c != 'U' && c != 'f' && c != 'F') { return false; }
  }
  return true;
}

[[noreturn]] static void fail(const std::string& file, int line, int col, const std::string& what) {
  throw exceptions::FrontendError(file + ":" + std::to_string(line) + ":" + std::to_string(col) + ": " + what);
}

bool SourceLines::readLine(std::string& out) {
  if (offset_ >= text_.size()) { return false; }
  const auto end = text_.find('\n', offset_);
  const size_t stop = end == std::string::npos ? text_.size() : end;
  out.assign(text_, offset_, stop - offset_);
  if (!out.empty() && out.back() == '\r') { out.pop_back(); }
  offset_ = end == std::string::npos ? text_.size() : end + 1;
  ++lineNo_;
  return true;
}

void Lexer::pushString(const std::string& text, const std::string& name) { inputs_.emplace_back(text, name); }

bool Lexer::readNextLine(State& state) {
  state.line.clear();
  if (!state.src.readLine(state.line)) { return false; }
  state.lineNo = state.src.lineNo();
  state.index = 0;
  return true;
}

bool Lexer::skipSpaceAndComments(State& state) {
  const auto& line = state.line;
  size_t& idx = state.index;
  while (true) {
    if (state.inBlockComment) {
      const auto close = line.find("*/", idx);
      if (close == std::string::npos) { idx = line.size(); return false; }
      idx = close + 2;
      state.inBlockComment = false;
    }
    while (idx < line.size() && (line[idx] == ' ' || line[idx] == '\t' || line[idx] == '\f')) { ++idx; }
    if (idx >= line.size()) { return false; }
    if (dialect_ == Dialect::Python) {
      if (line[idx] == '#') { idx = line.size(); return false; }
      return true;
    }
    if (line.compare(idx, 2, "//") == 0) { idx = line.size(); return false; }
    if (line.compare(idx, 2, "/*") == 0) {
      state.inBlockComment = true;
      state.commentLine = state.lineNo;
      state.commentCol = static_cast<int>(idx + 1);
      idx += 2;
      continue;
    }
    return true;
  }
}

Token Lexer::makeTok(const State& state, const TokenKind kind, const size_t start, const size_t endExclusive) const {
  Token tok;
  tok.kind = kind;
  tok.text = state.line.substr(start, endExclusive - start);
  tok.file = state.src.name();
  tok.line = state.lineNo;
  tok.col = static_cast<int>(start + 1);
  return tok;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
Token Lexer::scanString(State& state, const char quote) {
  Token tok;
  tok.kind = (dialect_ == Dialect::C && quote == '\'') ? TokenKind::Char : TokenKind::String;
  tok.file = state.src.name();
  tok.line = state.lineNo;
  tok.col = static_cast<int>(state.index + 1);
  // Prefix letters (Python r/b/u/f) precede the quote.
  bool raw = false;
  while (state.index < state.line.size() && state.line[state.index] != quote) {
    const char p = state.line[state.index];
    if (p == 'r' || p == 'R') { raw = true; }
    ++state.index;
  }
  const bool triple = dialect_ == Dialect::Python && state.line.compare(state.index, 3, std::string(3, quote)) == 0;
  state.index += triple ? 3 : 1;
  std::string value;
  while (true) {
    if (state.index >= state.line.size()) {
      if (!triple) { fail(tok.file, tok.line, tok.col, "unterminated string literal"); }
      if (!readNextLine(state)) { fail(tok.file, tok.line, tok.col, "unterminated triple-quoted string"); }
      value += '\n';
      continue;
    }
    const char c = state.line[state.index];
    if (c == '\\' && !raw && state.index + 1 < state.line.size()) {
      const char esc = state.line[state.index + 1];
      switch (esc) {
        case 'n': value += '\n'; break;
        case 't': value += '\t'; break;
        case '\\': value += '\\'; break;
        case '"': value += '"'; break;
        case '\'': value += '\''; break;
        case '0': value += '\0'; break;
        default: value += '\\'; value += esc; break;
      }
      state.index += 2;
      continue;
    }
    if (c == quote) {
      if (!triple) { ++state.index; break; }
      if (state.line.compare(state.index, 3, std::string(3, quote)) == 0) { state.index += 3; break; }
    }
    value += c;
    ++state.index;
  }
  tok.text = std::move(value);
  return tok;
}

Token Lexer::scanNumber(State& state) {
  const auto& line = state.line;
  const size_t start = state.index;
  size_t& idx = state.index;
  bool isFloat = false;
  std::string digits;
  if (line.compare(idx, 2, "0x") == 0 || line.compare(idx, 2, "0X") == 0) {
    digits = line.substr(idx, 2);
    idx += 2;
    while (idx < line.size() && (std::isxdigit(static_cast<unsigned char>(line[idx])) != 0 || line[idx] == '_')) {
      if (line[idx] != '_') { digits += line[idx]; }
      ++idx;
    }
  } else {
    auto takeDigits = [&]() {
      while (idx < line.size() && (isDigit(line[idx]) || line[idx] == '_')) {
        if (line[idx] != '_') { digits += line[idx]; }
        ++idx;
      }
    };
    takeDigits();
    if (idx < line.size() && line[idx] == '.' && line.compare(idx, 3, "...") != 0) {
      isFloat = true;
      digits += '.';
      ++idx;
      takeDigits();
    }
    if (idx < line.size() && (line[idx] == 'e' || line[idx] == 'E')) {
      size_t look = idx + 1;
      if (look < line.size() && (line[look] == '+' || line[look] == '-')) { ++look; }
      if (look < line.size() && isDigit(line[look])) {
        isFloat = true;
        digits += line.substr(idx, look - idx);
        idx = look;
        takeDigits();
      }
    }
  }
  // C suffixes (u, l, f) are not part of the value.
  while (dialect_ == Dialect::C && idx < line.size() &&
         (line[idx] == 'u' || line[idx] == 'U' || line[idx] == 'l' || line[idx] == 'L' || line[idx] == 'f' ||
          line[idx] == 'F')) {
    if (line[idx] == 'f' || line[idx] == 'F') { isFloat = true; }
    ++idx;
  }
  Token tok = makeTok(state, isFloat ? TokenKind::Float : TokenKind::Int, start, idx);
  tok.text = digits;
  return tok;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanOne(State& state) {
  const auto& line = state.line;
  size_t& idx = state.index;
  const char chr = line[idx];

  if (isIdentStart(chr)) {
    const size_t start = idx;
    while (idx < line.size() && isIdentChar(line[idx])) { ++idx; }
    const std::string text = line.substr(start, idx - start);
    if (dialect_ == Dialect::Python && idx < line.size() && (line[idx] == '"' || line[idx] == '\'') &&
        isStringPrefix(text)) {
      idx = start;
      return scanString(state, line[start + text.size()]);
    }
    return makeTok(state, TokenKind::Ident, start, idx);
  }
  if (isDigit(chr) || (chr == '.' && idx + 1 < line.size() && isDigit(line[idx + 1]))) { return scanNumber(state); }
  if (chr == '"' || chr == '\'') { return scanString(state, chr); }

  const size_t start = idx;
  auto single = [&](TokenKind kind) { ++idx; return makeTok(state, kind, start, idx); };
  switch (chr) {
    case '(': return single(TokenKind::LParen);
    case ')': return single(TokenKind::RParen);
    case '[': return single(TokenKind::LBracket);
    case ']': return single(TokenKind::RBracket);
    case '{': return single(TokenKind::LBrace);
    case '}': return single(TokenKind::RBrace);
    case ',': return single(TokenKind::Comma);
    case ':': return single(TokenKind::Colon);
    case ';': return single(TokenKind::Semicolon);
    case '*': return single(TokenKind::Star);
    case '.':
      if (line.compare(idx, 3, "...") == 0) { idx += 3; return makeTok(state, TokenKind::Ellipsis, start, idx); }
      return single(TokenKind::Dot);
    case '-':
      if (idx + 1 < line.size() && line[idx + 1] == '>') { idx += 2; return makeTok(state, TokenKind::Arrow, start, idx); }
      return single(TokenKind::Minus);
    case '=':
      if (idx + 1 < line.size() && line[idx + 1] == '=') { idx += 2; return makeTok(state, TokenKind::Punct, start, idx); }
      return single(TokenKind::Equal);
    default:
      return single(TokenKind::Punct);
  }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  std::string lastName;
  for (auto& input : inputs_) {
    State state(std::move(input));
    lastName = state.src.name();
    while (readNextLine(state)) {
      if (dialect_ == Dialect::C && !state.inBlockComment) {
        const auto first = state.line.find_first_not_of(" \t");
        if (first != std::string::npos && state.line[first] == '#') {
          Token dir = makeTok(state, TokenKind::Directive, first, state.line.size());
          // Continuation lines belong to the directive.
          std::string text = state.line;
          while (!text.empty() && text.back() == '\\' && readNextLine(state)) {
            text.pop_back();
            text += state.line;
          }
          dir.text = text.substr(first);
          tokens_.push_back(dir);
          Token nl = dir; nl.kind = TokenKind::Newline; nl.text = "\n";
          tokens_.push_back(std::move(nl));
          continue;
        }
      }
      bool any = false;
      while (skipSpaceAndComments(state)) {
        tokens_.push_back(scanOne(state));
        any = true;
      }
      if (any) {
        Token nl; nl.kind = TokenKind::Newline; nl.text = "\n"; nl.file = state.src.name(); nl.line = state.lineNo;
        nl.col = static_cast<int>(state.line.size() + 1);
        tokens_.push_back(std::move(nl));
      }
    }
    if (state.inBlockComment) { fail(state.src.name(), state.commentLine, state.commentCol, "unterminated comment"); }
  }
  inputs_.clear();
  // Final EOF
  Token eof; eof.kind = TokenKind::End; eof.text = "<EOF>"; eof.file = lastName; eof.line = 0; eof.col = 1;
  tokens_.push_back(eof);
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace unihir::lex
