/***
 * Name: unihir::frontend::TracerCFrontend (impl)
 * Purpose: Read file-scope C declarations into C HIR.
 * Theory of Operation:
 *   Each external declaration is scanned up to its first top-level '(',
 *   '{', '=' or ';'. A head ending in an identifier followed by '(' is a
 *   function; its body, if any, is skipped by brace matching.
 */
#include "frontend/TracerCFrontend.h"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "lexer/Lexer.h"
#include "unihir/exceptions/frontend_error.h"

namespace unihir::frontend {

using lex::Token;
using TK = lex::TokenKind;

namespace {

std::string unitStem(const std::string& file) {
  const auto slash = file.find_last_of("/\\");
  std::string base = slash == std::string::npos ? file : file.substr(slash + 1);
  const auto dot = base.rfind('.');
  if (dot != std::string::npos && dot != 0) { base.erase(dot); }
  return base.empty() ? std::string("unit") : base;
}

bool isBuiltinTypeWord(const std::string& w) {
  return w == "void" || w == "char" || w == "short" || w == "int" || w == "long" || w == "float" || w == "double" ||
         w == "signed" || w == "unsigned" || w == "size_t" || w == "Py_ssize_t";
}

bool isQualifier(const std::string& w) {
  return w == "const" || w == "volatile" || w == "inline" || w == "register" || w == "restrict" || w == "__inline";
}

struct ParsedType {
  hir::Type type{};
  chir::StorageClass storage{chir::StorageClass::None};
};

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ParsedType parseType(const std::vector<Token>& toks) {
  ParsedType out;
  std::string base;
  int pointers = 0;
  for (const auto& tok : toks) {
    if (tok.kind == TK::Star) { ++pointers; continue; }
    if (tok.kind != TK::Ident) { continue; }
    const std::string& w = tok.text;
    if (w == "static") { out.storage = chir::StorageClass::Static; continue; }
    if (w == "extern") { out.storage = chir::StorageClass::Extern; continue; }
    if (isQualifier(w) || w == "struct" || w == "union" || w == "enum" || w == "signed") { continue; }
    if (w == "unsigned") { continue; } // signedness is not modeled
    if (base.empty()) { base = w; continue; }
    if (isBuiltinTypeWord(w)) { base += " " + w; }
  }
  hir::Type t;
  if (base == "void") { t = hir::Type::cVoid(); }
  else if (base == "char") { t = hir::Type::cChar(); }
  else if (base.empty() || base == "int" || base == "short" || base == "short int") { t = hir::Type::cInt(); }
  else if (base.rfind("long", 0) == 0 && base != "long double") { t = hir::Type::cLong(); }
  else if (base == "size_t") { t = hir::Type::cSizeT(); }
  else if (base == "float") { t = hir::Type::cFloat(); }
  else if (base == "double" || base == "long double") { t = hir::Type::cDouble(); }
  else if (base == "Py_ssize_t") { t = hir::Type::cPySsizeT(); }
  else if (pointers > 0 && base == "PyObject") { t = hir::Type::cPyObject(); --pointers; }
  else if (pointers > 0 && base == "PyListObject") { t = hir::Type::cPyListObject(); --pointers; }
  else if (pointers > 0 && base == "PyDictObject") { t = hir::Type::cPyDictObject(); --pointers; }
  else { t = hir::Type::cStruct(base); }
  for (int i = 0; i < pointers; ++i) { t = hir::Type::cPointer(std::move(t)); }
  out.type = std::move(t);
  return out;
}

class CReader {
 public:
  CReader(std::vector<Token> tokens, std::string file) : file_(std::move(file)) {
    for (auto& tok : tokens) {
      if (tok.kind != TK::Newline && tok.kind != TK::Directive) { tokens_.push_back(std::move(tok)); }
    }
    if (tokens_.empty() || tokens_.back().kind != TK::End) {
      Token eof;
      eof.file = file_;
      tokens_.push_back(eof);
    }
  }

  std::unique_ptr<chir::TranslationUnit> parseUnit() {
    auto unit = std::make_unique<chir::TranslationUnit>(ids_.next(), unitStem(file_), hir::Metadata::at(file_, 1, 1));
    while (peek().kind != TK::End) {
      if (match(TK::Semicolon)) { continue; }
      if (auto decl = parseExternalDeclaration()) { unit->declarations.push_back(std::move(decl)); }
    }
    return unit;
  }

 private:
  std::vector<Token> tokens_{};
  std::string file_;
  size_t pos_{0};
  hir::IdAllocator ids_;

  const Token& peek() const { return tokens_[pos_ < tokens_.size() ? pos_ : (tokens_.size() - 1)]; }
  Token get() {
    if (pos_ < tokens_.size()) { return tokens_[pos_++]; }
    return tokens_.back();
  }
  bool match(const TK kind) {
    if (peek().kind == kind) { (void)get(); return true; }
    return false;
  }

  [[noreturn]] void fail(const Token& at, const std::string& msg) const {
    const std::string& file = at.file.empty() ? file_ : at.file;
    throw exceptions::FrontendError(file + ":" + std::to_string(at.line) + ":" + std::to_string(at.col) + ": " + msg);
  }

  hir::Metadata at(const Token& tok) const { return hir::Metadata::at(tok.file.empty() ? file_ : tok.file, tok.line, tok.col); }

  // Consume a balanced group starting at the current open token.
  std::vector<Token> takeGroup(const TK open, const TK close, const char* what) {
    const Token opener = get();
    std::vector<Token> inner;
    int depth = 1;
    while (true) {
      if (peek().kind == TK::End) { fail(opener, std::string("unterminated ") + what); }
      const Token tok = get();
      if (tok.kind == open) { ++depth; }
      if (tok.kind == close && --depth == 0) { return inner; }
      inner.push_back(tok);
    }
  }

  // Skip to the end of the current declaration, stepping over braced
  // initializers and bodies.
  void skipToSemicolon() {
    while (peek().kind != TK::End) {
      if (peek().kind == TK::LBrace) { (void)takeGroup(TK::LBrace, TK::RBrace, "brace block"); continue; }
      if (peek().kind == TK::LParen) { (void)takeGroup(TK::LParen, TK::RParen, "parenthesis"); continue; }
      if (match(TK::Semicolon)) { return; }
      (void)get();
    }
  }

  static bool endsWithName(const std::vector<Token>& head) {
    if (head.size() < 2 || head.back().kind != TK::Ident) { return false; }
    if (head.front().is(TK::Ident, "typedef")) { return false; }
    return !isBuiltinTypeWord(head.back().text) && !isQualifier(head.back().text);
  }

  std::unique_ptr<chir::Node> parseExternalDeclaration() {
    std::vector<Token> head;
    while (peek().kind != TK::End && peek().kind != TK::LParen && peek().kind != TK::LBrace &&
           peek().kind != TK::Equal && peek().kind != TK::Semicolon) {
      head.push_back(get());
    }
    if (!head.empty() && head.front().is(TK::Ident, "typedef")) {
      skipToSemicolon();
      return nullptr;
    }
    // Array declarators: name[...] is a pointer-like variable.
    int arrayDims = 0;
    while (!head.empty() && head.back().kind == TK::RBracket) {
      while (!head.empty() && head.back().kind != TK::LBracket) { head.pop_back(); }
      if (!head.empty()) { head.pop_back(); }
      ++arrayDims;
    }
    const TK stop = peek().kind;
    if (stop == TK::LParen && arrayDims == 0 && endsWithName(head)) { return parseFunction(head); }
    if (stop == TK::LParen) {
      // Macro invocation or function-pointer declarator.
      (void)takeGroup(TK::LParen, TK::RParen, "parenthesis");
      if (peek().kind != TK::LBrace) {
        (void)match(TK::Semicolon);
        return nullptr;
      }
    }
    if (peek().kind == TK::LBrace) {
      // struct/union/enum definition, possibly declaring variables after the brace.
      (void)takeGroup(TK::LBrace, TK::RBrace, "brace block");
      skipToSemicolon();
      return nullptr;
    }
    if ((stop == TK::Equal || stop == TK::Semicolon) && endsWithName(head)) {
      const Token name = head.back();
      head.pop_back();
      ParsedType parsed = parseType(head);
      for (int i = 0; i < arrayDims; ++i) { parsed.type = hir::Type::cPointer(std::move(parsed.type)); }
      skipToSemicolon();
      return std::make_unique<chir::Variable>(ids_.next(), name.text, std::move(parsed.type), at(name));
    }
    skipToSemicolon();
    return nullptr;
  }

  std::unique_ptr<chir::Node> parseFunction(std::vector<Token> head) {
    const Token name = head.back();
    head.pop_back();
    const ParsedType ret = parseType(head);
    auto fn = std::make_unique<chir::Function>(ids_.next(), name.text, ret.type, at(name));
    fn->storage = ret.storage;
    const auto paramToks = takeGroup(TK::LParen, TK::RParen, "parameter list");
    parseParams(paramToks, fn->params);
    // Trailing attributes/macros up to the body or the prototype's ';'.
    while (peek().kind != TK::End && peek().kind != TK::LBrace && peek().kind != TK::Semicolon) {
      if (peek().kind == TK::LParen) { (void)takeGroup(TK::LParen, TK::RParen, "parenthesis"); continue; }
      (void)get();
    }
    if (peek().kind == TK::LBrace) {
      (void)takeGroup(TK::LBrace, TK::RBrace, "function body");
      fn->hasBody = true;
    } else if (!match(TK::Semicolon)) {
      fail(peek(), "expected ';' or function body after '" + name.text + "(...)'");
    }
    return fn;
  }

  static void parseParams(const std::vector<Token>& toks, std::vector<chir::Param>& out) {
    std::vector<std::vector<Token>> groups(1);
    int depth = 0;
    for (const auto& tok : toks) {
      if (tok.kind == TK::LParen || tok.kind == TK::LBracket) { ++depth; }
      if (tok.kind == TK::RParen || tok.kind == TK::RBracket) { --depth; }
      if (tok.kind == TK::Comma && depth == 0) { groups.emplace_back(); continue; }
      groups.back().push_back(tok);
    }
    if (groups.size() == 1 && (groups[0].empty() || (groups[0].size() == 1 && groups[0][0].is(TK::Ident, "void")))) {
      return;
    }
    for (auto& group : groups) {
      if (group.empty() || group.front().kind == TK::Ellipsis) { continue; }
      chir::Param param;
      const bool funcPtr = group.size() > 1 && group[1].kind == TK::LParen;
      if (funcPtr || (group.size() > 2 && group[group.size() - 1].kind == TK::RParen)) {
        for (const auto& tok : group) {
          if (tok.kind == TK::Ident && !isBuiltinTypeWord(tok.text) && !isQualifier(tok.text)) { param.name = tok.text; }
          if (tok.kind == TK::LParen && !param.name.empty()) { break; }
        }
        param.type = hir::Type::cPointer(hir::Type::cVoid());
        out.push_back(std::move(param));
        continue;
      }
      int arrays = 0;
      while (!group.empty() && group.back().kind == TK::RBracket) {
        while (!group.empty() && group.back().kind != TK::LBracket) { group.pop_back(); }
        if (!group.empty()) { group.pop_back(); }
        ++arrays;
      }
      if (group.size() >= 2 && group.back().kind == TK::Ident && !isBuiltinTypeWord(group.back().text) &&
          !isQualifier(group.back().text)) {
        param.name = group.back().text;
        group.pop_back();
      }
      param.type = parseType(group).type;
      for (int i = 0; i < arrays; ++i) { param.type = hir::Type::cPointer(std::move(param.type)); }
      out.push_back(std::move(param));
    }
  }
};

} // namespace

std::unique_ptr<chir::TranslationUnit> TracerCFrontend::lower(const std::string& source, const std::string& file) {
  lex::Lexer lexer(lex::Dialect::C);
  lexer.pushString(source, file);
  CReader reader(lexer.tokens(), file);
  return reader.parseUnit();
}

} // namespace unihir::frontend
