/***
 * Name: unihir::frontend::TracerPythonFrontend (impl)
 * Purpose: Recursive-descent reader producing Python HIR from tracer input.
 */
#include "frontend/TracerPythonFrontend.h"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lexer/Lexer.h"
#include "unihir/exceptions/frontend_error.h"

namespace unihir::frontend {

using lex::Token;
using TK = lex::TokenKind;

namespace {

std::string moduleStem(const std::string& file) {
  const auto slash = file.find_last_of("/\\");
  std::string base = slash == std::string::npos ? file : file.substr(slash + 1);
  const auto dot = base.rfind('.');
  if (dot != std::string::npos && dot != 0) { base.erase(dot); }
  return base.empty() ? std::string("module") : base;
}

bool isUnsupportedKeyword(const std::string& word) {
  static const char* const kWords[] = {"if",    "elif",  "else",   "for",    "while", "with",   "try",
                                       "except", "finally", "class", "async", "raise", "global", "nonlocal",
                                       "del",   "assert", "lambda", "yield",  "await", "match"};
  for (const char* w : kWords) {
    if (word == w) { return true; }
  }
  return false;
}

class PyReader {
 public:
  PyReader(std::vector<Token> tokens, std::string file) : tokens_(std::move(tokens)), file_(std::move(file)) {}

  std::unique_ptr<pyhir::Module> parseModule() {
    auto mod = std::make_unique<pyhir::Module>(ids_.next(), moduleStem(file_), hir::Metadata::at(file_, 1, 1));
    while (peek().kind != TK::End) {
      const Token& tok = peek();
      if (tok.kind == TK::Newline) { (void)get(); continue; }
      if (tok.is(TK::Ident, "def")) { mod->body.push_back(parseFunction()); continue; }
      if (tok.is(TK::Ident, "import") || tok.is(TK::Ident, "from") || tok.is(TK::Punct, "@")) {
        skipLine();
        continue;
      }
      if (auto stmt = parseStatement(false)) { mod->body.push_back(std::move(stmt)); }
    }
    return mod;
  }

 private:
  std::vector<Token> tokens_;
  std::string file_;
  size_t pos_{0};
  hir::IdAllocator ids_;
  std::unordered_map<std::string, hir::Type> paramTypes_{}; // of the function being read

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

  Token expect(const TK kind, const char* what) {
    if (peek().kind != kind) {
      fail(peek(), std::string("expected ") + what + ", got " + lex::to_string(peek().kind) + " '" + peek().text + "'");
    }
    return get();
  }

  hir::Metadata at(const Token& tok) const { return hir::Metadata::at(tok.file.empty() ? file_ : tok.file, tok.line, tok.col); }

  void skipLine() {
    while (peek().kind != TK::Newline && peek().kind != TK::End) { (void)get(); }
    (void)match(TK::Newline);
  }

  void expectLineEnd() {
    if (peek().kind == TK::End) { return; }
    if (!match(TK::Newline)) { fail(peek(), "unexpected '" + peek().text + "' after statement"); }
  }

  hir::Type parseAnnotation() {
    Token name = expect(TK::Ident, "type name");
    while (match(TK::Dot)) { name = expect(TK::Ident, "type name"); }
    std::vector<hir::Type> params;
    if (match(TK::LBracket)) {
      do {
        if (peek().kind == TK::RBracket) { break; }
        params.push_back(parseAnnotation());
      } while (match(TK::Comma));
      (void)expect(TK::RBracket, "']'");
    }
    auto param = [&params](const size_t i) { return i < params.size() ? params[i] : hir::Type::unknown(); };
    const std::string& n = name.text;
    if (n == "int") { return hir::Type::pyInt(); }
    if (n == "float") { return hir::Type::pyFloat(); }
    if (n == "str") { return hir::Type::pyStr(); }
    if (n == "bool") { return hir::Type::pyBool(); }
    if (n == "None") { return hir::Type::pyNone(); }
    if (n == "list" || n == "List") { return hir::Type::pyList(param(0)); }
    if (n == "dict" || n == "Dict") { return hir::Type::pyDict(param(0), param(1)); }
    return hir::Type::pyClass(n);
  }

  std::unique_ptr<pyhir::Function> parseFunction() {
    const Token def = get();
    const Token name = expect(TK::Ident, "function name");
    auto fn = std::make_unique<pyhir::Function>(ids_.next(), name.text, at(def));
    paramTypes_.clear();
    (void)expect(TK::LParen, "'('");
    if (!match(TK::RParen)) {
      do {
        if (peek().kind == TK::RParen) { break; }
        pyhir::Param param;
        param.name = expect(TK::Ident, "parameter name").text;
        if (match(TK::Colon)) {
          param.annotation = parseAnnotation();
          paramTypes_[param.name] = *param.annotation;
        }
        if (peek().kind == TK::Equal) { fail(peek(), "default parameter values are not supported"); }
        fn->params.push_back(std::move(param));
      } while (match(TK::Comma));
      (void)expect(TK::RParen, "')'");
    }
    if (match(TK::Arrow)) { (void)parseAnnotation(); }
    (void)expect(TK::Colon, "':'");
    if (peek().kind != TK::Newline && peek().kind != TK::End) {
      // def f(x): return len(x)
      if (auto stmt = parseStatement(true)) { fn->body.push_back(std::move(stmt)); }
    } else {
      (void)match(TK::Newline);
      while (peek().kind != TK::End && peek().col > def.col) {
        if (peek().is(TK::Ident, "def")) { fail(peek(), "nested function definitions are not supported"); }
        if (auto stmt = parseStatement(true)) { fn->body.push_back(std::move(stmt)); }
      }
    }
    paramTypes_.clear();
    return fn;
  }

  std::unique_ptr<pyhir::Node> parseStatement(const bool inFunction) {
    const Token& tok = peek();
    if (tok.is(TK::Ident, "pass")) {
      (void)get();
      expectLineEnd();
      return nullptr;
    }
    if (tok.is(TK::Ident, "return")) {
      if (!inFunction) { fail(tok, "'return' outside function"); }
      const Token ret = get();
      std::unique_ptr<pyhir::Node> value;
      if (peek().kind != TK::Newline && peek().kind != TK::End) { value = parseExpr(); }
      expectLineEnd();
      return std::make_unique<pyhir::Return>(ids_.next(), std::move(value), at(ret));
    }
    if (tok.kind == TK::Ident && isUnsupportedKeyword(tok.text)) { fail(tok, "unsupported statement '" + tok.text + "'"); }
    auto expr = parseExpr();
    if (peek().kind == TK::Equal) { fail(peek(), "assignments are not supported"); }
    expectLineEnd();
    if (expr->kind == pyhir::NodeKind::Call) { return expr; }
    return nullptr;
  }

  std::unique_ptr<pyhir::Node> parseExpr() {
    const Token start = peek();
    auto base = parseAtom();
    while (true) {
      if (match(TK::Dot)) {
        const Token attr = expect(TK::Ident, "attribute name");
        base = std::make_unique<pyhir::Attribute>(ids_.next(), std::move(base), attr.text, at(attr));
        continue;
      }
      if (peek().kind == TK::LParen) {
        (void)get();
        auto call = std::make_unique<pyhir::Call>(ids_.next(), std::move(base), at(start));
        if (!match(TK::RParen)) {
          do {
            if (peek().kind == TK::RParen) { break; }
            if (peek().kind == TK::Ident && pos_ + 1 < tokens_.size() && tokens_[pos_ + 1].kind == TK::Equal) {
              fail(peek(), "keyword arguments are not supported");
            }
            call->args.push_back(parseExpr());
          } while (match(TK::Comma));
          (void)expect(TK::RParen, "')'");
        }
        base = std::move(call);
        continue;
      }
      return base;
    }
  }

  std::unique_ptr<pyhir::Node> intLiteral(const Token& tok, const bool negate) {
    int64_t value = 0;
    try {
      value = std::stoll(tok.text, nullptr, tok.text.rfind("0x", 0) == 0 || tok.text.rfind("0X", 0) == 0 ? 16 : 10);
    } catch (const std::exception&) {
      fail(tok, "integer literal out of range: " + tok.text);
    }
    return std::make_unique<pyhir::Literal>(ids_.next(), hir::LiteralValue::ofInt(negate ? -value : value), at(tok));
  }

  std::unique_ptr<pyhir::Node> floatLiteral(const Token& tok, const bool negate) {
    double value = 0.0;
    try {
      value = std::stod(tok.text);
    } catch (const std::exception&) {
      fail(tok, "invalid float literal: " + tok.text);
    }
    return std::make_unique<pyhir::Literal>(ids_.next(), hir::LiteralValue::ofFloat(negate ? -value : value), at(tok));
  }

  std::unique_ptr<pyhir::Node> parseAtom() {
    const Token tok = get();
    switch (tok.kind) {
      case TK::Ident: {
        if (tok.text == "True" || tok.text == "False") {
          return std::make_unique<pyhir::Literal>(ids_.next(), hir::LiteralValue::ofBool(tok.text == "True"), at(tok));
        }
        if (tok.text == "None") { return std::make_unique<pyhir::Literal>(ids_.next(), hir::LiteralValue::none(), at(tok)); }
        auto var = std::make_unique<pyhir::Variable>(ids_.next(), tok.text, at(tok));
        const auto typed = paramTypes_.find(tok.text);
        if (typed != paramTypes_.end()) { var->inferredType = typed->second; }
        return var;
      }
      case TK::Int: return intLiteral(tok, false);
      case TK::Float: return floatLiteral(tok, false);
      case TK::String: return std::make_unique<pyhir::Literal>(ids_.next(), hir::LiteralValue::ofStr(tok.text), at(tok));
      case TK::Minus: {
        const Token num = get();
        if (num.kind == TK::Int) { return intLiteral(num, true); }
        if (num.kind == TK::Float) { return floatLiteral(num, true); }
        fail(num, "expected number after '-'");
      }
      case TK::LParen: {
        auto inner = parseExpr();
        (void)expect(TK::RParen, "')'");
        return inner;
      }
      case TK::End: fail(tok, "unexpected end of input");
      default: fail(tok, "unexpected '" + tok.text + "'");
    }
  }
};

} // namespace

std::unique_ptr<pyhir::Module> TracerPythonFrontend::lower(const std::string& source, const std::string& file) {
  lex::Lexer lexer(lex::Dialect::Python);
  lexer.pushString(source, file);
  PyReader reader(lexer.tokens(), file);
  return reader.parseModule();
}

} // namespace unihir::frontend
