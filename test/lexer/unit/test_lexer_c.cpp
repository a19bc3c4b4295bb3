/***
 * Name: test_lexer_c
 * Purpose: Tokenize C declarations, directives and comments.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"
#include "unihir/exceptions/frontend_error.h"

using namespace unihir;
using lex::TokenKind;

static std::vector<lex::Token> lexC(const char* src) {
  lex::Lexer L(lex::Dialect::C);
  L.pushString(src, "t.c");
  return L.tokens();
}

TEST(LexerC, DirectiveIsOneToken) {
  const auto toks = lexC("#include <Python.h>\nint x;\n");
  ASSERT_GE(toks.size(), 3u);
  EXPECT_EQ(toks[0].kind, TokenKind::Directive);
  EXPECT_EQ(toks[0].text, "#include <Python.h>");
  EXPECT_EQ(toks[1].kind, TokenKind::Newline);
  EXPECT_TRUE(toks[2].is(TokenKind::Ident, "int"));
  EXPECT_EQ(toks[2].line, 2);
}

TEST(LexerC, DirectiveContinuationLinesAreJoined) {
  const auto toks = lexC("#define TWO \\\n  2\nint y;\n");
  EXPECT_EQ(toks[0].kind, TokenKind::Directive);
  EXPECT_EQ(toks[0].text, "#define TWO   2");
  EXPECT_TRUE(toks[2].is(TokenKind::Ident, "int"));
  EXPECT_EQ(toks[2].line, 3);
}

TEST(LexerC, CommentsAreSkipped) {
  const auto toks = lexC("/* one\n two */ int /* mid */ z; // tail\n");
  std::vector<std::string> texts;
  for (const auto& t : toks) {
    if (t.kind != TokenKind::Newline && t.kind != TokenKind::End) { texts.push_back(t.text); }
  }
  const std::vector<std::string> expected = {"int", "z", ";"};
  EXPECT_EQ(texts, expected);
}

TEST(LexerC, NumericSuffixesAreStripped) {
  const auto toks = lexC("long n = 10UL; float f = 1.5f;\n");
  EXPECT_EQ(toks[3].kind, TokenKind::Int);
  EXPECT_EQ(toks[3].text, "10");
  EXPECT_EQ(toks[8].kind, TokenKind::Float);
  EXPECT_EQ(toks[8].text, "1.5");
}

TEST(LexerC, PointerAndEllipsis) {
  const auto toks = lexC("int printf(const char *fmt, ...);\n");
  bool sawStar = false;
  bool sawEllipsis = false;
  for (const auto& t : toks) {
    sawStar = sawStar || t.kind == TokenKind::Star;
    sawEllipsis = sawEllipsis || t.kind == TokenKind::Ellipsis;
  }
  EXPECT_TRUE(sawStar);
  EXPECT_TRUE(sawEllipsis);
}

TEST(LexerC, UnterminatedCommentThrows) {
  EXPECT_THROW((void)lexC("int a; /* never closed\nint b;\n"), exceptions::FrontendError);
}
