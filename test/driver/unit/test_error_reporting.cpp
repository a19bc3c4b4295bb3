/***
 * Name: test_error_reporting
 * Purpose: Diagnostic rendering, location parsing, colour selection and --patterns text.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "diag/Diagnostic.h"
#include "driver/Transpiler.h"

using namespace unihir;
using unihir::driver::Transpiler;

TEST(DiagnosticFromMessage, SplitsLocation) {
  const auto d = Transpiler::diagnostic_from_message("src/a.py:3:7: unsupported statement 'while'");
  EXPECT_EQ(d.file, "src/a.py");
  EXPECT_EQ(d.line, 3);
  EXPECT_EQ(d.col, 7);
  EXPECT_EQ(d.message, "unsupported statement 'while'");
  EXPECT_EQ(d.severity, diag::Severity::Error);
}

TEST(DiagnosticFromMessage, PlainMessageKeptWhole) {
  for (const char* msg : {"Cannot match Python function 'f' with C function 'g'", "a.py: no call found",
                          "a.py:0:1: zero line", "a.py:x:1: bad"}) {
    const auto d = Transpiler::diagnostic_from_message(msg);
    EXPECT_TRUE(d.file.empty()) << msg;
    EXPECT_EQ(d.message, msg);
  }
}

TEST(PrintError, PlainWithoutLocation) {
  std::ostringstream err;
  Transpiler::print_error(diag::Diagnostic{"dropped argument", {}, 0, 0, diag::Severity::Warning}, false, 1, err);
  EXPECT_EQ(err.str(), "warning: dropped argument\n");
}

TEST(PrintError, SourceContextWithCaret) {
  const auto path = std::filesystem::temp_directory_path() / "unihir_print_error_ctx.py";
  {
    std::ofstream f(path);
    f << "a()\nb()\n  c(\nd()\ne()\n";
  }
  const diag::Diagnostic d{"unterminated call", path.string(), 3, 4, diag::Severity::Error};
  std::ostringstream err;
  Transpiler::print_error(d, false, 1, err);
  EXPECT_EQ(err.str(), path.string() + ":3:4: error: unterminated call\n"
                                       "  b()\n"
                                       "    c(\n"
                                       "     ^\n"
                                       "  d()\n");
  std::ostringstream none;
  Transpiler::print_error(d, false, 0, none);
  EXPECT_EQ(none.str(), path.string() + ":3:4: error: unterminated call\n    c(\n     ^\n");
  std::filesystem::remove(path);
}

TEST(PrintError, ColorLabels) {
  std::ostringstream err;
  Transpiler::print_error(diag::Diagnostic{"boom", "x.c", 1, 1, diag::Severity::Error}, true, 0, err);
  EXPECT_EQ(err.str().rfind("\033[1mx.c:1:1: \033[0m\033[31merror: \033[0mboom\n", 0), 0u);

  std::ostringstream warn;
  Transpiler::print_error(diag::Diagnostic{"hmm", {}, 0, 0, diag::Severity::Warning}, true, 0, warn);
  EXPECT_EQ(warn.str(), "\033[33mwarning: \033[0mhmm\n");
}

TEST(ColorSelection, ExplicitModesAndEnvironment) {
  EXPECT_TRUE(Transpiler::resolve_color(cli::ColorMode::Always));
  EXPECT_FALSE(Transpiler::resolve_color(cli::ColorMode::Never));

  ::setenv("UNIHIR_COLOR", "Yes", 1);
  EXPECT_TRUE(Transpiler::use_env_color());
  EXPECT_TRUE(Transpiler::resolve_color(cli::ColorMode::Auto));
  ::setenv("UNIHIR_COLOR", "0", 1);
  EXPECT_FALSE(Transpiler::use_env_color());
  ::unsetenv("UNIHIR_COLOR");
  EXPECT_FALSE(Transpiler::use_env_color());
}

TEST(PatternsListing, NumbersEveryEntry) {
  const std::string text = Transpiler::patterns_listing();
  EXPECT_EQ(text.rfind("Supported patterns:\n", 0), 0u);
  EXPECT_NE(text.find("  1. len() + list_length() -> Vec::len() : usize (min args 1)\n"), std::string::npos);
  EXPECT_NE(text.find("  2. append() + PyList_Append() -> Vec::push() : () (min args 2)\n"), std::string::npos);
  EXPECT_NE(text.find("  11. keys() + PyDict_Keys() -> HashMap::keys()"), std::string::npos);
}

TEST(WriteFile, ReportsFailure) {
  std::ostringstream err;
  EXPECT_FALSE(Transpiler::write_file_or_report("/nonexistent/unihir/dir/out.rs", "x", err));
  EXPECT_EQ(err.str().rfind("unihir: ", 0), 0u);
}
