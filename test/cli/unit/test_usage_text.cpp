/***
 * Name: test_usage_text
 * Purpose: Usage text names the invocation form and every option.
 */
#include <gtest/gtest.h>
#include "cli/Usage.h"

using namespace unihir::cli;

TEST(Usage, ListsOptions) {
  const std::string u = Usage();
  EXPECT_EQ(u.rfind("unihir [options] <file.py> <file.c>", 0), 0u);
  for (const char* flag : {"--help", "-o <file>", "--debug", "--break=", "--patterns", "--metrics", "--metrics-json",
                           "--hir-log", "--log-path=", "--log-hir", "--color=", "--diag-context=", "--visualize="}) {
    EXPECT_NE(u.find(flag), std::string::npos) << flag;
  }
}
