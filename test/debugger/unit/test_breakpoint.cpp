/***
 * Name: test_breakpoint
 * Purpose: Breakpoint descriptions and --break value parsing.
 */
#include <gtest/gtest.h>
#include "debugger/Breakpoint.h"

using namespace unihir::debugger;

TEST(Breakpoint, Describe) {
  EXPECT_EQ(Breakpoint::boundary().describe(), "Boundary Elimination");
  EXPECT_EQ(Breakpoint::phase("Optimized").describe(), "Phase: Optimized");
  EXPECT_EQ(Breakpoint::function("foo").describe(), "Function: foo");
}

TEST(Breakpoint, ParseSpec) {
  std::string err;
  auto b = parseBreakpointSpec("boundary", err);
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(*b, Breakpoint::boundary());

  auto p = parseBreakpointSpec("phase:unified_hir", err);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, Breakpoint::phase("unified_hir"));

  auto f = parseBreakpointSpec("fn:count", err);
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(*f, Breakpoint::function("count"));
}

TEST(Breakpoint, ParseSpecErrors) {
  std::string err;
  EXPECT_FALSE(parseBreakpointSpec("phase", err).has_value());
  EXPECT_EQ(err, "break phase requires a name");
  EXPECT_FALSE(parseBreakpointSpec("boundary:x", err).has_value());
  EXPECT_FALSE(parseBreakpointSpec("watch:x", err).has_value());
  EXPECT_EQ(err, "Unknown breakpoint type: 'watch'");
}
