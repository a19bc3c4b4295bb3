/***
 * Name: test_parse_args
 * Purpose: Command-line parsing: accepted forms, input pairing and usage errors.
 */
#include <gtest/gtest.h>
#include "cli/ParseArgs.h"
#include "cli/ParseArgsInternals.h"
#include "unihir/exceptions/config_error.h"

using namespace unihir::cli;

template <size_t N>
static bool parse(const char* (&argv)[N], Options& o) {
  return ParseArgs(static_cast<int>(N), const_cast<char**>(argv), o);
}

TEST(ParseArgs, PairsInputsByExtension) {
  const char* argv[] = {"unihir", "listobject.c", "-o", "out.rs", "lists.py"};
  Options o;
  ASSERT_TRUE(parse(argv, o));
  EXPECT_EQ(o.pythonFile, "lists.py");
  EXPECT_EQ(o.cFile, "listobject.c");
  EXPECT_EQ(o.outputFile, "out.rs");
  EXPECT_EQ(o.inputs.size(), 2u);
}

TEST(ParseArgs, OutputSpellings) {
  const char* attached[] = {"unihir", "-oout.rs", "a.py", "b.c"};
  const char* longForm[] = {"unihir", "--output=gen/out.rs", "a.py", "b.c"};
  const char* emptyLong[] = {"unihir", "--output=", "a.py", "b.c"};
  Options o1, o2, o3;
  ASSERT_TRUE(parse(attached, o1));
  EXPECT_EQ(o1.outputFile, "out.rs");
  ASSERT_TRUE(parse(longForm, o2));
  EXPECT_EQ(o2.outputFile, "gen/out.rs");
  EXPECT_FALSE(parse(emptyLong, o3));
}

TEST(ParseArgs, HeaderCountsAsC) {
  const char* argv[] = {"unihir", "a.py", "listobject.h"};
  Options o;
  ASSERT_TRUE(parse(argv, o));
  EXPECT_EQ(o.cFile, "listobject.h");
}

TEST(ParseArgs, Defaults) {
  const char* argv[] = {"unihir", "a.py", "b.c"};
  Options o;
  ASSERT_TRUE(parse(argv, o));
  EXPECT_FALSE(o.debug);
  EXPECT_TRUE(o.outputFile.empty());
  EXPECT_EQ(o.color, ColorMode::Auto);
  EXPECT_EQ(o.diagContext, 1);
  EXPECT_EQ(o.hirLog, HirLogMode::None);
  EXPECT_EQ(o.logPath, ".");
}

TEST(ParseArgs, HelpAndPatternsNeedNoInputs) {
  const char* help[] = {"unihir", "--help"};
  Options h;
  ASSERT_TRUE(parse(help, h));
  EXPECT_TRUE(h.showHelp);

  const char* patterns[] = {"unihir", "--patterns"};
  Options p;
  ASSERT_TRUE(parse(patterns, p));
  EXPECT_TRUE(p.listPatterns);
}

TEST(ParseArgs, VisualizeTakesOneSourceFile) {
  const char* py[] = {"unihir", "--visualize=lists.py"};
  Options o1;
  ASSERT_TRUE(parse(py, o1));
  EXPECT_EQ(o1.visualizeFile, "lists.py");
  EXPECT_TRUE(o1.pythonFile.empty());

  const char* header[] = {"unihir", "--visualize=listobject.h"};
  Options o2;
  ASSERT_TRUE(parse(header, o2));
  EXPECT_EQ(o2.visualizeFile, "listobject.h");

  const char* badExt[] = {"unihir", "--visualize=notes.txt"};
  const char* extraInput[] = {"unihir", "--visualize=a.py", "b.c"};
  const char* withDebug[] = {"unihir", "--visualize=a.py", "--debug"};
  Options o3;
  Options o4;
  Options o5;
  EXPECT_FALSE(parse(badExt, o3));
  EXPECT_FALSE(parse(extraInput, o4));
  EXPECT_FALSE(parse(withDebug, o5));
}

TEST(ParseArgs, ValuedOptions) {
  const char* argv[] = {"unihir", "--hir-log=both", "--color=never", "--diag-context=3", "--log-path=/tmp/l",
                        "--log-hir", "--metrics", "--metrics-json", "a.py", "b.c"};
  Options o;
  ASSERT_TRUE(parse(argv, o));
  EXPECT_EQ(o.hirLog, HirLogMode::Both);
  EXPECT_EQ(o.color, ColorMode::Never);
  EXPECT_EQ(o.diagContext, 3);
  EXPECT_EQ(o.logPath, "/tmp/l");
  EXPECT_TRUE(o.logHir);
  EXPECT_TRUE(o.metrics);
  EXPECT_TRUE(o.metricsJson);
}

TEST(ParseArgs, BareHirLogMeansBefore) {
  const char* argv[] = {"unihir", "--hir-log", "a.py", "b.c"};
  Options o;
  ASSERT_TRUE(parse(argv, o));
  EXPECT_EQ(o.hirLog, HirLogMode::Before);
}

TEST(ParseArgs, DebugWithBreakpoints) {
  const char* argv[] = {"unihir", "--debug", "--break=boundary", "--break=phase:optimized", "a.py", "b.c"};
  Options o;
  ASSERT_TRUE(parse(argv, o));
  EXPECT_TRUE(o.debug);
  ASSERT_EQ(o.breakpoints.size(), 2u);
  EXPECT_EQ(o.breakpoints[1], "phase:optimized");
}

TEST(ParseArgs, DoubleDashEndsOptions) {
  const char* argv[] = {"unihir", "--", "-weird.py", "b.c"};
  Options o;
  ASSERT_TRUE(parse(argv, o));
  EXPECT_EQ(o.pythonFile, "-weird.py");
}

TEST(ParseArgs, UsageErrors) {
  const char* unknown[] = {"unihir", "--frobnicate", "a.py", "b.c"};
  const char* oneInput[] = {"unihir", "a.py"};
  const char* twoPy[] = {"unihir", "a.py", "b.py", "c.c"};
  const char* badExt[] = {"unihir", "a.py", "b.rs"};
  const char* badColor[] = {"unihir", "--color=sometimes", "a.py", "b.c"};
  const char* badHirLog[] = {"unihir", "--hir-log=during", "a.py", "b.c"};
  const char* badContext[] = {"unihir", "--diag-context=-1", "a.py", "b.c"};
  const char* badBreak[] = {"unihir", "--debug", "--break=watch:x", "a.py", "b.c"};
  const char* dangling[] = {"unihir", "a.py", "b.c", "-o"};
  Options o1, o2, o3, o4, o5, o6, o7, o8, o9;
  EXPECT_FALSE(parse(unknown, o1));
  EXPECT_FALSE(parse(oneInput, o2));
  EXPECT_FALSE(parse(twoPy, o3));
  EXPECT_FALSE(parse(badExt, o4));
  EXPECT_FALSE(parse(badColor, o5));
  EXPECT_FALSE(parse(badHirLog, o6));
  EXPECT_FALSE(parse(badContext, o7));
  EXPECT_FALSE(parse(badBreak, o8));
  EXPECT_FALSE(parse(dangling, o9));
}

TEST(ParseArgs, Conflicts) {
  const char* debugAndOut[] = {"unihir", "--debug", "-o", "x.rs", "a.py", "b.c"};
  const char* breakWithoutDebug[] = {"unihir", "--break=boundary", "a.py", "b.c"};
  Options o1, o2;
  EXPECT_FALSE(parse(debugAndOut, o1));
  EXPECT_FALSE(parse(breakWithoutDebug, o2));
}

TEST(ParseArgsInternals, ValueParsers) {
  using namespace unihir::cli::detail;
  EXPECT_EQ(parseHirLogValue("after"), HirLogMode::After);
  EXPECT_EQ(parseColorValue("always"), ColorMode::Always);
  EXPECT_EQ(parseDiagContextValue("0"), 0);
  EXPECT_THROW(parseDiagContextValue(""), unihir::exceptions::ConfigError);
  EXPECT_THROW(parseDiagContextValue("2x"), unihir::exceptions::ConfigError);
  try {
    parseColorValue("sometimes");
    FAIL() << "expected ConfigError";
  } catch (const unihir::exceptions::ConfigError& ex) {
    EXPECT_STREQ(ex.what(), "invalid --color value 'sometimes' (expected always|never|auto)");
  }
}

TEST(ParseArgsInternals, ConflictMessages) {
  using namespace unihir::cli::detail;
  Options o;
  o.debug = true;
  o.outputFile = "x.rs";
  EXPECT_EQ(conflictingModes(o), "cannot use --debug and -o together");
  Options b;
  b.breakpoints.emplace_back("boundary");
  EXPECT_EQ(conflictingModes(b), "--break requires --debug");
  EXPECT_TRUE(conflictingModes(Options{}).empty());
}

TEST(ParseArgsInternals, OptionLikeArguments) {
  using namespace unihir::cli::detail;
  EXPECT_TRUE(isUnknownOptionArg("-x"));
  EXPECT_TRUE(isUnknownOptionArg("--nope"));
  EXPECT_FALSE(isUnknownOptionArg("-"));
  EXPECT_FALSE(isUnknownOptionArg("a.py"));
}
