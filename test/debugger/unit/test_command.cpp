/***
 * Name: test_command
 * Purpose: Debugger command-line parsing, including aliases and errors.
 */
#include <gtest/gtest.h>
#include "debugger/Command.h"

using namespace unihir::debugger;

static Command parseOk(const char* line) {
  Command cmd;
  std::string err;
  EXPECT_TRUE(parseCommand(line, cmd, err)) << line << ": " << err;
  return cmd;
}

static std::string parseErr(const char* line) {
  Command cmd;
  std::string err;
  EXPECT_FALSE(parseCommand(line, cmd, err)) << line;
  return err;
}

TEST(DebuggerCommand, EmptyLineSteps) {
  EXPECT_EQ(parseOk("").kind, Command::Kind::Step);
  EXPECT_EQ(parseOk("   ").kind, Command::Kind::Step);
}

TEST(DebuggerCommand, Aliases) {
  EXPECT_EQ(parseOk("s").kind, Command::Kind::Step);
  EXPECT_EQ(parseOk("STEP").kind, Command::Kind::Step);
  EXPECT_EQ(parseOk("c").kind, Command::Kind::Continue);
  EXPECT_EQ(parseOk("v").kind, Command::Kind::Visualize);
  EXPECT_EQ(parseOk("l").kind, Command::Kind::List);
  EXPECT_EQ(parseOk("?").kind, Command::Kind::Help);
  EXPECT_EQ(parseOk("h").kind, Command::Kind::Help);
  EXPECT_EQ(parseOk("exit").kind, Command::Kind::Quit);
  EXPECT_EQ(parseOk("q").kind, Command::Kind::Quit);
}

TEST(DebuggerCommand, InspectTarget) {
  const auto cmd = parseOk("i rust");
  EXPECT_EQ(cmd.kind, Command::Kind::Inspect);
  EXPECT_EQ(cmd.target, "rust");
}

TEST(DebuggerCommand, BreakForms) {
  auto b = parseOk("break boundary");
  ASSERT_TRUE(b.breakpoint.has_value());
  EXPECT_EQ(*b.breakpoint, Breakpoint::boundary());

  auto p = parseOk("b phase Unified HIR");
  ASSERT_TRUE(p.breakpoint.has_value());
  EXPECT_EQ(*p.breakpoint, Breakpoint::phase("Unified HIR"));

  auto f = parseOk("break fn count");
  ASSERT_TRUE(f.breakpoint.has_value());
  EXPECT_EQ(*f.breakpoint, Breakpoint::function("count"));
}

TEST(DebuggerCommand, ClearIndex) {
  const auto cmd = parseOk("clear 2");
  EXPECT_EQ(cmd.kind, Command::Kind::Clear);
  EXPECT_EQ(cmd.index, 2u);
}

TEST(DebuggerCommand, Errors) {
  EXPECT_EQ(parseErr("inspect"), "inspect requires a target");
  EXPECT_EQ(parseErr("break"), "break requires a breakpoint type");
  EXPECT_EQ(parseErr("break phase"), "break phase requires phase name");
  EXPECT_EQ(parseErr("break function"), "break function requires function name");
  EXPECT_EQ(parseErr("break watch x"), "Unknown breakpoint type: 'watch'");
  EXPECT_EQ(parseErr("clear"), "clear requires breakpoint number");
  EXPECT_EQ(parseErr("clear two"), "Invalid breakpoint number");
  EXPECT_EQ(parseErr("jump"), "Unknown command: 'jump'. Type 'help' for commands.");
}
