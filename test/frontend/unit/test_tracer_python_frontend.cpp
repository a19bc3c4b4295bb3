/***
 * Name: test_tracer_python_frontend
 * Purpose: Lower tracer-style Python into Python HIR and reject the rest.
 */
#include <gtest/gtest.h>
#include "frontend/TracerPythonFrontend.h"
#include "unihir/exceptions/frontend_error.h"

using namespace unihir;

static std::unique_ptr<pyhir::Module> lowerPy(const char* src, const char* file = "pkg/lists.py") {
  frontend::TracerPythonFrontend fe;
  return fe.lower(src, file);
}

TEST(TracerPythonFrontend, FunctionReturningCall) {
  const auto mod = lowerPy(
      "import os\n"
      "def count(items: List[int]) -> int:\n"
      "    return len(items)\n");
  EXPECT_EQ(mod->name, "lists");
  ASSERT_EQ(mod->body.size(), 1u);
  ASSERT_EQ(mod->body[0]->kind, pyhir::NodeKind::Function);
  const auto& fn = static_cast<const pyhir::Function&>(*mod->body[0]);
  EXPECT_EQ(fn.name, "count");
  ASSERT_EQ(fn.params.size(), 1u);
  EXPECT_EQ(fn.params[0].name, "items");
  ASSERT_TRUE(fn.params[0].annotation.has_value());
  EXPECT_EQ(*fn.params[0].annotation, hir::Type::pyList(hir::Type::pyInt()));

  const auto* call = pyhir::firstCall(*mod);
  ASSERT_NE(call, nullptr);
  ASSERT_EQ(call->callee->kind, pyhir::NodeKind::Variable);
  EXPECT_EQ(static_cast<const pyhir::Variable&>(*call->callee).name, "len");
  ASSERT_EQ(call->args.size(), 1u);
  const auto& arg = static_cast<const pyhir::Variable&>(*call->args[0]);
  EXPECT_EQ(arg.name, "items");
  ASSERT_TRUE(arg.inferredType.has_value());
  EXPECT_EQ(*arg.inferredType, hir::Type::pyList(hir::Type::pyInt()));
  ASSERT_TRUE(call->meta.source.has_value());
  EXPECT_EQ(call->meta.source->line, 3);
}

TEST(TracerPythonFrontend, MethodCallAtModuleLevel) {
  const auto mod = lowerPy("my_vector.append(item)\n");
  const auto* call = pyhir::firstCall(*mod);
  ASSERT_NE(call, nullptr);
  ASSERT_EQ(call->callee->kind, pyhir::NodeKind::Attribute);
  const auto& attr = static_cast<const pyhir::Attribute&>(*call->callee);
  EXPECT_EQ(attr.attr, "append");
  EXPECT_EQ(static_cast<const pyhir::Variable&>(*attr.object).name, "my_vector");
  ASSERT_EQ(call->args.size(), 1u);
}

TEST(TracerPythonFrontend, OneLineDefAndLiterals) {
  const auto mod = lowerPy("def f(xs): return xs.insert(-1, 'a')\n");
  const auto* call = pyhir::firstCall(*mod);
  ASSERT_NE(call, nullptr);
  ASSERT_EQ(call->args.size(), 2u);
  const auto& idx = static_cast<const pyhir::Literal&>(*call->args[0]);
  EXPECT_EQ(idx.value, hir::LiteralValue::ofInt(-1));
  const auto& text = static_cast<const pyhir::Literal&>(*call->args[1]);
  EXPECT_EQ(text.value, hir::LiteralValue::ofStr("a"));
}

TEST(TracerPythonFrontend, ReturnInFunctionWinsOverModuleCall) {
  const auto mod = lowerPy(
      "print(x)\n"
      "def g(d):\n"
      "    pass\n"
      "    return d.keys()\n");
  const auto* call = pyhir::firstCall(*mod);
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->callee->kind, pyhir::NodeKind::Attribute);
}

TEST(TracerPythonFrontend, IdsAreUniqueWithinModule) {
  const auto mod = lowerPy("def f(a):\n    return a.pop()\n");
  const auto* call = pyhir::firstCall(*mod);
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(pyhir::findById(*mod, call->id), call);
  EXPECT_NE(call->id, mod->id);
  EXPECT_TRUE(mod->id.valid());
}

TEST(TracerPythonFrontend, RejectsUnsupportedStatements) {
  EXPECT_THROW((void)lowerPy("if x:\n    f()\n"), exceptions::FrontendError);
  EXPECT_THROW((void)lowerPy("x = f()\n"), exceptions::FrontendError);
  EXPECT_THROW((void)lowerPy("f(key=1)\n"), exceptions::FrontendError);
  EXPECT_THROW((void)lowerPy("def f(a=1):\n    pass\n"), exceptions::FrontendError);
  EXPECT_THROW((void)lowerPy("return f()\n"), exceptions::FrontendError);
  EXPECT_THROW((void)lowerPy("def f():\n    def g():\n        pass\n"), exceptions::FrontendError);
}

TEST(TracerPythonFrontend, ErrorCarriesLocation) {
  try {
    (void)lowerPy("f()\nwhile True:\n    f()\n", "w.py");
    FAIL() << "expected FrontendError";
  } catch (const exceptions::FrontendError& ex) {
    EXPECT_STREQ(ex.what(), "w.py:2:1: unsupported statement 'while'");
  }
}
