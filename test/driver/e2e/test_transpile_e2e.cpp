/***
 * Name: test_transpile_e2e
 * Purpose: Whole runs from source files on disk to Rust text and exit codes.
 * Inputs: Temporary .py/.c files written per test
 * Outputs: Assertions on stdout/stderr text and return codes
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include "cli/Options.h"
#include "driver/Transpiler.h"

using namespace unihir;
using unihir::driver::Transpiler;
namespace fs = std::filesystem;

namespace {

class TranspileE2E : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() / ("unihir_e2e_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }
  void TearDown() override { fs::remove_all(dir_); }

  std::string write(const std::string& name, const std::string& text) const {
    const auto path = dir_ / name;
    std::ofstream f(path);
    f << text;
    return path.string();
  }

  cli::Options options(const std::string& py, const std::string& c) const {
    cli::Options o;
    o.pythonFile = write("input.py", py);
    o.cFile = write("input.c", c);
    o.color = cli::ColorMode::Never;
    o.logPath = (dir_ / "logs").string();
    return o;
  }

  int run(const cli::Options& o, const std::string& input = {}) {
    std::istringstream in(input);
    return Transpiler::run(o, in, out_, err_);
  }

  fs::path dir_;
  std::ostringstream out_;
  std::ostringstream err_;
};

} // namespace

TEST_F(TranspileE2E, AppendBecomesPush) {
  const auto o = options("my_vector.append(item)\n", "int PyList_Append(PyObject *list, PyObject *item);\n");
  EXPECT_EQ(run(o), 0);
  EXPECT_EQ(out_.str(), "my_vector.push(item)\n");
  EXPECT_EQ(err_.str(), "");
}

TEST_F(TranspileE2E, LenInsideFunction) {
  const auto o = options("def count(my_list):\n    return len(my_list)\n",
                         "static PyObject *\nlist_length(PyListObject *self)\n{\n    return NULL;\n}\n");
  EXPECT_EQ(run(o), 0);
  EXPECT_EQ(out_.str(), "my_list.len()\n");
}

TEST_F(TranspileE2E, CallAsFirstArgumentKeepsPlaceholderReceiver) {
  const auto o = options("append(get_list(), item)\n", "int PyList_Append(PyObject* l, PyObject* x);\n");
  EXPECT_EQ(run(o), 0);
  EXPECT_EQ(out_.str(), "x.push(item)\n");
  EXPECT_NE(err_.str().find("argument 1 (Call) dropped"), std::string::npos);
}

TEST_F(TranspileE2E, OutputFile) {
  auto o = options("d.get(key)\n", "PyObject *PyDict_GetItem(PyObject *dict, PyObject *key);\n");
  o.outputFile = (dir_ / "out.rs").string();
  EXPECT_EQ(run(o), 0);
  EXPECT_EQ(out_.str(), "");
  std::ifstream f(o.outputFile);
  std::stringstream contents;
  contents << f.rdbuf();
  EXPECT_EQ(contents.str(), "d.get(&key)\n");
}

TEST_F(TranspileE2E, UnknownPairFails) {
  const auto o = options("frobnicate(x)\n", "int do_frob(void);\n");
  EXPECT_EQ(run(o), 1);
  EXPECT_EQ(out_.str(), "");
  const std::string e = err_.str();
  EXPECT_NE(e.find("error: Cannot match Python function 'frobnicate' with C function 'do_frob'"), std::string::npos);
  EXPECT_NE(e.find("unihir: phase 'Unified HIR' failed\n"), std::string::npos);
}

TEST_F(TranspileE2E, FrontendErrorShowsSource) {
  const auto o = options("f()\nwhile True:\n    f()\n", "int list_clear(PyListObject *a);\n");
  EXPECT_EQ(run(o), 1);
  const std::string e = err_.str();
  EXPECT_NE(e.find(o.pythonFile + ":2:1: error: unsupported statement 'while'\n  f()\n  while True:\n  ^\n"),
            std::string::npos);
  EXPECT_NE(e.find("unihir: phase 'Python HIR' failed\n"), std::string::npos);
}

TEST_F(TranspileE2E, MissingInputFails) {
  cli::Options o;
  o.pythonFile = (dir_ / "absent.py").string();
  o.cFile = write("input.c", "int list_clear(PyListObject *a);\n");
  o.color = cli::ColorMode::Never;
  EXPECT_EQ(run(o), 1);
  EXPECT_NE(err_.str().find("unihir: phase 'Python Parsed' failed\n"), std::string::npos);
}

TEST_F(TranspileE2E, MissingSideIsUsageError) {
  cli::Options o;
  o.pythonFile = "a.py";
  EXPECT_EQ(run(o), 2);
}

TEST_F(TranspileE2E, PatternsListing) {
  cli::Options o;
  o.listPatterns = true;
  EXPECT_EQ(run(o), 0);
  EXPECT_EQ(out_.str().rfind("Supported patterns:\n", 0), 0u);
}

TEST_F(TranspileE2E, HirDumpBeforeAndAfter) {
  auto o = options("xs.reverse()\n", "static PyObject *list_reverse(PyListObject *self);\n");
  o.hirLog = cli::HirLogMode::Both;
  EXPECT_EQ(run(o), 0);
  const std::string s = out_.str();
  const auto before = s.find("== Unified HIR (before opt) ==\nCall Vec::reverse");
  const auto after = s.find("== Unified HIR (after opt) ==\nCall Vec::reverse");
  ASSERT_NE(before, std::string::npos);
  ASSERT_NE(after, std::string::npos);
  EXPECT_LT(before, after);
  EXPECT_NE(s.find("boundary=present"), std::string::npos);
  EXPECT_NE(s.find("boundary=eliminated"), std::string::npos);
  EXPECT_EQ(s.substr(s.size() - 13), "xs.reverse()\n");
}

TEST_F(TranspileE2E, MetricsJsonAndHirLogFiles) {
  auto o = options("xs.clear()\n", "int list_clear(PyListObject *a);\n");
  o.metricsJson = true;
  o.logHir = true;
  EXPECT_EQ(run(o), 0);
  const std::string s = out_.str();
  EXPECT_EQ(s.rfind("xs.clear()\n{\n", 0), 0u);
  EXPECT_NE(s.find("\"python_parsed\": "), std::string::npos);
  EXPECT_NE(s.find("\"rust_generated\": "), std::string::npos);
  EXPECT_NE(s.find("\"opt.boundaries_eliminated\": 1"), std::string::npos);
  EXPECT_NE(s.find("\"debugger.steps\": 8"), std::string::npos);
  EXPECT_NE(s.find("\"boundary_elimination.boundaries_eliminated\": 1"), std::string::npos);

  size_t before = 0, after = 0, metrics = 0;
  for (const auto& entry : fs::directory_iterator(dir_ / "logs")) {
    const std::string name = entry.path().filename().string();
    if (name.find("hir.before.hir.log") != std::string::npos) { ++before; }
    if (name.find("hir.after.hir.log") != std::string::npos) { ++after; }
    if (name.find("metrics.json") != std::string::npos) { ++metrics; }
  }
  EXPECT_EQ(before, 1u);
  EXPECT_EQ(after, 1u);
  EXPECT_EQ(metrics, 1u);
}

TEST_F(TranspileE2E, DebugSessionReadsCommands) {
  auto o = options("xs.pop()\n", "static PyObject *list_pop(PyListObject *self, PyObject *args);\n");
  o.debug = true;
  o.breakpoints = {"boundary"};
  EXPECT_EQ(run(o, "list\ncontinue\ninspect rust\ncontinue\ninspect rust\nquit\n"), 0);
  const std::string s = out_.str();
  EXPECT_NE(s.find("  [0]: Boundary Elimination\n"), std::string::npos);
  EXPECT_NE(s.find("Breakpoint hit: [0] Boundary Elimination\n"), std::string::npos);
  EXPECT_NE(s.find("Rust code not yet generated\n"), std::string::npos);
  EXPECT_NE(s.find("xs.pop()\n"), std::string::npos);
  EXPECT_NE(s.find("Step: 8  Phase: Complete\n"), std::string::npos);
}

TEST_F(TranspileE2E, DebugSessionReportsCommandCount) {
  auto o = options("xs.pop()\n", "static PyObject *list_pop(PyListObject *self, PyObject *args);\n");
  o.debug = true;
  o.metrics = true;
  EXPECT_EQ(run(o, "step\nstep\nbogus\nquit\n"), 0);
  const std::string s = out_.str();
  EXPECT_NE(s.find("== Metrics ==\n"), std::string::npos);
  EXPECT_NE(s.find("  debugger.commands = 3\n"), std::string::npos);
  EXPECT_NE(s.find("  debugger.steps = 2\n"), std::string::npos);
}

TEST_F(TranspileE2E, VisualizePythonFile) {
  cli::Options o;
  o.visualizeFile = write("lists.py", "def count(my_list):\n    return len(my_list)\n");
  o.color = cli::ColorMode::Never;
  EXPECT_EQ(run(o), 0);
  const std::string s = out_.str();
  EXPECT_EQ(s.rfind("== Python HIR visualization ==\n", 0), 0u);
  EXPECT_NE(s.find("Size: 2 lines\n"), std::string::npos);
  EXPECT_NE(s.find("   1 | def count(my_list):\n"), std::string::npos);
  EXPECT_NE(s.find("   2 |     return len(my_list)\n"), std::string::npos);
  EXPECT_NE(s.find("== Tree ==\n"), std::string::npos);
  EXPECT_NE(s.find("  Top-level items: 1\n"), std::string::npos);
  EXPECT_EQ(s.find("Unifiable call: none"), std::string::npos);
  EXPECT_EQ(err_.str(), "");
}

TEST_F(TranspileE2E, VisualizeCFileReportsCPythonApi) {
  cli::Options o;
  o.visualizeFile = write("listobject.c",
                          "int PyList_Append(PyObject *list, PyObject *item);\n"
                          "PyObject *PyTuple_New(Py_ssize_t size);\n"
                          "static int helper(int a) { return a; }\n");
  o.color = cli::ColorMode::Never;
  EXPECT_EQ(run(o), 0);
  const std::string s = out_.str();
  EXPECT_EQ(s.rfind("== C HIR visualization ==\n", 0), 0u);
  EXPECT_NE(s.find("Size: 3 lines\n"), std::string::npos);
  EXPECT_NE(s.find("PyList_Append"), std::string::npos);
  EXPECT_NE(s.find("== CPython API analysis ==\n"), std::string::npos);
  EXPECT_NE(s.find("  PyList_Append -> Append (append() + PyList_Append() -> Vec::push())\n"), std::string::npos);
  EXPECT_NE(s.find("  PyTuple_New -> no registered pattern\n"), std::string::npos);
  EXPECT_EQ(s.find("  helper ->"), std::string::npos);
}

TEST_F(TranspileE2E, VisualizeWithoutCPythonApi) {
  cli::Options o;
  o.visualizeFile = write("plain.h", "int add(int a, int b);\n");
  EXPECT_EQ(run(o), 0);
  EXPECT_NE(out_.str().find("  No CPython API use detected\n"), std::string::npos);
}

TEST_F(TranspileE2E, VisualizeMissingFileFails) {
  cli::Options o;
  o.visualizeFile = (dir_ / "absent.py").string();
  o.color = cli::ColorMode::Never;
  EXPECT_EQ(run(o), 1);
  EXPECT_EQ(out_.str(), "");
  EXPECT_NE(err_.str().find("absent.py"), std::string::npos);
}
