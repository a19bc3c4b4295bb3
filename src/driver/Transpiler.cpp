/***
 * Name: unihir::driver::Transpiler::run
 * Purpose: Execute the transpilation pipeline end-to-end.
 */
#include "driver/Transpiler.h"
#include "cli/Options.h"
#include "debugger/Breakpoint.h"
#include "debugger/Phase.h"
#include "debugger/Repl.h"
#include "debugger/Stepper.h"
#include "diag/Diagnostic.h"
#include "hir/Equality.h"
#include "observability/HirPrinter.h"
#include "observability/Metrics.h"
#include "unihir/exceptions/unihir_exception.h"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace unihir::driver {

namespace {

std::string timestamp_prefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
  localtime_r(&tsTime, &tmBuf);
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

// Creates the log directory when missing; false when it cannot be used.
bool prepare_log_dir(const std::string& logDir, std::ostream& err) {
  std::error_code errCode;
  namespace fs = std::filesystem;
  if (fs::exists(logDir, errCode)) { return true; }
  if (!fs::create_directories(logDir, errCode) && !fs::exists(logDir, errCode)) {
    err << "unihir: failed to create log directory '" << logDir << "': " << errCode.message() << "\n";
    return false;
  }
  return true;
}

void write_log(const std::string& path, const std::string& text, std::ostream& err) {
  std::ofstream file(path);
  file << text;
  if (!file.good()) { err << "unihir: failed to write log '" << path << "'\n"; }
}

int run_debugger(debugger::Stepper& stepper, const cli::Options& opts, std::istream& in, std::ostream& out,
                 std::ostream& err, const bool color) {
  for (const auto& spec : opts.breakpoints) {
    std::string parseErr;
    auto bp = debugger::parseBreakpointSpec(spec, parseErr);
    if (!bp) {
      err << "unihir: " << parseErr << "\n";
      return 2;
    }
    stepper.addBreakpoint(std::move(*bp));
  }
  debugger::Repl repl(stepper, in, out, color);
  const int commands = repl.run();
  if (!opts.metrics && !opts.metricsJson) { return 0; }

  obs::Metrics metrics;
  metrics.setGauge(obs::kDebuggerCommands, static_cast<uint64_t>(commands));
  metrics.setGauge(obs::kDebuggerSteps, static_cast<uint64_t>(stepper.state().stepCount));
  out << (opts.metricsJson ? metrics.summaryJson() : metrics.summaryText());
  return 0;
}

} // namespace

int Transpiler::run(const cli::Options& opts) { return run(opts, std::cin, std::cout, std::cerr); }

int Transpiler::run(const cli::Options& opts, std::istream& in, std::ostream& out, std::ostream& err) { // NOLINT(readability-function-size)
  if (opts.listPatterns) {
    out << patterns_listing();
    return 0;
  }
  if (!opts.visualizeFile.empty()) {
    try {
      out << visualize_source(opts.visualizeFile);
    } catch (const exceptions::UnihirException& ex) {
      print_error(diagnostic_from_message(ex.what()), resolve_color(opts.color), opts.diagContext, err);
      return 1;
    }
    return 0;
  }
  if (opts.pythonFile.empty() || opts.cFile.empty()) {
    err << "unihir: expected one .py file and one .c file\n";
    return 2;
  }

  const bool color = resolve_color(opts.color);
  debugger::Stepper stepper(opts.pythonFile, opts.cFile);
  if (opts.debug) { return run_debugger(stepper, opts, in, out, err, color); }

  obs::Metrics metrics;
  while (stepper.state().phase != debugger::Phase::Complete) {
    const auto target = debugger::next(stepper.state().phase);
    const std::string timer = target ? debugger::to_string(*target) : "Step";
    metrics.start(timer);
    const auto outcome = stepper.step();
    metrics.stop(timer);
    if (outcome.status == debugger::StepStatus::Failed || outcome.status == debugger::StepStatus::Blocked) {
      auto failure = diagnostic_from_message(outcome.message);
      print_error(failure, color, opts.diagContext, err);
      err << "unihir: phase '" << debugger::to_string(outcome.phase) << "' failed\n";
      return 1;
    }
    if (outcome.status == debugger::StepStatus::NothingToDo) { break; }
  }

  const auto& state = stepper.state();
  for (const auto& d : state.diagnostics) { print_error(d, color, opts.diagContext, err); }

  // Optional log directory creation
  bool logsEnabled = false;
  const std::string logDir = opts.logPath.empty() ? std::string(".") : opts.logPath;
  const std::string tsPrefix = timestamp_prefix();
  if (opts.logHir || opts.metrics || opts.metricsJson) { logsEnabled = prepare_log_dir(logDir, err); }

  obs::HirPrinter printer;
  const auto before = printer.print(*state.unifiedHir);
  const auto after = printer.print(*state.optimizedHir);
  if (opts.hirLog == cli::HirLogMode::Before || opts.hirLog == cli::HirLogMode::Both) {
    out << "== Unified HIR (before opt) ==\n" << before;
  }
  if (opts.hirLog == cli::HirLogMode::After || opts.hirLog == cli::HirLogMode::Both) {
    out << "== Unified HIR (after opt) ==\n" << after;
  }
  if (logsEnabled && opts.logHir) {
    write_log(logDir + "/" + tsPrefix + "hir.before.hir.log", before, err);
    write_log(logDir + "/" + tsPrefix + "hir.after.hir.log", after, err);
  }

  const std::string& rust = *state.generatedText;
  if (opts.outputFile.empty()) {
    out << rust << "\n";
  } else if (!write_file_or_report(opts.outputFile, rust + "\n", err)) {
    return 1;
  }

  if (!opts.metrics && !opts.metricsJson) { return 0; }

  metrics.setHirGeometry({static_cast<uint64_t>(hir::countNodes(*state.optimizedHir)),
                          static_cast<uint64_t>(hir::maxDepth(*state.optimizedHir))});
  metrics.setCounter(obs::kUnifyMatched, 1);
  metrics.setCounter(obs::kUnifyDiagnostics, static_cast<uint64_t>(state.diagnostics.size()));
  uint64_t eliminated = 0;
  for (const auto& t : state.history) { eliminated += static_cast<uint64_t>(t.boundariesEliminated); }
  metrics.setCounter(obs::kBoundariesEliminated, eliminated);
  for (const auto& [key, value] : state.optimizerStats) { metrics.setOptimizerStat(key, value); }
  metrics.setGauge(obs::kCodegenBytes, static_cast<uint64_t>(rust.size()));
  metrics.setGauge(obs::kDebuggerSteps, static_cast<uint64_t>(state.stepCount));

  // - With --metrics-json: JSON only
  // - With --metrics: human-readable text, then JSON for tool consumption
  const auto jsonSummary = metrics.summaryJson();
  if (opts.metricsJson) {
    out << jsonSummary;
  } else {
    out << metrics.summaryText();
    out << jsonSummary;
  }
  const std::string metricsPath = logsEnabled ? (logDir + "/" + tsPrefix + "metrics.json")
                                              : (std::string("./") + tsPrefix + "metrics.json");
  write_log(metricsPath, jsonSummary, err);
  return 0;
}

} // namespace unihir::driver
