/***
 * Name: unihir::obs::Metrics
 * Purpose: Collect per-phase timings, unified HIR geometry and counters.
 * Inputs:
 *   - Calls to start/stop timers for named phases.
 *   - Geometry of the unified tree and counters recorded by the driver.
 * Outputs:
 *   - Human-readable text and JSON summaries, plus derived hints.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   phase names to microseconds. Formatting is performed on demand.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace unihir::obs {

struct HirGeometry {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
};

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void setHirGeometry(HirGeometry g) { geom_ = g; }
  const std::optional<HirGeometry>& hirGeometry() const { return geom_; }

  void setOptimizerStat(const std::string& key, uint64_t value) { optimizerStats_[key] = value; }
  const std::unordered_map<std::string, uint64_t>& optimizerStats() const { return optimizerStats_; }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  const std::map<std::string, uint64_t>& counters() const { return counters_; }
  const std::map<std::string, uint64_t>& gauges() const { return gauges_; }
  const std::map<std::string, uint64_t>& durationsUs() const { return durations_us_; }

  std::string summaryText() const;
  std::string summaryJson() const;
  std::vector<std::string> hints() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::optional<HirGeometry> geom_{};
  std::unordered_map<std::string, uint64_t> optimizerStats_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

// Counter keys recorded by the driver.
inline constexpr const char* kUnifyMatched = "unify.matched";
inline constexpr const char* kUnifyDiagnostics = "unify.diagnostics";
inline constexpr const char* kBoundariesEliminated = "opt.boundaries_eliminated";
inline constexpr const char* kCodegenBytes = "codegen.bytes";
inline constexpr const char* kDebuggerSteps = "debugger.steps";
inline constexpr const char* kDebuggerCommands = "debugger.commands";

} // namespace unihir::obs
