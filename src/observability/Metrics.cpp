/***
 * Name: unihir::obs::Metrics (impl)
 * Purpose: Implement simple timing and formatting.
 */
#include "observability/Metrics.h"
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace unihir::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kIndent4 = 4;
constexpr uint64_t kLargeOutputBytes = 50000U;
} // namespace

static std::string to_lower_copy(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') { c = static_cast<char>(c - 'A' + 'a'); }
    if (c == ' ') { c = '_'; }
  }
  return s;
}

static void appendDurations(std::ostringstream& oss, const std::map<std::string, uint64_t>& durations) {
  oss << "  \"durations_ms\": {";
  bool first = true;
  for (const auto& [key, val] : durations) {
    if (!first) { oss << ","; }
    first = false;
    const double millis = static_cast<double>(val) / kUsPerMs;
    // JSON uses lowercase phase keys for stability
    oss << "\n    \"" << to_lower_copy(key) << "\": " << std::fixed << std::setprecision(3) << millis;
  }
  oss << "\n  }";
}

static void appendHir(std::ostringstream& oss, const std::optional<HirGeometry>& geom) {
  if (!geom) { return; }
  oss << ",\n  \"hir\": { \"nodes\": " << geom->nodes << ", \"max_depth\": " << geom->maxDepth << " }";
}

template <typename MapT>
static void appendKeyValueObject(std::ostringstream& oss, const MapT& values, int indent) {
  const std::string pad(static_cast<size_t>(indent), ' ');
  bool first = true;
  for (const auto& [key, val] : values) {
    if (!first) { oss << ","; }
    first = false;
    oss << "\n" << pad << "\"" << key << "\": " << val;
  }
}

template <typename MapT>
static void appendSection(std::ostringstream& oss, const char* name, const MapT& values) {
  if (values.empty()) { return; }
  oss << ",\n  \"" << name << "\": {";
  appendKeyValueObject(oss, values, kIndent4);
  oss << "\n  }";
}

void Metrics::start(const std::string& name) {
  active_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  active_.erase(iter);
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "  " << key << ": " << std::fixed << std::setprecision(3) << millis << " ms\n";
  }
  if (geom_) {
    oss << "  HIR: nodes=" << geom_->nodes << ", max_depth=" << geom_->maxDepth << "\n";
  }
  for (const auto& [key, val] : counters_) { oss << "  " << key << " = " << val << "\n"; }
  for (const auto& [key, val] : gauges_) { oss << "  " << key << " = " << val << "\n"; }
  for (const auto& hint : hints()) { oss << "  hint: " << hint << "\n"; }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n";
  appendDurations(oss, durations_us_);
  appendHir(oss, geom_);
  appendSection(oss, "optimizer", optimizerStats_);
  appendSection(oss, "counters", counters_);
  appendSection(oss, "gauges", gauges_);
  auto hs = hints();
  if (!hs.empty()) {
    oss << ",\n  \"hints\": [";
    for (size_t i = 0; i < hs.size(); ++i) {
      if (i != 0) { oss << ", "; }
      oss << "\"" << hs[i] << "\"";
    }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

std::vector<std::string> Metrics::hints() const {
  std::vector<std::string> out;
  auto itDiag = counters_.find(kUnifyDiagnostics);
  if (itDiag != counters_.end() && itDiag->second > 0) { out.emplace_back("unify_diagnostics_present"); }
  auto itElim = counters_.find(kBoundariesEliminated);
  if (itElim != counters_.end()) { out.emplace_back(itElim->second > 0 ? "optimizer_effective" : "optimizer_no_effect"); }
  auto itBytes = gauges_.find(kCodegenBytes);
  if (itBytes != gauges_.end() && itBytes->second > kLargeOutputBytes) { out.emplace_back("large_output"); }
  return out;
}

} // namespace unihir::obs
