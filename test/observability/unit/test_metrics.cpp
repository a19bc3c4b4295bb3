/***
 * Name: test_metrics
 * Purpose: Metrics timers, counters, text/JSON summaries and hints.
 */
#include <gtest/gtest.h>
#include "observability/Metrics.h"

using namespace unihir::obs;

TEST(Metrics, StopWithoutStartIsIgnored) {
  Metrics m;
  m.stop("Optimized");
  EXPECT_TRUE(m.durationsUs().empty());
}

TEST(Metrics, TimersRecordPhaseNames) {
  Metrics m;
  m.start("Unified HIR");
  m.stop("Unified HIR");
  ASSERT_EQ(m.durationsUs().count("Unified HIR"), 1u);
  const std::string json = m.summaryJson();
  EXPECT_NE(json.find("\"unified_hir\": "), std::string::npos);
  EXPECT_NE(m.summaryText().find("  Unified HIR: "), std::string::npos);
}

TEST(Metrics, TextSummary) {
  Metrics m;
  m.setHirGeometry(HirGeometry{2, 2});
  m.setCounter(kUnifyMatched, 1);
  m.setGauge(kCodegenBytes, 13);
  const std::string text = m.summaryText();
  EXPECT_EQ(text.rfind("== Metrics ==\n", 0), 0u);
  EXPECT_NE(text.find("  HIR: nodes=2, max_depth=2\n"), std::string::npos);
  EXPECT_NE(text.find("  unify.matched = 1\n"), std::string::npos);
  EXPECT_NE(text.find("  codegen.bytes = 13\n"), std::string::npos);
}

TEST(Metrics, JsonSections) {
  Metrics m;
  m.setHirGeometry(HirGeometry{5, 3});
  m.setOptimizerStat("passes", 1);
  m.incCounter(kBoundariesEliminated);
  m.incCounter(kBoundariesEliminated);
  const std::string json = m.summaryJson();
  EXPECT_EQ(json.rfind("{\n  \"durations_ms\": {", 0), 0u);
  EXPECT_NE(json.find("\"hir\": { \"nodes\": 5, \"max_depth\": 3 }"), std::string::npos);
  EXPECT_NE(json.find("\"optimizer\": {\n    \"passes\": 1\n  }"), std::string::npos);
  EXPECT_NE(json.find("\"opt.boundaries_eliminated\": 2"), std::string::npos);
  EXPECT_NE(json.find("\"hints\": [\"optimizer_effective\"]"), std::string::npos);
  EXPECT_EQ(json.substr(json.size() - 3), "\n}\n");
}

TEST(Metrics, Hints) {
  Metrics quiet;
  EXPECT_TRUE(quiet.hints().empty());

  Metrics m;
  m.setCounter(kUnifyDiagnostics, 2);
  m.setCounter(kBoundariesEliminated, 0);
  m.setGauge(kCodegenBytes, 50001);
  const auto hints = m.hints();
  ASSERT_EQ(hints.size(), 3u);
  EXPECT_EQ(hints[0], "unify_diagnostics_present");
  EXPECT_EQ(hints[1], "optimizer_no_effect");
  EXPECT_EQ(hints[2], "large_output");

  Metrics small;
  small.setGauge(kCodegenBytes, 50000);
  EXPECT_TRUE(small.hints().empty());
}
