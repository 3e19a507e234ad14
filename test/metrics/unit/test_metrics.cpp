/***
 * Name: test_metrics
 * Purpose: Phase timers and counters in the text and JSON reports.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "proofc/metrics/metrics.h"

using proofc::metrics::Metrics;

namespace {
class Probe : public Metrics {
 public:
  void Solve() { const ScopedTimer timer(Phase::Solve); }
};
}  // namespace

TEST(Metrics, DisabledRecordsNothing) {
  Metrics::Reset();
  Metrics::Enable(false);
  Probe().Solve();
  Metrics::IncCounter("units.verified");
  EXPECT_TRUE(Metrics::GetRegistry().durations_ns.empty());
  EXPECT_TRUE(Metrics::GetRegistry().counters.empty());
  std::ostringstream out;
  Metrics::PrintMetrics(Metrics::GetRegistry(), out);
  EXPECT_TRUE(out.str().empty());
}

TEST(Metrics, TextReport) {
  Metrics::Reset();
  Metrics::Enable(true);
  Probe().Solve();
  Metrics::IncCounter("units.verified", 2);
  Metrics::IncCounter("units.verified");
  std::ostringstream out;
  Metrics::PrintMetrics(Metrics::GetRegistry(), out);
  const std::string text = out.str();
  EXPECT_EQ(text.rfind("== Metrics ==\n", 0), 0U);
  EXPECT_NE(text.find("  Solve: "), std::string::npos);
  EXPECT_NE(text.find("    - units.verified: 3\n"), std::string::npos);
  Metrics::Reset();
}

TEST(Metrics, JsonReport) {
  Metrics::Reset();
  Metrics::Enable(true);
  Probe().Solve();
  Metrics::IncCounter("native.builds");
  std::ostringstream out;
  Metrics::PrintMetricsJson(Metrics::GetRegistry(), out);
  const std::string json = out.str();
  EXPECT_NE(json.find("\"durations_ns\""), std::string::npos);
  EXPECT_NE(json.find(R"("phase": "Solve")"), std::string::npos);
  EXPECT_NE(json.find("\"native.builds\": 1"), std::string::npos);
  Metrics::Reset();
}

TEST(Metrics, PhaseNames) {
  EXPECT_STREQ(Metrics::PhaseName(Metrics::Phase::Translate), "Translate");
  EXPECT_STREQ(Metrics::PhaseName(Metrics::Phase::NativeBuild), "NativeBuild");
}
