/***
 * Name: test_result_aggregator
 * Purpose: Whole-program verdict, statistics totals and per-module reporting.
 */
#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "proofc/exceptions/pipeline_error.h"
#include "proofc/pipeline/result_aggregator.h"
#include "util/FakeToolchain.h"

using namespace proofc::pipeline;
using testutil::FakeVcProgram;
using testutil::Harness;
using testutil::UnitScript;

static std::vector<proofc::toolchain::VcUnit> MakeUnits(const std::vector<UnitScript>& scripts) {
  std::vector<proofc::toolchain::VcUnit> units;
  for (const auto& s : scripts) {
    units.push_back(proofc::toolchain::VcUnit{s.name, std::make_unique<FakeVcProgram>(s)});
  }
  return units;
}

TEST(ResultAggregator, AllUnitsRunEvenAfterAFailure) {
  Harness h;
  const auto ctx = h.Context();
  auto units = MakeUnits({testutil::Unit("A", 1, 2), testutil::Unit("B", 3, 0), testutil::Unit("C", 5, 0)});
  const AggregateResult agg = VerifyUnits(units, "prog.prf", std::nullopt, ctx);

  EXPECT_EQ(h.toolchain.log.CountPrefix("InferAndVerify:"), 3U);
  EXPECT_FALSE(agg.verified);
  EXPECT_EQ(agg.outcome, PipelineOutcome::VerificationCompleted);
  ASSERT_EQ(agg.per_unit.size(), 3U);
  EXPECT_EQ(agg.per_unit.at("A").errors, 2U);
  EXPECT_EQ(agg.per_unit.at("B").verified, 3U);
  EXPECT_EQ(agg.timings.size(), 3U);
}

TEST(ResultAggregator, VerdictIsConjunctionAndSingleFlipIsLocal) {
  Harness h;
  const auto ctx = h.Context();
  auto clean = MakeUnits({testutil::Unit("A", 1, 0), testutil::Unit("B", 2, 0)});
  const AggregateResult ok = VerifyUnits(clean, "prog.prf", std::nullopt, ctx);
  EXPECT_TRUE(ok.verified);

  auto flipped = MakeUnits({testutil::Unit("A", 1, 0), testutil::Unit("B", 2, 1)});
  const AggregateResult bad = VerifyUnits(flipped, "prog.prf", std::nullopt, ctx);
  EXPECT_FALSE(bad.verified);
  EXPECT_EQ(bad.per_unit.at("A"), ok.per_unit.at("A"));
}

TEST(ResultAggregator, TotalsEqualSumOfUnits) {
  Harness h;
  const auto ctx = h.Context();
  UnitScript a = testutil::Unit("A", 4, 1);
  a.stats.cached_verified = 2;
  UnitScript b = testutil::Unit("B", 6, 0);
  b.stats.inconclusive = 3;
  auto units = MakeUnits({a, b});
  const AggregateResult agg = VerifyUnits(units, "prog.prf", std::nullopt, ctx);
  const PipelineStatistics total = SumStatistics(agg.per_unit);
  EXPECT_EQ(total, a.stats + b.stats);
}

TEST(ResultAggregator, FirstDistinctOutcomeSticks) {
  Harness h;
  const auto ctx = h.Context();
  UnitScript a = testutil::Unit("A", 0, 0);
  a.check = PipelineOutcome::TypeCheckingError;
  UnitScript b = testutil::Unit("B", 0, 0);
  b.check = PipelineOutcome::ResolutionError;
  auto units = MakeUnits({testutil::Unit("Z", 1, 0), a, b});
  const AggregateResult agg = VerifyUnits(units, "prog.prf", std::nullopt, ctx);
  EXPECT_EQ(agg.outcome, PipelineOutcome::TypeCheckingError);
  EXPECT_FALSE(agg.verified);
}

TEST(ResultAggregator, DuplicateUnitNameThrows) {
  Harness h;
  const auto ctx = h.Context();
  auto units = MakeUnits({testutil::Unit("A", 1, 0), testutil::Unit("A", 1, 0)});
  EXPECT_THROW(VerifyUnits(units, "prog.prf", std::nullopt, ctx), proofc::exceptions::PipelineError);
}

TEST(ResultAggregator, SeparateModuleOutputFramesEachUnit) {
  Harness h;
  h.config.separate_module_output = true;
  const auto ctx = h.Context();
  auto units = MakeUnits({testutil::Unit("A", 1, 0), testutil::Unit("B", 2, 1)});
  VerifyUnits(units, "prog.prf", std::nullopt, ctx);
  const std::string out = h.out.str();
  const auto a = out.find("For module: A\n");
  const auto b = out.find("For module: B\n");
  ASSERT_NE(a, std::string::npos);
  ASSERT_NE(b, std::string::npos);
  EXPECT_LT(a, b);
  EXPECT_NE(out.find("Elapsed time: 00:00:"), std::string::npos);
  EXPECT_NE(out.find("proofc finished with 1 verified, 0 errors\n"), std::string::npos);
  EXPECT_NE(out.find("proofc finished with 2 verified, 1 error\n"), std::string::npos);
}

TEST(ResultAggregator, QuietWithoutSeparateModuleOutput) {
  Harness h;
  const auto ctx = h.Context();
  auto units = MakeUnits({testutil::Unit("A", 1, 0)});
  VerifyUnits(units, "prog.prf", std::nullopt, ctx);
  EXPECT_EQ(h.out.str(), "");
}

TEST(ResultAggregator, FormatElapsed) {
  using namespace std::chrono;
  EXPECT_EQ(FormatElapsed(nanoseconds{0}), "00:00:00");
  EXPECT_EQ(FormatElapsed(duration_cast<nanoseconds>(seconds{3725})), "01:02:05");
  EXPECT_EQ(FormatElapsed(duration_cast<nanoseconds>(milliseconds{59999})), "00:00:59");
}
