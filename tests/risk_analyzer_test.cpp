// =============================================================================
// risk_analyzer_test.cpp
// =============================================================================
// Unit tests for backtest::RiskAnalyzer.
//
// Validates:
//   - Gap risk on a series with one 10% overnight gap (2% threshold)
//   - Diversification ratio: 1 for one symbol, 1 for two perfectly
//     correlated symbols, √2/2 for two uncorrelated equal-variance symbols
//   - Pearson / percentile helpers, VaR, risk score bounds, size adjustment
//     floors and the recommendation texts
// =============================================================================

#include "backtest/risk/risk_analyzer.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <map>
#include <string>
#include <vector>

using backtest::RiskAnalyzer;
using backtest::testing_support::makeBar;
using backtest::testing_support::weekdayBars;

class RiskAnalyzerTest : public ::testing::Test {
 protected:
  backtest::RiskAnalysisConfig config;
  RiskAnalyzer analyzer{config};
};

// -----------------------------------------------------------------------------
// Gap risk: a single 10% gap among flat bars.
// -----------------------------------------------------------------------------
TEST_F(RiskAnalyzerTest, SingleTenPercentGap) {
  auto bars = weekdayBars("GAP", "2024-01-01", 11,
                          [](int) { return 100.0; });
  // Day 6 opens 10% above the previous close.
  bars[6].open = 110.0;

  const auto gap = analyzer.gapRisk(bars);

  EXPECT_EQ(gap.total_days, 10);
  EXPECT_EQ(gap.significant_days, 1);
  EXPECT_DOUBLE_EQ(gap.gap_frequency, 1.0 / 10.0);
  EXPECT_NEAR(gap.max_gap, 0.10, 1e-12);
  EXPECT_NEAR(gap.mean_gap, 0.10, 1e-12);
  EXPECT_NEAR(gap.expected_slippage, 0.10 * config.slippage_multiplier,
              1e-12);
}

TEST_F(RiskAnalyzerTest, GapsBelowThresholdAreNotSignificant) {
  std::vector<backtest::domain::MarketSnapshot> bars = {
      makeBar("X", "2024-01-02", 100.0, 100.0),
      makeBar("X", "2024-01-03", 100.0, 101.5),  // 1.5% gap
  };
  const auto gap = analyzer.gapRisk(bars);

  EXPECT_EQ(gap.total_days, 1);
  EXPECT_EQ(gap.significant_days, 0);
  EXPECT_NEAR(gap.max_gap, 0.015, 1e-12);
  EXPECT_DOUBLE_EQ(gap.mean_gap, 0.0);
}

TEST_F(RiskAnalyzerTest, GapRiskNeedsTwoBars) {
  const auto gap = analyzer.gapRisk({makeBar("X", "2024-01-02", 100.0)});
  EXPECT_EQ(gap.total_days, 0);
  EXPECT_DOUBLE_EQ(gap.gap_frequency, 0.0);
}

// -----------------------------------------------------------------------------
// Diversification ratio
// -----------------------------------------------------------------------------
TEST_F(RiskAnalyzerTest, DiversificationSingleSymbolIsOne) {
  const auto m = analyzer.correlationRisk({{"A", {0.01, -0.02, 0.03}}});
  EXPECT_DOUBLE_EQ(m.diversification_ratio, 1.0);
  ASSERT_EQ(m.matrix.size(), 1u);
  EXPECT_DOUBLE_EQ(m.matrix[0][0], 1.0);
}

TEST_F(RiskAnalyzerTest, DiversificationPerfectlyCorrelatedIsOne) {
  const std::vector<double> a = {0.01, -0.02, 0.03, 0.00, -0.01};
  std::vector<double> b;
  for (double r : a) {
    b.push_back(2.0 * r);
  }
  const auto m = analyzer.correlationRisk({{"A", a}, {"B", b}});

  EXPECT_NEAR(m.diversification_ratio, 1.0, 1e-9);
  EXPECT_NEAR(m.portfolio_correlation, 1.0, 1e-9);
  EXPECT_NEAR(m.max_pair_correlation, 1.0, 1e-9);
}

TEST_F(RiskAnalyzerTest, DiversificationUncorrelatedIsHalfRootTwo) {
  const std::vector<double> a = {0.01, -0.01, 0.01, -0.01};
  const std::vector<double> b = {0.01, 0.01, -0.01, -0.01};
  const auto m = analyzer.correlationRisk({{"A", a}, {"B", b}});

  EXPECT_NEAR(m.portfolio_correlation, 0.0, 1e-12);
  EXPECT_NEAR(m.diversification_ratio, std::sqrt(2.0) / 2.0, 1e-9);
  EXPECT_NEAR(m.concentration, 0.0, 1e-12);
}

TEST_F(RiskAnalyzerTest, CorrelationUsesMostRecentCommonWindow) {
  config.correlation_window = 4;
  RiskAnalyzer windowed{config};

  // Only the last four returns are compared; there they move together.
  const std::vector<double> a = {0.5, -0.5, 0.01, 0.02, -0.01, 0.03};
  const std::vector<double> b = {-0.5, 0.5, 0.01, 0.02, -0.01, 0.03};
  const auto m = windowed.correlationRisk({{"A", a}, {"B", b}});

  EXPECT_NEAR(m.max_pair_correlation, 1.0, 1e-9);
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
TEST(RiskAnalyzerHelpers, PearsonDegenerateInputsAreZero) {
  EXPECT_DOUBLE_EQ(RiskAnalyzer::pearson({1.0}, {2.0}), 0.0);
  EXPECT_DOUBLE_EQ(RiskAnalyzer::pearson({1.0, 1.0, 1.0}, {1.0, 2.0, 3.0}),
                   0.0);
  EXPECT_NEAR(RiskAnalyzer::pearson({1.0, 2.0, 3.0}, {3.0, 2.0, 1.0}), -1.0,
              1e-12);
}

TEST(RiskAnalyzerHelpers, PercentileInterpolates) {
  const std::vector<double> v = {4.0, 1.0, 3.0, 2.0, 5.0};
  EXPECT_DOUBLE_EQ(RiskAnalyzer::percentile(v, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(RiskAnalyzer::percentile(v, 0.5), 3.0);
  EXPECT_DOUBLE_EQ(RiskAnalyzer::percentile(v, 1.0), 5.0);
  EXPECT_DOUBLE_EQ(RiskAnalyzer::percentile(v, 0.125), 1.5);
  EXPECT_DOUBLE_EQ(RiskAnalyzer::percentile({}, 0.5), 0.0);
}

TEST(RiskAnalyzerHelpers, CloseReturns) {
  const auto r = RiskAnalyzer::closeReturns({makeBar("X", "2024-01-02", 100.0),
                                             makeBar("X", "2024-01-03", 110.0),
                                             makeBar("X", "2024-01-04", 99.0)});
  ASSERT_EQ(r.size(), 2u);
  EXPECT_NEAR(r[0], 0.10, 1e-12);
  EXPECT_NEAR(r[1], -0.10, 1e-12);
}

// -----------------------------------------------------------------------------
// VaR, score, adjustment
// -----------------------------------------------------------------------------
TEST_F(RiskAnalyzerTest, ValueAtRiskIsPositiveLossWidenedByGap) {
  std::vector<double> returns;
  for (int i = 0; i < 20; ++i) {
    returns.push_back(i < 3 ? -0.10 : 0.01);
  }
  backtest::domain::GapRiskMetrics no_gap;
  const double var = analyzer.valueAtRisk(returns, no_gap);
  EXPECT_GT(var, 0.0);

  backtest::domain::GapRiskMetrics gap;
  gap.max_gap = 0.5;
  EXPECT_NEAR(analyzer.valueAtRisk(returns, gap),
              var * (1.0 + 0.5 * config.expected_slippage_weight), 1e-12);

  EXPECT_DOUBLE_EQ(analyzer.valueAtRisk({0.01, 0.02, 0.03}, no_gap), 0.0);
}

TEST_F(RiskAnalyzerTest, RiskScoreStaysInRange) {
  backtest::domain::GapRiskMetrics gap;
  gap.max_gap = 0.5;
  gap.gap_frequency = 1.0;
  gap.expected_slippage = 0.25;
  backtest::domain::CorrelationRiskMetrics corr;
  corr.symbols = {"A", "B"};
  corr.portfolio_correlation = 1.0;
  corr.max_pair_correlation = 1.0;
  corr.diversification_ratio = 1.0;

  const double score = analyzer.riskScore(gap, corr, {{"A", 1.0}});
  EXPECT_DOUBLE_EQ(score, 100.0);

  const double calm = analyzer.riskScore({}, {}, {});
  EXPECT_DOUBLE_EQ(calm, 0.0);
}

TEST_F(RiskAnalyzerTest, ConcentrationRaisesScore) {
  const double one = analyzer.riskScore({}, {}, {{"A", 1.0}});
  const double two = analyzer.riskScore({}, {}, {{"A", 0.5}, {"B", 0.5}});
  EXPECT_DOUBLE_EQ(one, config.concentration_score_weight);
  EXPECT_DOUBLE_EQ(two, config.concentration_score_weight * 0.5);
}

TEST_F(RiskAnalyzerTest, SizeAdjustmentNeutralForCalmSingleAsset) {
  EXPECT_DOUBLE_EQ(analyzer.sizeAdjustment(1.0, {}, {}, false), 1.0);
}

// -----------------------------------------------------------------------------
// Each factor is floored and the product never drops below 0.3 of base.
// -----------------------------------------------------------------------------
TEST_F(RiskAnalyzerTest, SizeAdjustmentRespectsFloors) {
  backtest::domain::GapRiskMetrics gap;
  gap.expected_slippage = 10.0;
  backtest::domain::CorrelationRiskMetrics corr;
  corr.symbols = {"A", "B"};
  corr.portfolio_correlation = 1.0;
  corr.diversification_ratio = 1.0;

  const double adj = analyzer.sizeAdjustment(1.0, gap, corr, true);
  EXPECT_NEAR(adj, config.min_gap_factor * config.min_correlation_factor,
              1e-12);
  EXPECT_GE(adj, config.min_total_adjustment);

  config.min_total_adjustment = 0.5;
  RiskAnalyzer floored{config};
  EXPECT_NEAR(floored.sizeAdjustment(2.0, gap, corr, true), 1.0, 1e-12);
}

TEST_F(RiskAnalyzerTest, DiversificationBonusIsCapped) {
  backtest::domain::CorrelationRiskMetrics corr;
  corr.symbols = {"A", "B"};
  corr.diversification_ratio = std::sqrt(2.0) / 2.0;
  EXPECT_NEAR(analyzer.sizeAdjustment(1.0, {}, corr, false),
              config.max_diversification_bonus, 1e-12);
}

TEST_F(RiskAnalyzerTest, RecommendationsFollowThresholds) {
  backtest::domain::GapRiskMetrics gap;
  gap.max_gap = 0.08;
  gap.gap_frequency = 0.2;
  backtest::domain::CorrelationRiskMetrics corr;
  corr.symbols = {"A", "B"};
  corr.portfolio_correlation = 0.95;
  corr.max_pair_correlation = 0.95;
  corr.diversification_ratio = 0.99;

  const auto recs = analyzer.recommendations(75.0, gap, corr);
  ASSERT_EQ(recs.size(), 6u);
  EXPECT_EQ(recs[0], "HIGH RISK: Consider reducing position sizes");
  EXPECT_NE(recs[1].find("8.0%"), std::string::npos);
  EXPECT_NE(recs[2].find("20.0%"), std::string::npos);

  const auto moderate = analyzer.recommendations(60.0, {}, {});
  ASSERT_EQ(moderate.size(), 1u);
  EXPECT_EQ(moderate[0], "MODERATE RISK: Monitor positions closely");

  EXPECT_TRUE(analyzer.recommendations(10.0, {}, {}).empty());
}

TEST_F(RiskAnalyzerTest, AnalyzeCombinesEverything) {
  auto bars = weekdayBars("GAP", "2024-01-01", 11,
                          [](int) { return 100.0; });
  bars[6].open = 110.0;
  const auto returns = RiskAnalyzer::closeReturns(bars);

  const auto m = analyzer.analyze(bars, {{"GAP", returns}}, {});

  EXPECT_NEAR(m.gap.max_gap, 0.10, 1e-12);
  EXPECT_DOUBLE_EQ(m.correlation.diversification_ratio, 1.0);
  EXPECT_GT(m.risk_score, 0.0);
  EXPECT_LT(m.size_adjustment, 1.0);
  EXPECT_FALSE(m.recommendations.empty());
}
