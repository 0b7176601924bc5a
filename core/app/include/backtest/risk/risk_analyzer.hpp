#pragma once

#include "backtest/config/backtest_config.hpp"
#include "backtest/domain/market_snapshot.hpp"
#include "backtest/domain/risk_metrics.hpp"

#include <map>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// RiskAnalyzer: gap risk, correlation risk, VaR and size adjustment
// -----------------------------------------------------------------------------
//
// @brief  Pure functions over price windows and portfolio composition.
//
// @details
// The only state is the RiskAnalysisConfig copied in at construction, so one
// instance is shared freely between concurrent decision cycles.
//
// Gap risk
//   gap_t = |open_t - close_{t-1}| / close_{t-1} for each consecutive pair
//   of bars; total_days is the number of pairs. Gaps strictly above
//   gap_threshold are significant. mean_gap averages the significant gaps
//   only; expected_slippage = mean_gap * slippage_multiplier.
//
// Correlation risk
//   Pearson correlation of close-to-close returns, aligned on the most
//   recent common window. Off-diagonal mean / max / mean-of-squares give
//   portfolio correlation, max pair and concentration. With equal weights
//   on the correlation matrix C:
//     diversification_ratio = sqrt(w'Cw / mean(diag C)) = sqrt(ΣC_ij) / n
//   which is 1 for one asset or perfectly correlated assets and √2/2 for
//   two uncorrelated ones.
//
// Size adjustment
//   gap_factor         = max(min_gap_factor, 1 - expected_slippage * gap_sensitivity)
//   correlation_factor = max(min_correlation_factor,
//                            1 - portfolio_correlation * correlation_sensitivity)
//                        (1 when the portfolio holds nothing)
//   diversification    = min(max_diversification_bonus, 1 / diversification_ratio)
//   result             = base * max(min_total_adjustment, product)
// -----------------------------------------------------------------------------
class RiskAnalyzer {
 public:
  explicit RiskAnalyzer(RiskAnalysisConfig config);

  domain::GapRiskMetrics gapRisk(
      const std::vector<domain::MarketSnapshot>& bars) const;

  // returns: symbol → close-to-close returns, oldest first.
  domain::CorrelationRiskMetrics correlationRisk(
      const std::map<std::string, std::vector<double>>& returns) const;

  // Loss at var_confidence as a positive fraction, widened by gap risk.
  double valueAtRisk(const std::vector<double>& returns,
                     const domain::GapRiskMetrics& gap) const;

  // weights: symbol → share of the invested value (sums to 1 when non-empty).
  double riskScore(const domain::GapRiskMetrics& gap,
                   const domain::CorrelationRiskMetrics& correlation,
                   const std::map<std::string, double>& weights) const;

  double sizeAdjustment(double base, const domain::GapRiskMetrics& gap,
                        const domain::CorrelationRiskMetrics& correlation,
                        bool has_positions) const;

  std::vector<std::string> recommendations(
      double risk_score, const domain::GapRiskMetrics& gap,
      const domain::CorrelationRiskMetrics& correlation) const;

  // -------------------------------------------------------------------------
  // analyze()
  // -------------------------------------------------------------------------
  //
  // @brief  Everything above for one decision cycle.
  //
  // @param  bars       Recent bars of the symbol under decision, oldest first.
  // @param  returns    Return series of the held symbols plus the candidate.
  // @param  weights    Invested-value weights of current holdings.
  //
  // @return EnhancedRiskMetrics with size_adjustment relative to base 1.0.
  // -------------------------------------------------------------------------
  domain::EnhancedRiskMetrics analyze(
      const std::vector<domain::MarketSnapshot>& bars,
      const std::map<std::string, std::vector<double>>& returns,
      const std::map<std::string, double>& weights) const;

  static std::vector<double> closeReturns(
      const std::vector<domain::MarketSnapshot>& bars);
  static double pearson(const std::vector<double>& a,
                        const std::vector<double>& b);
  static double percentile(std::vector<double> values, double q);

  const RiskAnalysisConfig& config() const { return config_; }

 private:
  RiskAnalysisConfig config_;
};

}  // namespace backtest
