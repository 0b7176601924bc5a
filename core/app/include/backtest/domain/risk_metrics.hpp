#pragma once

#include <string>
#include <vector>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// Risk metric value objects
// -----------------------------------------------------------------------------
// Recomputed by RiskAnalyzer for every decision cycle from the recent price
// window and the current portfolio composition. They have no lifecycle of
// their own beyond the cycle; the engine keeps copies in the audit trail.
// -----------------------------------------------------------------------------

struct GapRiskMetrics {
  double max_gap{0.0};           // Largest |open - prev close| / prev close
  double mean_gap{0.0};          // Mean over significant gaps only
  double gap_frequency{0.0};     // significant_days / total_days
  double expected_slippage{0.0}; // mean_gap * slippage_multiplier
  int significant_days{0};
  int total_days{0};
};

struct CorrelationRiskMetrics {
  std::vector<std::string> symbols;
  std::vector<std::vector<double>> matrix;  // Pearson, symbols x symbols
  double portfolio_correlation{0.0};        // Mean off-diagonal
  double max_pair_correlation{0.0};         // Max off-diagonal
  double concentration{0.0};                // Mean squared off-diagonal
  double diversification_ratio{1.0};        // (0, 1]
};

struct EnhancedRiskMetrics {
  GapRiskMetrics gap;
  CorrelationRiskMetrics correlation;
  double value_at_risk{0.0};  // Loss fraction, >= 0
  double risk_score{0.0};     // [0, 100]
  double size_adjustment{1.0};
  std::vector<std::string> recommendations;
};

}  // namespace domain
}  // namespace backtest
