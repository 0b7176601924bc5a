#include "backtest/risk/risk_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <utility>

namespace backtest {

namespace {

constexpr double kMinDiversificationRatio = 1e-6;

std::string pct(double fraction) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", fraction * 100.0);
  return buf;
}

// Most recent `n` elements of v.
std::vector<double> tail(const std::vector<double>& v, std::size_t n) {
  return std::vector<double>(v.end() - static_cast<std::ptrdiff_t>(n), v.end());
}

}  // namespace

RiskAnalyzer::RiskAnalyzer(RiskAnalysisConfig config)
    : config_(std::move(config)) {}

// -----------------------------------------------------------------------------
// gapRisk()
// -----------------------------------------------------------------------------
domain::GapRiskMetrics RiskAnalyzer::gapRisk(
    const std::vector<domain::MarketSnapshot>& bars) const {
  domain::GapRiskMetrics m;
  if (bars.size() < 2) {
    return m;
  }

  double significant_sum = 0.0;
  for (std::size_t i = 1; i < bars.size(); ++i) {
    const double prev_close = bars[i - 1].close;
    if (prev_close <= 0.0) {
      continue;
    }
    const double gap = std::abs(bars[i].open - prev_close) / prev_close;
    ++m.total_days;
    m.max_gap = std::max(m.max_gap, gap);
    if (gap > config_.gap_threshold) {
      ++m.significant_days;
      significant_sum += gap;
    }
  }

  if (m.total_days > 0) {
    m.gap_frequency = static_cast<double>(m.significant_days) / m.total_days;
  }
  if (m.significant_days > 0) {
    m.mean_gap = significant_sum / m.significant_days;
  }
  m.expected_slippage = m.mean_gap * config_.slippage_multiplier;
  return m;
}

// -----------------------------------------------------------------------------
// correlationRisk()
// -----------------------------------------------------------------------------
domain::CorrelationRiskMetrics RiskAnalyzer::correlationRisk(
    const std::map<std::string, std::vector<double>>& returns) const {
  domain::CorrelationRiskMetrics m;
  for (const auto& [symbol, series] : returns) {
    m.symbols.push_back(symbol);
  }

  const std::size_t n = m.symbols.size();
  m.matrix.assign(n, std::vector<double>(n, 0.0));
  for (std::size_t i = 0; i < n; ++i) {
    m.matrix[i][i] = 1.0;
  }
  if (n < 2) {
    return m;
  }

  std::size_t window = static_cast<std::size_t>(
      std::max(2, config_.correlation_window));
  for (const auto& [symbol, series] : returns) {
    window = std::min(window, series.size());
  }

  std::vector<std::vector<double>> aligned;
  aligned.reserve(n);
  for (const auto& [symbol, series] : returns) {
    aligned.push_back(tail(series, window));
  }

  double off_sum = 0.0;
  double off_sq_sum = 0.0;
  double full_sum = static_cast<double>(n);
  double max_pair = -1.0;
  std::size_t pairs = 0;

  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      const double c = pearson(aligned[i], aligned[j]);
      m.matrix[i][j] = c;
      m.matrix[j][i] = c;
      off_sum += c;
      off_sq_sum += c * c;
      full_sum += 2.0 * c;
      max_pair = std::max(max_pair, c);
      ++pairs;
    }
  }

  m.portfolio_correlation = off_sum / pairs;
  m.max_pair_correlation = max_pair;
  m.concentration = off_sq_sum / pairs;

  // w'Cw with w = 1/n, divided by mean(diag C) == 1.
  const double portfolio_variance = full_sum / static_cast<double>(n * n);
  m.diversification_ratio =
      std::clamp(std::sqrt(std::max(0.0, portfolio_variance)),
                 kMinDiversificationRatio, 1.0);
  return m;
}

// -----------------------------------------------------------------------------
// valueAtRisk(): empirical percentile at (1 - confidence), gap-widened
// -----------------------------------------------------------------------------
double RiskAnalyzer::valueAtRisk(const std::vector<double>& returns,
                                 const domain::GapRiskMetrics& gap) const {
  if (returns.empty()) {
    return 0.0;
  }
  const double q = percentile(returns, 1.0 - config_.var_confidence);
  const double loss = std::max(0.0, -q);
  return loss * (1.0 + gap.max_gap * config_.expected_slippage_weight);
}

// -----------------------------------------------------------------------------
// riskScore(): gap (<=30) + correlation (<=30) + concentration (<=40)
// -----------------------------------------------------------------------------
double RiskAnalyzer::riskScore(
    const domain::GapRiskMetrics& gap,
    const domain::CorrelationRiskMetrics& correlation,
    const std::map<std::string, double>& weights) const {
  const double gap_score =
      std::min(30.0, gap.max_gap * 100.0 + gap.gap_frequency * 50.0 +
                         gap.expected_slippage * 100.0);

  double shortfall = 0.0;
  const std::size_t n = correlation.symbols.size();
  if (n >= 2) {
    const double floor = 1.0 / std::sqrt(static_cast<double>(n));
    shortfall = std::clamp(
        (correlation.diversification_ratio - floor) / (1.0 - floor), 0.0, 1.0);
  }
  const double corr_score = std::min(
      30.0, std::max(0.0, correlation.portfolio_correlation) * 30.0 +
                std::max(0.0, correlation.max_pair_correlation) * 20.0 +
                shortfall * 10.0);

  double hhi = 0.0;
  for (const auto& [symbol, w] : weights) {
    hhi += w * w;
  }
  const double concentration_score = hhi * config_.concentration_score_weight;

  return std::clamp(gap_score + corr_score + concentration_score, 0.0, 100.0);
}

double RiskAnalyzer::sizeAdjustment(
    double base, const domain::GapRiskMetrics& gap,
    const domain::CorrelationRiskMetrics& correlation,
    bool has_positions) const {
  const double gap_factor =
      std::max(config_.min_gap_factor,
               1.0 - gap.expected_slippage * config_.gap_sensitivity);

  double correlation_factor = 1.0;
  if (has_positions) {
    correlation_factor = std::max(
        config_.min_correlation_factor,
        1.0 - correlation.portfolio_correlation *
                  config_.correlation_sensitivity);
  }

  const double diversification_bonus =
      std::min(config_.max_diversification_bonus,
               1.0 / correlation.diversification_ratio);

  const double total = std::max(
      config_.min_total_adjustment,
      gap_factor * correlation_factor * diversification_bonus);
  return base * total;
}

// -----------------------------------------------------------------------------
// recommendations(): fixed order, strict threshold crossings
// -----------------------------------------------------------------------------
std::vector<std::string> RiskAnalyzer::recommendations(
    double risk_score, const domain::GapRiskMetrics& gap,
    const domain::CorrelationRiskMetrics& correlation) const {
  std::vector<std::string> out;

  if (risk_score > config_.high_risk_threshold) {
    out.emplace_back("HIGH RISK: Consider reducing position sizes");
  } else if (risk_score > config_.moderate_risk_threshold) {
    out.emplace_back("MODERATE RISK: Monitor positions closely");
  }

  if (gap.max_gap > config_.large_gap_threshold) {
    out.push_back("Large gaps detected (" + pct(gap.max_gap) +
                  "). Use limit orders and avoid market orders");
  }
  if (gap.gap_frequency > config_.frequent_gap_threshold) {
    out.push_back("Frequent gaps (" + pct(gap.gap_frequency) +
                  " of days). Consider wider stop losses");
  }

  if (correlation.portfolio_correlation > config_.high_correlation_threshold) {
    out.emplace_back("High portfolio correlation. Add uncorrelated assets");
  }
  if (correlation.max_pair_correlation >
      config_.extreme_correlation_threshold) {
    out.emplace_back(
        "Extremely high correlation between some positions. "
        "Consider closing redundant positions");
  }
  if (correlation.symbols.size() >= 2 &&
      1.0 / correlation.diversification_ratio <
          config_.low_diversification_threshold) {
    out.emplace_back(
        "Low diversification benefit. Spread risk across more assets");
  }
  return out;
}

domain::EnhancedRiskMetrics RiskAnalyzer::analyze(
    const std::vector<domain::MarketSnapshot>& bars,
    const std::map<std::string, std::vector<double>>& returns,
    const std::map<std::string, double>& weights) const {
  domain::EnhancedRiskMetrics m;
  m.gap = gapRisk(bars);
  m.correlation = correlationRisk(returns);
  m.value_at_risk = valueAtRisk(closeReturns(bars), m.gap);
  m.risk_score = riskScore(m.gap, m.correlation, weights);
  m.size_adjustment =
      sizeAdjustment(1.0, m.gap, m.correlation, !weights.empty());
  m.recommendations = recommendations(m.risk_score, m.gap, m.correlation);
  return m;
}

std::vector<double> RiskAnalyzer::closeReturns(
    const std::vector<domain::MarketSnapshot>& bars) {
  std::vector<double> out;
  if (bars.size() < 2) {
    return out;
  }
  out.reserve(bars.size() - 1);
  for (std::size_t i = 1; i < bars.size(); ++i) {
    const double prev = bars[i - 1].close;
    if (prev > 0.0) {
      out.push_back(bars[i].close / prev - 1.0);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// pearson(): 0 when either side has no variance or fewer than two points
// -----------------------------------------------------------------------------
double RiskAnalyzer::pearson(const std::vector<double>& a,
                             const std::vector<double>& b) {
  const std::size_t n = std::min(a.size(), b.size());
  if (n < 2) {
    return 0.0;
  }

  double mean_a = 0.0;
  double mean_b = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    mean_a += a[i];
    mean_b += b[i];
  }
  mean_a /= n;
  mean_b /= n;

  double cov = 0.0;
  double var_a = 0.0;
  double var_b = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double da = a[i] - mean_a;
    const double db = b[i] - mean_b;
    cov += da * db;
    var_a += da * da;
    var_b += db * db;
  }
  if (var_a <= 0.0 || var_b <= 0.0) {
    return 0.0;
  }
  return std::clamp(cov / std::sqrt(var_a * var_b), -1.0, 1.0);
}

// Linear interpolation between closest ranks, q in [0, 1].
double RiskAnalyzer::percentile(std::vector<double> values, double q) {
  if (values.empty()) {
    return 0.0;
  }
  std::sort(values.begin(), values.end());
  const double pos = std::clamp(q, 0.0, 1.0) * (values.size() - 1);
  const std::size_t lo = static_cast<std::size_t>(std::floor(pos));
  const std::size_t hi = static_cast<std::size_t>(std::ceil(pos));
  const double frac = pos - static_cast<double>(lo);
  return values[lo] + (values[hi] - values[lo]) * frac;
}

}  // namespace backtest
