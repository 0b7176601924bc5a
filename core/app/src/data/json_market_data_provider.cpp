#include "backtest/data/json_market_data_provider.hpp"

#include "backtest/error/errors.hpp"
#include "backtest/time/time_utils.hpp"

#include <fstream>
#include <iostream>

namespace backtest {

namespace {

std::int64_t day_number(Timestamp date) {
  return timestamp_to_ms(start_of_day(date)) / kMillisPerDay;
}

}  // namespace

JsonMarketDataProvider::JsonMarketDataProvider(
    const nlohmann::json& document) {
  const nlohmann::json* bars = &document;
  if (document.is_object() && document.contains("bars")) {
    bars = &document.at("bars");
  }
  if (!bars->is_array()) {
    throw InvalidConfiguration(
        "market data must be an array of bars or an object with \"bars\"");
  }
  for (const auto& bar : *bars) {
    load(bar);
  }
  std::cout << "[JsonMarketDataProvider] loaded " << bar_count_
            << " bars for " << bars_.size() << " symbols";
  if (skipped_ > 0) {
    std::cout << " (" << skipped_ << " skipped)";
  }
  std::cout << "\n";
}

JsonMarketDataProvider JsonMarketDataProvider::fromFile(
    const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw InvalidConfiguration("cannot open market data file '" + path + "'");
  }
  try {
    return JsonMarketDataProvider(nlohmann::json::parse(in));
  } catch (const nlohmann::json::exception& e) {
    throw InvalidConfiguration("market data file '" + path +
                               "' is not valid JSON: " + e.what());
  }
}

void JsonMarketDataProvider::load(const nlohmann::json& bar) {
  try {
    domain::MarketSnapshot snapshot;
    snapshot.symbol = bar.at("symbol").get<std::string>();
    snapshot.date = parse_date(bar.at("date").get<std::string>());
    snapshot.open = bar.at("open").get<double>();
    snapshot.high = bar.at("high").get<double>();
    snapshot.low = bar.at("low").get<double>();
    snapshot.close = bar.at("close").get<double>();
    snapshot.volume = bar.value("volume", 0.0);
    if (bar.contains("indicators")) {
      snapshot.indicators =
          bar.at("indicators").get<std::map<std::string, double>>();
    }
    if (bar.contains("news_sentiment")) {
      snapshot.news_sentiment =
          bar.at("news_sentiment").get<std::vector<double>>();
    }

    if (snapshot.symbol.empty() || snapshot.open <= 0.0 ||
        snapshot.close <= 0.0 || snapshot.high <= 0.0 || snapshot.low <= 0.0) {
      std::cerr << "[JsonMarketDataProvider] skipping bar with invalid "
                   "symbol or prices: "
                << bar.dump() << "\n";
      ++skipped_;
      return;
    }

    auto& series = bars_[snapshot.symbol];
    const std::int64_t day = day_number(snapshot.date);
    if (series.insert_or_assign(day, std::move(snapshot)).second) {
      ++bar_count_;
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[JsonMarketDataProvider] JSON error: " << e.what()
              << " - bar: " << bar.dump() << "\n";
    ++skipped_;
  } catch (const InvalidConfiguration& e) {
    std::cerr << "[JsonMarketDataProvider] " << e.what()
              << " - bar: " << bar.dump() << "\n";
    ++skipped_;
  }
}

std::optional<domain::MarketSnapshot> JsonMarketDataProvider::get(
    const std::string& symbol, Timestamp date) const {
  auto series = bars_.find(symbol);
  if (series == bars_.end()) {
    return std::nullopt;
  }
  auto bar = series->second.find(day_number(date));
  if (bar == series->second.end()) {
    return std::nullopt;
  }
  return bar->second;
}

std::vector<std::string> JsonMarketDataProvider::symbols() const {
  std::vector<std::string> out;
  out.reserve(bars_.size());
  for (const auto& [symbol, series] : bars_) {
    out.push_back(symbol);
  }
  return out;
}

}  // namespace backtest
