// =============================================================================
// json_market_data_provider_test.cpp
// =============================================================================
// Unit tests for backtest::JsonMarketDataProvider.
//
// Validates:
//   - Both document shapes load; optional fields default
//   - get() returns nullopt for unknown symbols and missing dates
//   - Invalid bars are skipped without failing the load
//   - A later bar for the same day replaces the earlier one
//   - fromFile() reports missing and malformed files as InvalidConfiguration
// =============================================================================

#include "backtest/data/json_market_data_provider.hpp"
#include "backtest/error/errors.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using backtest::JsonMarketDataProvider;
using backtest::parse_date;

namespace {

nlohmann::json bar(const std::string& symbol, const std::string& date,
                   double close) {
  return {{"symbol", symbol}, {"date", date},   {"open", close},
          {"high", close * 1.01}, {"low", close * 0.99}, {"close", close}};
}

}  // namespace

TEST(JsonMarketDataProviderTest, LoadsObjectDocument) {
  auto first = bar("AAPL", "2024-01-02", 185.0);
  first["volume"] = 52'000'000;
  first["indicators"] = {{"rsi", 61.0}, {"macd", 0.4}};
  first["news_sentiment"] = {0.3, -0.1};

  nlohmann::json document;
  document["bars"] =
      nlohmann::json::array({first, bar("MSFT", "2024-01-02", 370.0)});
  const JsonMarketDataProvider provider(document);

  EXPECT_EQ(provider.barCount(), 2u);
  EXPECT_EQ(provider.skippedCount(), 0u);
  EXPECT_EQ(provider.symbols(), (std::vector<std::string>{"AAPL", "MSFT"}));

  const auto aapl = provider.get("AAPL", parse_date("2024-01-02"));
  ASSERT_TRUE(aapl.has_value());
  EXPECT_DOUBLE_EQ(aapl->close, 185.0);
  EXPECT_DOUBLE_EQ(aapl->volume, 52'000'000.0);
  EXPECT_DOUBLE_EQ(aapl->indicators.at("rsi"), 61.0);
  ASSERT_EQ(aapl->news_sentiment.size(), 2u);

  const auto msft = provider.get("MSFT", parse_date("2024-01-02"));
  ASSERT_TRUE(msft.has_value());
  EXPECT_DOUBLE_EQ(msft->volume, 0.0);
  EXPECT_TRUE(msft->indicators.empty());
}

TEST(JsonMarketDataProviderTest, LoadsArrayDocument) {
  const JsonMarketDataProvider provider(nlohmann::json::array(
      {bar("AAPL", "2024-01-02", 1.0), bar("AAPL", "2024-01-03", 2.0)}));
  EXPECT_EQ(provider.barCount(), 2u);
}

TEST(JsonMarketDataProviderTest, MissingDataIsNullopt) {
  const JsonMarketDataProvider provider(
      nlohmann::json::array({bar("AAPL", "2024-01-02", 1.0)}));

  EXPECT_FALSE(provider.get("AAPL", parse_date("2024-01-03")).has_value());
  EXPECT_FALSE(provider.get("TSLA", parse_date("2024-01-02")).has_value());
}

// -----------------------------------------------------------------------------
// A lookup with a time of day still finds the day's bar.
// -----------------------------------------------------------------------------
TEST(JsonMarketDataProviderTest, LookupIgnoresTimeOfDay) {
  const JsonMarketDataProvider provider(
      nlohmann::json::array({bar("AAPL", "2024-01-02", 1.0)}));
  const auto afternoon =
      parse_date("2024-01-02") + std::chrono::hours(15);
  EXPECT_TRUE(provider.get("AAPL", afternoon).has_value());
}

TEST(JsonMarketDataProviderTest, SkipsInvalidBars) {
  auto negative = bar("AAPL", "2024-01-03", 1.0);
  negative["close"] = -1.0;
  auto no_close = bar("AAPL", "2024-01-04", 1.0);
  no_close.erase("close");
  auto bad_date = bar("AAPL", "2024-02-30", 1.0);
  auto text_price = bar("AAPL", "2024-01-05", 1.0);
  text_price["open"] = "one";

  const JsonMarketDataProvider provider(nlohmann::json::array(
      {bar("AAPL", "2024-01-02", 1.0), negative, no_close, bad_date,
       text_price}));

  EXPECT_EQ(provider.barCount(), 1u);
  EXPECT_EQ(provider.skippedCount(), 4u);
}

TEST(JsonMarketDataProviderTest, LaterBarReplacesEarlier) {
  const JsonMarketDataProvider provider(nlohmann::json::array(
      {bar("AAPL", "2024-01-02", 1.0), bar("AAPL", "2024-01-02", 3.0)}));

  EXPECT_EQ(provider.barCount(), 1u);
  EXPECT_DOUBLE_EQ(provider.get("AAPL", parse_date("2024-01-02"))->close, 3.0);
}

TEST(JsonMarketDataProviderTest, RejectsNonArrayDocument) {
  nlohmann::json document;
  document["symbol"] = "AAPL";
  EXPECT_THROW(JsonMarketDataProvider{document}, backtest::InvalidConfiguration);
}

TEST(JsonMarketDataProviderTest, FromFile) {
  const auto path =
      std::filesystem::temp_directory_path() / "backtest_bars_test.json";
  {
    std::ofstream out(path);
    out << nlohmann::json::array({bar("AAPL", "2024-01-02", 5.0)}).dump();
  }
  EXPECT_EQ(JsonMarketDataProvider::fromFile(path.string()).barCount(), 1u);

  {
    std::ofstream out(path);
    out << "[ {";
  }
  EXPECT_THROW(JsonMarketDataProvider::fromFile(path.string()),
               backtest::InvalidConfiguration);

  std::filesystem::remove(path);
  EXPECT_THROW(JsonMarketDataProvider::fromFile(path.string()),
               backtest::InvalidConfiguration);
}
