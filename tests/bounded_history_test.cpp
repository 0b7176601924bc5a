// =============================================================================
// bounded_history_test.cpp
// =============================================================================
// Unit tests for backtest::BoundedHistory<T>.
//
// Validates:
//   - Capacity is enforced; the oldest items are discarded first
//   - last(n) returns the newest items in insertion order, last(0) is empty
//   - latest() / clear() / construction errors
// =============================================================================

#include "backtest/concurrent/bounded_history.hpp"
#include "backtest/error/errors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class BoundedHistoryTest : public ::testing::Test {
 protected:
  backtest::BoundedHistory<int> history{3};
};

// -----------------------------------------------------------------------------
// 1. Below capacity every item is kept, in insertion order.
// -----------------------------------------------------------------------------
TEST_F(BoundedHistoryTest, KeepsItemsBelowCapacity) {
  history.append(1);
  history.append(2);

  EXPECT_EQ(history.size(), 2u);
  EXPECT_EQ(history.all(), (std::vector<int>{1, 2}));
}

// -----------------------------------------------------------------------------
// 2. Appending past capacity discards the oldest item.
// Why: Price and opinion memories are bounded per symbol / per role; the
//      window must slide, never grow.
// -----------------------------------------------------------------------------
TEST_F(BoundedHistoryTest, DiscardsOldestAtCapacity) {
  for (int i = 1; i <= 5; ++i) {
    history.append(i);
  }

  EXPECT_EQ(history.size(), 3u);
  EXPECT_EQ(history.capacity(), 3u);
  EXPECT_EQ(history.all(), (std::vector<int>{3, 4, 5}));
}

// -----------------------------------------------------------------------------
// 3. last(n) returns the newest n items, oldest of them first.
// -----------------------------------------------------------------------------
TEST_F(BoundedHistoryTest, LastReturnsNewestInOrder) {
  for (int i = 1; i <= 4; ++i) {
    history.append(i);
  }

  EXPECT_EQ(history.last(2), (std::vector<int>{3, 4}));
  EXPECT_EQ(history.last(10), (std::vector<int>{2, 3, 4}));
}

TEST_F(BoundedHistoryTest, LastZeroIsEmpty) {
  history.append(7);
  EXPECT_TRUE(history.last(0).empty());
}

TEST_F(BoundedHistoryTest, LatestAndClear) {
  EXPECT_FALSE(history.latest().has_value());

  history.append(10);
  history.append(11);
  ASSERT_TRUE(history.latest().has_value());
  EXPECT_EQ(*history.latest(), 11);

  history.clear();
  EXPECT_TRUE(history.empty());
  EXPECT_FALSE(history.latest().has_value());

  // Wrap-around bookkeeping starts over after clear().
  history.append(20);
  EXPECT_EQ(history.all(), (std::vector<int>{20}));
}

// -----------------------------------------------------------------------------
// 4. Non-positive capacities are configuration errors.
// -----------------------------------------------------------------------------
TEST(BoundedHistoryConstruction, RejectsNonPositiveCapacity) {
  EXPECT_THROW(backtest::BoundedHistory<int>{0},
               backtest::InvalidConfiguration);
  EXPECT_THROW(backtest::BoundedHistory<std::string>{-5},
               backtest::InvalidConfiguration);
}

TEST(BoundedHistoryConstruction, CapacityOneKeepsOnlyLatest) {
  backtest::BoundedHistory<std::string> one{1};
  one.append("a");
  one.append("b");
  EXPECT_EQ(one.all(), (std::vector<std::string>{"b"}));
}
