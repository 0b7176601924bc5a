#pragma once

#include "backtest/events/event_types.hpp"

#include <variant>

namespace backtest {

// -----------------------------------------------------------------------------
// Event: the single envelope carried by EventBus
// -----------------------------------------------------------------------------
// A closed std::variant: subscribers pick their type with
// EventBus::subscribe<T>() or std::get_if, and adding a kind here makes the
// compiler point at every visit site that needs to handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<DecisionEvent,
                           TransactionEvent,
                           PortfolioUpdateEvent,
                           RiskAlertEvent,
                           RunProgressEvent>;

}  // namespace backtest
