#include "backtest/domain/position.hpp"

namespace backtest {
namespace domain {

const char* to_string(ExitReason reason) {
  switch (reason) {
    case ExitReason::Signal:     return "signal";
    case ExitReason::StopLoss:   return "stop_loss";
    case ExitReason::TakeProfit: return "take_profit";
    case ExitReason::MaxHolding: return "max_holding";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace backtest
