#include "backtest/domain/backtest_result.hpp"

namespace backtest {
namespace domain {

const char* to_string(ExecutionOutcome outcome) {
  switch (outcome) {
    case ExecutionOutcome::Filled:    return "FILLED";
    case ExecutionOutcome::Rejected:  return "REJECTED";
    case ExecutionOutcome::Hold:      return "HOLD";
    case ExecutionOutcome::Skipped:   return "SKIPPED";
    case ExecutionOutcome::Cancelled: return "CANCELLED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace backtest
