#include "backtest/domain/transaction.hpp"

namespace backtest {
namespace domain {

const char* to_string(TransactionStatus status) {
  switch (status) {
    case TransactionStatus::Committed:            return "Committed";
    case TransactionStatus::InsufficientFunds:    return "InsufficientFunds";
    case TransactionStatus::InsufficientPosition: return "InsufficientPosition";
    case TransactionStatus::Invalid:              return "Invalid";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace backtest
