#pragma once

#include "backtest/domain/backtest_result.hpp"

#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// IPersistenceCollaborator
// -----------------------------------------------------------------------------
//
// @brief  Append-only, per-symbol log of executed trades.
//
// @details
// SimulationEngine calls save() once per committed transaction, including
// forced exits, from its single portfolio-writer thread. Implementations
// report their own I/O problems; an exception thrown from save() is logged
// by the engine and the run continues.
// -----------------------------------------------------------------------------
class IPersistenceCollaborator {
 public:
  virtual ~IPersistenceCollaborator() = default;

  virtual void save(const std::string& symbol,
                    const domain::AuditRecord& record) = 0;
};

}  // namespace backtest
