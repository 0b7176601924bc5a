#pragma once

#include "backtest/persistence/i_persistence_collaborator.hpp"

#include <cstddef>
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// JsonAuditLog: JSON-lines file of executed trades
// -----------------------------------------------------------------------------
//
// @brief  Appends one line per saved AuditRecord:
//         {"symbol": ..., "decision": {...}, "transaction": {...},
//          "stored_at_ms": ...}
//
// @details
// The file is opened in append mode so consecutive runs accumulate. Each
// line is flushed as it is written, which keeps the log usable after an
// interrupted run. Lines for one symbol appear in save() order.
//
// Thread model:
//   save() takes an internal mutex; safe from any thread.
// -----------------------------------------------------------------------------
class JsonAuditLog : public IPersistenceCollaborator {
 public:
  // @throws InvalidConfiguration if the file cannot be opened.
  explicit JsonAuditLog(const std::string& path);

  JsonAuditLog(const JsonAuditLog&) = delete;
  JsonAuditLog& operator=(const JsonAuditLog&) = delete;

  // @throws BacktestError when the line cannot be written.
  void save(const std::string& symbol,
            const domain::AuditRecord& record) override;

  std::size_t savedCount(const std::string& symbol) const;
  std::size_t savedCount() const;

 private:
  std::string path_;
  mutable std::mutex mutex_;
  std::ofstream out_;
  std::map<std::string, std::size_t> per_symbol_;
  std::size_t total_{0};
};

}  // namespace backtest
