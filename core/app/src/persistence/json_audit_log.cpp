#include "backtest/persistence/json_audit_log.hpp"

#include "backtest/error/errors.hpp"
#include "backtest/serialization/record_json.hpp"

#include <nlohmann/json.hpp>

namespace backtest {

JsonAuditLog::JsonAuditLog(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::app) {
  if (!out_) {
    throw InvalidConfiguration("cannot open audit log '" + path + "'");
  }
}

void JsonAuditLog::save(const std::string& symbol,
                        const domain::AuditRecord& record) {
  nlohmann::json line = toJson(record);
  line["symbol"] = symbol;
  const std::string text = line.dump();

  std::lock_guard lock(mutex_);
  out_ << text << '\n';
  out_.flush();
  if (!out_) {
    throw BacktestError("write to audit log '" + path_ + "' failed");
  }
  ++per_symbol_[symbol];
  ++total_;
}

std::size_t JsonAuditLog::savedCount(const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = per_symbol_.find(symbol);
  return it == per_symbol_.end() ? 0 : it->second;
}

std::size_t JsonAuditLog::savedCount() const {
  std::lock_guard lock(mutex_);
  return total_;
}

}  // namespace backtest
