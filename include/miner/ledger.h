#pragma once

#include "common/types.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace oreminer {
namespace miner {

using namespace oreminer::common;

/**
 * One line of profit history, written once per round
 */
struct LedgerRecord {
  uint64_t round_id = 0;
  std::vector<uint32_t> chosen_tiles;
  double round_profit = 0.0;
  double cumulative_profit = 0.0;
};

/**
 * Append-only profit history
 */
class ILedgerSink {
public:
  virtual ~ILedgerSink() = default;
  virtual Result<bool> append(const LedgerRecord &record) = 0;
};

/**
 * CSV ledger file.
 *
 * Columns: timestamp,round_id,tiles,round_profit,cumulative_profit. The header
 * is written when the file is missing or empty; existing rows are never
 * rewritten.
 */
class CsvLedger : public ILedgerSink {
public:
  static constexpr const char *HEADER =
      "timestamp,round_id,tiles,round_profit,cumulative_profit";

  explicit CsvLedger(std::string path);

  /// Create the file with its header if needed
  Result<bool> initialize();

  Result<bool> append(const LedgerRecord &record) override;

  const std::string &path() const { return path_; }

  static std::string
  format_row(const LedgerRecord &record,
             std::chrono::system_clock::time_point timestamp);

private:
  std::string path_;
};

} // namespace miner
} // namespace oreminer
