#include "miner/ledger.h"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace oreminer {
namespace miner {

CsvLedger::CsvLedger(std::string path) : path_(std::move(path)) {}

Result<bool> CsvLedger::initialize() {
  std::error_code ec;
  bool exists = std::filesystem::exists(path_, ec);
  if (exists && std::filesystem::file_size(path_, ec) > 0 && !ec) {
    return Result<bool>(true);
  }

  std::ofstream file(path_, std::ios::app);
  if (!file.is_open()) {
    return Result<bool>("Cannot open ledger file " + path_);
  }
  file << HEADER << "\n";
  file.flush();
  if (!file) {
    return Result<bool>("Failed to write ledger header to " + path_);
  }
  return Result<bool>(true);
}

Result<bool> CsvLedger::append(const LedgerRecord &record) {
  std::ofstream file(path_, std::ios::app);
  if (!file.is_open()) {
    return Result<bool>("Cannot open ledger file " + path_);
  }

  file << format_row(record, std::chrono::system_clock::now()) << "\n";
  file.flush();
  if (!file) {
    return Result<bool>("Failed to append to ledger " + path_);
  }
  return Result<bool>(true);
}

std::string
CsvLedger::format_row(const LedgerRecord &record,
                      std::chrono::system_clock::time_point timestamp) {
  auto time_t = std::chrono::system_clock::to_time_t(timestamp);
  std::tm tm_utc{};
  gmtime_r(&time_t, &tm_utc);

  std::ostringstream row;
  row << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ") << ","
      << record.round_id << ",";

  for (size_t i = 0; i < record.chosen_tiles.size(); ++i) {
    if (i > 0)
      row << ";";
    row << record.chosen_tiles[i];
  }

  row << "," << std::fixed << std::setprecision(6) << record.round_profit
      << "," << record.cumulative_profit;
  return row.str();
}

} // namespace miner
} // namespace oreminer
