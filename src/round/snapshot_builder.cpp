#include "round/snapshot_builder.h"
#include "common/logging.h"
#include <iomanip>
#include <sstream>

namespace oreminer {
namespace round {

namespace {

constexpr double FALLBACK_TILE_SOL = 0.1;

std::string format_sol(Lamports lamports) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(4) << lamports_to_sol(lamports);
  return oss.str();
}

} // namespace

RoundScan scan_round_accounts(const std::vector<AccountDataField> &accounts) {
  RoundScan scan;
  scan.rounds.reserve(accounts.size());

  for (size_t i = 0; i < accounts.size(); ++i) {
    auto normalized = normalize_account_data(accounts[i]);
    if (!normalized.is_ok()) {
      LOG_WARN("round", "Skipping account #", i, ": ",
               to_string(normalized.error), " (", normalized.detail, ")");
      scan.skipped++;
      continue;
    }

    auto decoded = decode_round_state(normalized.bytes);
    if (!decoded.is_ok()) {
      // Most program accounts are not rounds; keep this out of WARN
      LOG_DEBUG("round", "Skipping account #", i, ": ",
                to_string(decoded.error), " (", normalized.bytes.size(),
                " bytes)");
      scan.skipped++;
      continue;
    }

    LOG_TRACE("round", "Account #", i, " decoded as round ", decoded.round.id);
    scan.rounds.push_back(decoded.round);
  }

  return scan;
}

const RoundState *select_latest_round(const std::vector<RoundState> &rounds) {
  const RoundState *latest = nullptr;
  for (const auto &round : rounds) {
    if (latest == nullptr || round.id > latest->id) {
      latest = &round;
    }
  }
  return latest;
}

RoundSnapshot make_snapshot(const RoundState &round) {
  RoundSnapshot snapshot;
  snapshot.round_id = round.id;
  snapshot.motherlode = round.motherlode;
  snapshot.total_deployed = round.total_deployed;
  snapshot.tiles.reserve(TILE_COUNT);
  for (size_t i = 0; i < TILE_COUNT; ++i) {
    snapshot.tiles.push_back(TileDeployment{static_cast<uint32_t>(i + 1),
                                            lamports_to_sol(round.deployed[i])});
  }
  return snapshot;
}

RoundSnapshot fallback_snapshot() {
  RoundSnapshot snapshot;
  snapshot.round_id = 0;
  snapshot.tiles.push_back(TileDeployment{1, FALLBACK_TILE_SOL});
  snapshot.is_fallback = true;
  return snapshot;
}

RoundSnapshotBuilder::RoundSnapshotBuilder(
    std::shared_ptr<IAccountSource> source, std::string program_id)
    : source_(std::move(source)), program_id_(std::move(program_id)) {}

RoundSnapshot RoundSnapshotBuilder::build() {
  last_scan_ = ScanStats{};

  if (!source_) {
    LOG_WARN("round", "Account source unavailable; returning no round data.");
    last_scan_.transport_failed = true;
    last_scan_.used_fallback = true;
    return fallback_snapshot();
  }

  auto fetched = source_->fetch_program_accounts(program_id_);
  if (fetched.is_err()) {
    LOG_ERROR("round", "Account fetch failed: ", fetched.error());
    last_scan_.transport_failed = true;
    last_scan_.used_fallback = true;
    return fallback_snapshot();
  }

  const auto &accounts = fetched.value();
  RoundScan scan = scan_round_accounts(accounts);
  last_scan_.accounts_seen = accounts.size();
  last_scan_.rounds_decoded = scan.rounds.size();
  last_scan_.accounts_skipped = scan.skipped;

  LOG_INFO("round", "Parsed ", scan.rounds.size(), " round accounts (",
           scan.skipped, " skipped).");

  const RoundState *latest = select_latest_round(scan.rounds);
  if (latest == nullptr) {
    LOG_WARN("round", "No round accounts decoded; using fallback snapshot.");
    last_scan_.used_fallback = true;
    return fallback_snapshot();
  }

  LOG_INFO("round", "Round #", latest->id,
           " | total_deployed=", format_sol(latest->total_deployed),
           " SOL | motherlode=", format_sol(latest->motherlode), " SOL");

  return make_snapshot(*latest);
}

} // namespace round
} // namespace oreminer
