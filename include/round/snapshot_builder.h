#pragma once

#include "common/types.h"
#include "round/account_data.h"
#include "round/round_state.h"
#include <memory>
#include <string>
#include <vector>

namespace oreminer {
namespace round {

using namespace oreminer::common;

/**
 * SOL deployed on one tile of the current round
 */
struct TileDeployment {
  uint32_t tile_id = 0; ///< 1..25
  double sol_deployed = 0.0;
};

/**
 * Immutable view of the active round used for one decision.
 */
struct RoundSnapshot {
  uint64_t round_id = 0;
  std::vector<TileDeployment> tiles;
  Lamports motherlode = 0;
  Lamports total_deployed = 0;
  bool is_fallback = false;
};

/**
 * Source of raw program accounts (normally a Solana RPC node).
 */
class IAccountSource {
public:
  virtual ~IAccountSource() = default;

  /**
   * @brief Fetch the data field of every account owned by a program
   * @return the data fields, or a transport error
   */
  virtual Result<std::vector<AccountDataField>>
  fetch_program_accounts(const std::string &program_id) = 0;
};

/**
 * Outcome of scanning a batch of accounts
 */
struct RoundScan {
  std::vector<RoundState> rounds;
  size_t skipped = 0;
};

/**
 * Counters from the most recent build()
 */
struct ScanStats {
  size_t accounts_seen = 0;
  size_t rounds_decoded = 0;
  size_t accounts_skipped = 0;
  bool transport_failed = false;
  bool used_fallback = false;
};

/**
 * Normalize and decode every account, skipping (and logging) the ones that
 * fail either step.
 */
RoundScan scan_round_accounts(const std::vector<AccountDataField> &accounts);

/**
 * Round with the greatest id, or nullptr for an empty set. Ties resolve to the
 * first occurrence; callers must not rely on that.
 */
const RoundState *select_latest_round(const std::vector<RoundState> &rounds);

/// Build the per-tile SOL view of a decoded round
RoundSnapshot make_snapshot(const RoundState &round);

/// Placeholder used when no round account could be observed
RoundSnapshot fallback_snapshot();

/**
 * Produces one RoundSnapshot per call from the latest round account of a
 * program. Never fails: transport errors, an absent source and empty scans all
 * yield the fallback snapshot.
 */
class RoundSnapshotBuilder {
public:
  /// @param source may be null when no RPC endpoint is configured
  RoundSnapshotBuilder(std::shared_ptr<IAccountSource> source,
                       std::string program_id);

  RoundSnapshot build();

  const ScanStats &last_scan() const { return last_scan_; }
  const std::string &program_id() const { return program_id_; }

private:
  std::shared_ptr<IAccountSource> source_;
  std::string program_id_;
  ScanStats last_scan_;
};

} // namespace round
} // namespace oreminer
