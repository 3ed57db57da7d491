#pragma once

#include "miner/deployment_sink.h"
#include "miner/ledger.h"
#include "round/snapshot_builder.h"
#include "strategy/strategy.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace oreminer {
namespace miner {

/**
 * @brief Phases of one mining round
 */
enum class LoopState {
  FETCHING,
  DECIDING,
  ACTING,
  RECORDING,
  PACING,
  STOPPED
};

const char *to_string(LoopState state);

/// Upper bound applied to LoopConfig::pacing_interval
constexpr std::chrono::milliseconds MAX_PACING_INTERVAL =
    std::chrono::hours(24 * 365);

/**
 * @brief Runtime parameters of the decision loop
 */
struct LoopConfig {
  bool dry_run = false;
  std::optional<uint64_t> max_rounds;            ///< nullopt runs until stopped
  std::chrono::milliseconds pacing_interval{0};  ///< wait between rounds
  double deploy_amount_sol = 0.01;               ///< fixed per-tile amount
};

/**
 * @brief What happened in one round
 */
struct RoundReport {
  uint64_t round_number = 0; ///< 1-based iteration counter
  uint64_t round_id = 0;
  bool used_fallback = false;
  strategy::TileSelection chosen_tiles;
  size_t rejected_tiles = 0;
  double round_profit = 0.0;
  double cumulative_profit = 0.0;
  size_t deployments_attempted = 0;
  size_t deployments_succeeded = 0;
  size_t deployments_failed = 0;
  bool acting_failed = false; ///< live mode without a usable sink
  bool ledger_written = false;
};

struct LoopSummary {
  uint64_t rounds_completed = 0;
  double cumulative_profit = 0.0;
};

/**
 * @brief Fetch, decide, act, record and pace, one round at a time
 *
 * The loop owns the cumulative profit for the run. The deployment sink is an
 * optional handle fixed at construction; in dry-run mode it is never called,
 * and in live mode its absence or misconfiguration is reported as a failure of
 * the round's Acting phase. No collaborator failure stops the loop.
 */
class DecisionLoop {
public:
  DecisionLoop(round::RoundSnapshotBuilder &builder,
               const strategy::IStrategy &strategy,
               std::shared_ptr<IDeploymentSink> sink, ILedgerSink &ledger,
               LoopConfig config);

  /// Run until the round bound is reached or stop is requested
  LoopSummary run();

  /// Execute Fetching through Recording for a single round
  RoundReport run_round(uint64_t round_number);

  /// Ask the loop to finish after the current round; safe from any thread
  void request_stop() { stop_requested_.store(true); }
  bool stop_requested() const { return stop_requested_.load(); }

  LoopState state() const { return state_.load(); }
  double cumulative_profit() const { return cumulative_profit_; }
  uint64_t rounds_completed() const { return rounds_completed_; }
  const LoopConfig &config() const { return config_; }

private:
  strategy::TileSelection decide(const round::RoundSnapshot &snapshot,
                                 RoundReport &report);
  void act(const strategy::TileSelection &tiles, RoundReport &report);
  double estimate(const round::RoundSnapshot &snapshot,
                  const strategy::TileSelection &tiles);
  void pace();

  round::RoundSnapshotBuilder &builder_;
  const strategy::IStrategy &strategy_;
  std::shared_ptr<IDeploymentSink> sink_;
  ILedgerSink &ledger_;
  LoopConfig config_;

  std::atomic<LoopState> state_{LoopState::FETCHING};
  std::atomic<bool> stop_requested_{false};
  double cumulative_profit_ = 0.0;
  uint64_t rounds_completed_ = 0;
};

} // namespace miner
} // namespace oreminer
