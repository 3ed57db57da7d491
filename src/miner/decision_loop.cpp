#include "miner/decision_loop.h"
#include "common/logging.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace oreminer {
namespace miner {

namespace {

constexpr std::chrono::milliseconds PACING_SLICE{100};

std::string format_sol(double amount, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << amount;
  return out.str();
}

std::string join_tiles(const strategy::TileSelection &tiles) {
  std::ostringstream out;
  out << "[";
  for (size_t i = 0; i < tiles.size(); ++i) {
    if (i > 0)
      out << ", ";
    out << tiles[i];
  }
  out << "]";
  return out.str();
}

} // namespace

const char *to_string(LoopState state) {
  switch (state) {
  case LoopState::FETCHING:
    return "Fetching";
  case LoopState::DECIDING:
    return "Deciding";
  case LoopState::ACTING:
    return "Acting";
  case LoopState::RECORDING:
    return "Recording";
  case LoopState::PACING:
    return "Pacing";
  case LoopState::STOPPED:
    return "Stopped";
  }
  return "Unknown";
}

DecisionLoop::DecisionLoop(round::RoundSnapshotBuilder &builder,
                           const strategy::IStrategy &strategy,
                           std::shared_ptr<IDeploymentSink> sink,
                           ILedgerSink &ledger, LoopConfig config)
    : builder_(builder), strategy_(strategy), sink_(std::move(sink)),
      ledger_(ledger), config_(std::move(config)) {
  if (config_.pacing_interval.count() < 0) {
    config_.pacing_interval = std::chrono::milliseconds(0);
  } else if (config_.pacing_interval > MAX_PACING_INTERVAL) {
    config_.pacing_interval = MAX_PACING_INTERVAL;
  }
}

LoopSummary DecisionLoop::run() {
  LOG_INFO("loop", "Starting decision loop (",
           config_.dry_run ? "dry-run" : "live", ", ",
           config_.max_rounds ? std::to_string(*config_.max_rounds) + " rounds"
                              : std::string("unbounded"),
           ", pacing ", config_.pacing_interval.count(), "ms)");

  uint64_t round_number = 0;
  while (!stop_requested()) {
    if (config_.max_rounds && round_number >= *config_.max_rounds)
      break;

    ++round_number;
    run_round(round_number);

    bool more_rounds =
        !config_.max_rounds || round_number < *config_.max_rounds;
    if (more_rounds && !stop_requested()) {
      pace();
    }
  }

  state_.store(LoopState::STOPPED);

  LoopSummary summary;
  summary.rounds_completed = rounds_completed_;
  summary.cumulative_profit = cumulative_profit_;
  LOG_INFO("loop", "Decision loop finished after ", summary.rounds_completed,
           " rounds, total PnL ", format_sol(summary.cumulative_profit, 6));
  return summary;
}

RoundReport DecisionLoop::run_round(uint64_t round_number) {
  RoundReport report;
  report.round_number = round_number;

  state_.store(LoopState::FETCHING);
  round::RoundSnapshot snapshot = builder_.build();
  report.round_id = snapshot.round_id;
  report.used_fallback = snapshot.is_fallback;

  state_.store(LoopState::DECIDING);
  report.chosen_tiles = decide(snapshot, report);

  state_.store(LoopState::ACTING);
  act(report.chosen_tiles, report);

  state_.store(LoopState::RECORDING);
  report.round_profit = estimate(snapshot, report.chosen_tiles);
  cumulative_profit_ += report.round_profit;
  report.cumulative_profit = cumulative_profit_;

  LOG_INFO("loop", "[Round ", round_number,
           "] Profit: ", format_sol(report.round_profit, 6),
           " | Total PnL: ", format_sol(report.cumulative_profit, 6));

  LedgerRecord record;
  record.round_id = report.round_id;
  record.chosen_tiles = report.chosen_tiles;
  record.round_profit = report.round_profit;
  record.cumulative_profit = report.cumulative_profit;

  auto appended = ledger_.append(record);
  if (appended.is_ok()) {
    report.ledger_written = true;
  } else {
    LOG_ERROR("ledger", "Failed to record round ", report.round_id, ": ",
              appended.error());
  }

  ++rounds_completed_;
  return report;
}

strategy::TileSelection
DecisionLoop::decide(const round::RoundSnapshot &snapshot,
                     RoundReport &report) {
  strategy::TileSelection raw;
  try {
    raw = strategy_.pick_tiles(snapshot);
  } catch (const std::exception &e) {
    LOG_ERROR("strategy", "Tile selection failed, sitting out round ",
              snapshot.round_id, ": ", e.what());
    return {};
  }

  strategy::TileSelection chosen =
      strategy::sanitize_selection(raw, &report.rejected_tiles);
  if (report.rejected_tiles > 0) {
    LOG_WARN("strategy", "Dropped ", report.rejected_tiles,
             " invalid or duplicate tile ids from selection");
  }

  LOG_DEBUG("strategy", "Chosen tiles for round ", snapshot.round_id, ": ",
            join_tiles(chosen));
  return chosen;
}

void DecisionLoop::act(const strategy::TileSelection &tiles,
                       RoundReport &report) {
  if (config_.dry_run) {
    for (uint32_t tile_id : tiles) {
      LOG_INFO("deploy", "[DRY-RUN] Would deploy tile ", tile_id, " with ",
               format_sol(config_.deploy_amount_sol, 4), " SOL");
    }
    return;
  }

  if (tiles.empty())
    return;

  std::string sink_error =
      sink_ ? sink_->configuration_error() : "no deployment sink configured";
  if (!sink_error.empty()) {
    report.acting_failed = true;
    std::unordered_map<std::string, std::string> context;
    context["round_tiles"] = join_tiles(tiles);
    context["hint"] = "set KEYPAIR_PATH and WALLET_ADDRESS or use --dry-run";
    LOG_CRITICAL_FAILURE("deploy",
                         "Live deployment unavailable: " + sink_error,
                         "LIVE_CONFIG_MISSING", context);
    return;
  }

  for (uint32_t tile_id : tiles) {
    ++report.deployments_attempted;
    Result<DeployReceipt> receipt("deploy not attempted");
    try {
      receipt = sink_->deploy(tile_id, config_.deploy_amount_sol);
    } catch (const std::exception &e) {
      receipt = Result<DeployReceipt>(std::string("deploy threw: ") + e.what());
    }

    if (receipt.is_ok()) {
      ++report.deployments_succeeded;
    } else {
      ++report.deployments_failed;
      LOG_ERROR("deploy", "Error deploying to tile ", tile_id, ": ",
                receipt.error());
    }
  }
}

double DecisionLoop::estimate(const round::RoundSnapshot &snapshot,
                              const strategy::TileSelection &tiles) {
  try {
    return strategy_.estimate_profit(snapshot, tiles);
  } catch (const std::exception &e) {
    LOG_ERROR("strategy", "Profit estimation failed for round ",
              snapshot.round_id, ": ", e.what());
    return 0.0;
  }
}

void DecisionLoop::pace() {
  state_.store(LoopState::PACING);
  auto deadline = std::chrono::steady_clock::now() + config_.pacing_interval;
  while (!stop_requested()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      break;
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(remaining, PACING_SLICE));
  }
}

} // namespace miner
} // namespace oreminer
