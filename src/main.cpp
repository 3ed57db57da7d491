#include "ore_miner.h"
#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <signal.h>
#include <stdexcept>
#include <string>

using namespace oreminer;

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested.store(true);
  }
}

void print_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Mining Options:" << std::endl;
  std::cout << "  --dry-run                  Simulate deployments, send nothing"
            << std::endl;
  std::cout << "  --rounds N                 Rounds to run (default: 0, "
               "unlimited)"
            << std::endl;
  std::cout << "  --sleep SECONDS            Pause between rounds (default: 5)"
            << std::endl;
  std::cout << "  --amount SOL               SOL deployed per tile (default: "
               "0.01)"
            << std::endl;
  std::cout << "  --max-tiles N              Tiles chosen per round (default: 5)"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Network Options:" << std::endl;
  std::cout << "  --rpc-url URL              Solana JSON-RPC endpoint "
               "(env: ORE_RPC_URL)"
            << std::endl;
  std::cout << "  --program-id ID            Program owning round accounts"
            << std::endl;
  std::cout << "  --keypair PATH             Signing keypair file "
               "(env: KEYPAIR_PATH)"
            << std::endl;
  std::cout << "  --destination ADDR         Deployment recipient "
               "(env: WALLET_ADDRESS)"
            << std::endl;
  std::cout << std::endl;
  std::cout << "General Options:" << std::endl;
  std::cout << "  --ledger PATH              Profit ledger CSV (default: "
               "profit_log.csv)"
            << std::endl;
  std::cout << "  --config FILE              Path to JSON configuration file"
            << std::endl;
  std::cout << "  --log-level LEVEL          Log level (trace, debug, info, "
               "warn, error)"
            << std::endl;
  std::cout << "  --log-json                 Emit log lines as JSON" << std::endl;
  std::cout << "  --help                     Show this help message"
            << std::endl;
}

// Locate --config before anything else so the file sits below env and flags
std::string find_config_path(int argc, char *argv[]) {
  for (int i = 1; i < argc - 1; ++i) {
    if (std::string(argv[i]) == "--config") {
      return argv[i + 1];
    }
  }
  return "";
}

/**
 * Apply command-line flags on top of `config`.
 * @return -1 to continue, otherwise the process exit status
 */
int apply_arguments(int argc, char *argv[], miner::MinerConfig &config) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    try {
      if (arg == "--help" || arg == "-h") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--dry-run") {
        config.dry_run = true;
      } else if (arg == "--log-json") {
        config.log_json = true;
      } else if (arg == "--rounds" && has_value) {
        long long rounds = std::stoll(argv[++i]);
        config.rounds = rounds > 0 ? static_cast<uint64_t>(rounds) : 0;
      } else if (arg == "--sleep" && has_value) {
        config.sleep_seconds = std::stod(argv[++i]);
      } else if (arg == "--amount" && has_value) {
        config.deploy_amount_sol = std::stod(argv[++i]);
      } else if (arg == "--max-tiles" && has_value) {
        long max_tiles = std::stol(argv[++i]);
        if (max_tiles < 0) {
          std::cerr << "--max-tiles must not be negative" << std::endl;
          return 1;
        }
        config.max_tiles = static_cast<uint32_t>(max_tiles);
      } else if (arg == "--rpc-url" && has_value) {
        config.rpc_url = argv[++i];
      } else if (arg == "--program-id" && has_value) {
        config.program_id = argv[++i];
      } else if (arg == "--keypair" && has_value) {
        config.keypair_path = argv[++i];
      } else if (arg == "--destination" && has_value) {
        config.destination_address = argv[++i];
      } else if (arg == "--ledger" && has_value) {
        config.ledger_path = argv[++i];
      } else if (arg == "--log-level" && has_value) {
        config.log_level = argv[++i];
      } else if (arg == "--config" && has_value) {
        ++i; // already loaded
      } else {
        std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    } catch (const std::invalid_argument &) {
      std::cerr << "Invalid value for " << arg << ": " << argv[i] << std::endl;
      return 1;
    } catch (const std::out_of_range &) {
      std::cerr << "Value out of range for " << arg << ": " << argv[i]
                << std::endl;
      return 1;
    }
  }
  return -1;
}

void print_summary(const miner::LoopSummary &summary, bool dry_run) {
  std::cout << std::endl;
  std::cout << "=== Mining Summary ===" << std::endl;
  std::cout << "Mode:             " << (dry_run ? "dry-run" : "live")
            << std::endl;
  std::cout << "Rounds completed: " << summary.rounds_completed << std::endl;
  std::cout << "Total PnL:        " << std::fixed << std::setprecision(6)
            << summary.cumulative_profit << " SOL" << std::endl;
}

int main(int argc, char *argv[]) {
  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);

  miner::MinerConfig config = miner::MinerConfigManager::create_default();

  std::string config_path = find_config_path(argc, argv);
  if (!config_path.empty()) {
    auto loaded = miner::MinerConfigManager::load_from_file(config_path, config);
    if (loaded.is_err()) {
      std::cerr << "Configuration error: " << loaded.error() << std::endl;
      return 1;
    }
    config = std::move(loaded).value();
  }

  miner::MinerConfigManager::apply_environment(config);

  int status = apply_arguments(argc, argv, config);
  if (status >= 0) {
    return status;
  }

  std::string validation_error =
      miner::MinerConfigManager::validate_config(config);
  if (!validation_error.empty()) {
    std::cerr << "Configuration error: " << validation_error << std::endl;
    return 1;
  }

  auto &logger = common::Logger::instance();
  logger.set_level(*common::parse_log_level(config.log_level));
  logger.set_json_format(config.log_json);

  try {
    LOG_INFO("main", "ORE miner starting (rpc ", config.rpc_url, ", program ",
             config.program_id, ")");

    auto rpc = std::make_shared<network::SolanaRpcClient>(
        config.rpc_url, config.rpc_timeout_seconds);
    round::RoundSnapshotBuilder builder(rpc, config.program_id);
    strategy::LeastCrowdedStrategy strategy(config.max_tiles,
                                            config.deploy_amount_sol);

    miner::CsvLedger ledger(config.ledger_path);
    auto ledger_ready = ledger.initialize();
    if (ledger_ready.is_err()) {
      LOG_ERROR("ledger", ledger_ready.error(),
                " (rounds will still run, records may be lost)");
    }

    std::shared_ptr<miner::IDeploymentSink> sink;
    if (!config.dry_run) {
      auto live_sink = miner::RpcDeploymentSink::from_config(rpc, config);
      std::string sink_error = live_sink->configuration_error();
      if (sink_error.empty()) {
        LOG_INFO("main", "Live mode enabled");
      } else {
        LOG_WALLET_ERROR("Live mode requested but deployment is unavailable: " +
                             sink_error,
                         "WALLET_CONFIG_MISSING");
      }
      sink = live_sink;
    }

    miner::LoopConfig loop_config;
    loop_config.dry_run = config.dry_run;
    loop_config.max_rounds = miner::MinerConfigManager::round_limit(config);
    loop_config.pacing_interval =
        miner::MinerConfigManager::pacing_interval(config);
    loop_config.deploy_amount_sol = config.deploy_amount_sol;

    miner::DecisionLoop loop(builder, strategy, sink, ledger, loop_config);

    miner::LoopSummary summary;
    {
      // Joins its thread on scope exit, also when run() throws
      miner::StopWatcher stop_watcher(g_shutdown_requested, loop);
      summary = loop.run();
    }

    print_summary(summary, config.dry_run);
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
