#pragma once

#include "common/types.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace oreminer {
namespace miner {

using namespace oreminer::common;

/// ORE v3 program id
constexpr const char *DEFAULT_PROGRAM_ID =
    "oreV3EG1i9BEgiAJ8b177Z2S2rMarzak4NMv1kULvWv";

/// Longest pause accepted between rounds (one year)
constexpr double MAX_SLEEP_SECONDS = 365.0 * 24.0 * 60.0 * 60.0;

/**
 * @brief Complete configuration for a mining run
 *
 * Populated from defaults, then an optional JSON file, then the environment,
 * then command-line flags (highest precedence).
 */
struct MinerConfig {
  // RPC endpoint
  std::string rpc_url = "https://api.mainnet-beta.solana.com"; ///< JSON-RPC URL
  std::string program_id = DEFAULT_PROGRAM_ID; ///< Program owning round accounts
  int rpc_timeout_seconds = 30;                ///< Per-request timeout

  // Loop behaviour
  bool dry_run = false;           ///< Simulate deployments only
  uint64_t rounds = 0;            ///< Rounds to run, 0 = unlimited
  double sleep_seconds = 5.0;     ///< Pause between rounds (clamped >= 0)
  double deploy_amount_sol = 0.01; ///< SOL deployed per chosen tile
  uint32_t max_tiles = 5;         ///< Strategy width

  // Live deployment
  std::string keypair_path;        ///< Solana CLI keypair file
  std::string destination_address; ///< Base58 recipient of deployments

  // Output
  std::string ledger_path = "profit_log.csv"; ///< Append-only profit ledger
  std::string log_level = "info";             ///< trace/debug/info/warn/error
  bool log_json = false;                      ///< JSON log lines
  std::string config_file_path;               ///< Source file, if any
};

/**
 * @brief Loader and validator for MinerConfig
 */
class MinerConfigManager {
public:
  using EnvLookup = std::function<const char *(const char *)>;

  static MinerConfig create_default();

  /**
   * @brief Load a JSON config file on top of `base`
   * @return merged configuration, or an error for unreadable/invalid JSON
   */
  static Result<MinerConfig> load_from_file(const std::string &config_path,
                                            const MinerConfig &base);

  /**
   * @brief Apply the sections of a JSON document on top of `base`
   *
   * Recognised sections: rpc {url, program_id, timeout_seconds},
   * mining {dry_run, rounds, sleep_seconds, deploy_amount_sol, max_tiles},
   * wallet {keypair_path, destination_address}, ledger {path},
   * logging {level, json}. Unknown keys are ignored.
   */
  static Result<MinerConfig> load_from_json(const nlohmann::json &json,
                                            const MinerConfig &base);

  static nlohmann::json to_json(const MinerConfig &config);

  /**
   * @brief Apply KEYPAIR_PATH, WALLET_ADDRESS and ORE_RPC_URL when set
   */
  static void apply_environment(MinerConfig &config,
                                const EnvLookup &lookup = nullptr);

  /**
   * @brief Validate configuration
   * @return validation error message, or empty string if valid
   */
  static std::string validate_config(const MinerConfig &config);

  /// Bounded round count, nullopt when unlimited
  static std::optional<uint64_t> round_limit(const MinerConfig &config);

  /// Pause between rounds, clamped to [0, MAX_SLEEP_SECONDS]
  static std::chrono::milliseconds pacing_interval(const MinerConfig &config);
};

} // namespace miner
} // namespace oreminer
