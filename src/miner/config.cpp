#include "miner/config.h"
#include "common/encoding.h"
#include "common/logging.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace oreminer {
namespace miner {

MinerConfig MinerConfigManager::create_default() { return MinerConfig{}; }

Result<MinerConfig>
MinerConfigManager::load_from_file(const std::string &config_path,
                                   const MinerConfig &base) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    return Result<MinerConfig>("Could not open config file " + config_path);
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::exception &e) {
    return Result<MinerConfig>("Invalid JSON in " + config_path + ": " +
                               e.what());
  }

  auto loaded = load_from_json(j, base);
  if (loaded.is_err()) {
    return Result<MinerConfig>(config_path + ": " + loaded.error());
  }

  MinerConfig config = std::move(loaded).value();
  config.config_file_path = config_path;
  return Result<MinerConfig>(std::move(config));
}

Result<MinerConfig> MinerConfigManager::load_from_json(const json &j,
                                                       const MinerConfig &base) {
  if (!j.is_object()) {
    return Result<MinerConfig>("Configuration root must be an object");
  }

  MinerConfig config = base;
  try {
    if (j.contains("rpc")) {
      const auto &rpc = j.at("rpc");
      config.rpc_url = rpc.value("url", config.rpc_url);
      config.program_id = rpc.value("program_id", config.program_id);
      config.rpc_timeout_seconds =
          rpc.value("timeout_seconds", config.rpc_timeout_seconds);
    }

    if (j.contains("mining")) {
      const auto &mining = j.at("mining");
      config.dry_run = mining.value("dry_run", config.dry_run);
      if (mining.contains("rounds")) {
        int64_t rounds = mining.at("rounds").get<int64_t>();
        config.rounds = rounds > 0 ? static_cast<uint64_t>(rounds) : 0;
      }
      config.sleep_seconds =
          mining.value("sleep_seconds", config.sleep_seconds);
      config.deploy_amount_sol =
          mining.value("deploy_amount_sol", config.deploy_amount_sol);
      config.max_tiles = mining.value("max_tiles", config.max_tiles);
    }

    if (j.contains("wallet")) {
      const auto &wallet = j.at("wallet");
      config.keypair_path = wallet.value("keypair_path", config.keypair_path);
      config.destination_address =
          wallet.value("destination_address", config.destination_address);
    }

    if (j.contains("ledger")) {
      config.ledger_path = j.at("ledger").value("path", config.ledger_path);
    }

    if (j.contains("logging")) {
      const auto &logging = j.at("logging");
      config.log_level = logging.value("level", config.log_level);
      config.log_json = logging.value("json", config.log_json);
    }
  } catch (const json::exception &e) {
    return Result<MinerConfig>("Invalid configuration value: " +
                               std::string(e.what()));
  }

  return Result<MinerConfig>(std::move(config));
}

json MinerConfigManager::to_json(const MinerConfig &config) {
  json j;
  j["rpc"] = {{"url", config.rpc_url},
              {"program_id", config.program_id},
              {"timeout_seconds", config.rpc_timeout_seconds}};
  j["mining"] = {{"dry_run", config.dry_run},
                 {"rounds", config.rounds},
                 {"sleep_seconds", config.sleep_seconds},
                 {"deploy_amount_sol", config.deploy_amount_sol},
                 {"max_tiles", config.max_tiles}};
  j["wallet"] = {{"keypair_path", config.keypair_path},
                 {"destination_address", config.destination_address}};
  j["ledger"] = {{"path", config.ledger_path}};
  j["logging"] = {{"level", config.log_level}, {"json", config.log_json}};
  return j;
}

void MinerConfigManager::apply_environment(MinerConfig &config,
                                           const EnvLookup &lookup) {
  auto get = [&lookup](const char *name) -> const char * {
    return lookup ? lookup(name) : std::getenv(name);
  };

  if (const char *keypair = get("KEYPAIR_PATH"); keypair && *keypair) {
    config.keypair_path = keypair;
  }
  if (const char *wallet = get("WALLET_ADDRESS"); wallet && *wallet) {
    config.destination_address = wallet;
  }
  if (const char *rpc = get("ORE_RPC_URL"); rpc && *rpc) {
    config.rpc_url = rpc;
  }
}

std::string MinerConfigManager::validate_config(const MinerConfig &config) {
  if (config.rpc_url.empty()) {
    return "RPC URL cannot be empty";
  }

  if (config.program_id.empty()) {
    return "Program id cannot be empty";
  }
  auto program = base58_decode(config.program_id);
  if (program.is_err() || program.value().size() != 32) {
    return "Program id is not a base58 public key: " + config.program_id;
  }

  if (config.rpc_timeout_seconds <= 0) {
    return "RPC timeout must be positive";
  }

  if (!std::isfinite(config.deploy_amount_sol) ||
      config.deploy_amount_sol <= 0.0) {
    return "Deploy amount must be a positive number of SOL";
  }

  if (config.max_tiles > 25) {
    return "Max tiles must be between 0 and 25";
  }

  if (!std::isfinite(config.sleep_seconds)) {
    return "Sleep interval must be finite";
  }
  if (config.sleep_seconds > MAX_SLEEP_SECONDS) {
    return "Sleep interval must not exceed one year";
  }

  if (!parse_log_level(config.log_level)) {
    return "Invalid log level: " + config.log_level;
  }

  return ""; // Valid
}

std::optional<uint64_t>
MinerConfigManager::round_limit(const MinerConfig &config) {
  if (config.rounds == 0)
    return std::nullopt;
  return config.rounds;
}

std::chrono::milliseconds
MinerConfigManager::pacing_interval(const MinerConfig &config) {
  double seconds = config.sleep_seconds;
  if (!(seconds > 0.0))
    seconds = 0.0;
  seconds = std::min(seconds, MAX_SLEEP_SECONDS);
  return std::chrono::milliseconds(
      static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

} // namespace miner
} // namespace oreminer
