#include "miner/deployment_sink.h"
#include "common/encoding.h"
#include "common/logging.h"
#include "round/round_state.h"
#include "wallet/transfer.h"
#include <cmath>

namespace oreminer {
namespace miner {

Lamports sol_to_lamports(double amount_sol) {
  if (!(amount_sol > 0.0))
    return 0;
  return static_cast<Lamports>(
      std::llround(amount_sol * static_cast<double>(LAMPORTS_PER_SOL)));
}

RpcDeploymentSink::RpcDeploymentSink(
    std::shared_ptr<network::SolanaRpcClient> rpc,
    std::optional<wallet::Keypair> payer, std::optional<PublicKey> destination,
    std::string configuration_error)
    : rpc_(std::move(rpc)), payer_(std::move(payer)),
      destination_(std::move(destination)),
      configuration_error_(std::move(configuration_error)) {}

std::shared_ptr<RpcDeploymentSink>
RpcDeploymentSink::from_config(std::shared_ptr<network::SolanaRpcClient> rpc,
                               const MinerConfig &config) {
  std::optional<wallet::Keypair> payer;
  std::optional<PublicKey> destination;
  std::string error;

  if (config.keypair_path.empty()) {
    error = "no keypair configured (set KEYPAIR_PATH or --keypair)";
  } else {
    auto loaded = wallet::Keypair::load_from_file(config.keypair_path);
    if (loaded.is_ok()) {
      payer = std::move(loaded).value();
    } else {
      error = loaded.error();
    }
  }

  if (error.empty()) {
    if (config.destination_address.empty()) {
      error = "no destination configured (set WALLET_ADDRESS or --destination)";
    } else {
      auto decoded = base58_decode(config.destination_address);
      if (decoded.is_err() || decoded.value().size() != 32) {
        error = "destination is not a base58 public key: " +
                config.destination_address;
      } else {
        destination = decoded.value();
      }
    }
  }

  if (error.empty() && !rpc) {
    error = "no RPC client available";
  }

  return std::make_shared<RpcDeploymentSink>(std::move(rpc), std::move(payer),
                                             std::move(destination), error);
}

std::string RpcDeploymentSink::configuration_error() const {
  if (!configuration_error_.empty())
    return configuration_error_;
  if (!rpc_)
    return "no RPC client available";
  if (!payer_)
    return "no keypair loaded";
  if (!destination_)
    return "no destination address";
  return "";
}

Result<DeployReceipt> RpcDeploymentSink::deploy(uint32_t tile_id,
                                                double amount_sol) {
  std::string config_error = configuration_error();
  if (!config_error.empty()) {
    return Result<DeployReceipt>("Deployment sink not configured: " +
                                 config_error);
  }

  if (tile_id < 1 || tile_id > round::TILE_COUNT) {
    return Result<DeployReceipt>("Tile id out of range: " +
                                 std::to_string(tile_id));
  }

  Lamports lamports = sol_to_lamports(amount_sol);
  if (lamports == 0) {
    return Result<DeployReceipt>("Deploy amount must be positive");
  }

  auto blockhash = rpc_->get_latest_blockhash();
  if (blockhash.is_err()) {
    return Result<DeployReceipt>("getLatestBlockhash failed: " +
                                 blockhash.error());
  }

  auto transaction = wallet::build_signed_transfer(*payer_, *destination_,
                                                   lamports, blockhash.value());
  if (transaction.is_err()) {
    return Result<DeployReceipt>(transaction.error());
  }

  auto sent = rpc_->send_transaction(transaction.value());
  if (sent.is_err()) {
    return Result<DeployReceipt>("sendTransaction failed: " + sent.error());
  }

  LOG_INFO("deploy", "TX sent for tile ", tile_id, ": ", sent.value().signature);

  DeployReceipt receipt;
  receipt.tile_id = tile_id;
  receipt.lamports = lamports;
  receipt.signature = sent.value().signature;
  return Result<DeployReceipt>(std::move(receipt));
}

} // namespace miner
} // namespace oreminer
