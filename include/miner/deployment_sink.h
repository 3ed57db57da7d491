#pragma once

#include "common/types.h"
#include "miner/config.h"
#include "network/rpc_client.h"
#include "wallet/keypair.h"
#include <memory>
#include <optional>
#include <string>

namespace oreminer {
namespace miner {

using namespace oreminer::common;

/**
 * Result of one accepted deployment
 */
struct DeployReceipt {
  uint32_t tile_id = 0;
  Lamports lamports = 0;
  std::string signature;
};

/**
 * Destination for live deployments.
 *
 * deploy() is called once per chosen tile, sequentially. A failure affects
 * that tile only.
 */
class IDeploymentSink {
public:
  virtual ~IDeploymentSink() = default;

  /// Empty when the sink can deploy, otherwise why it cannot
  virtual std::string configuration_error() const = 0;

  virtual Result<DeployReceipt> deploy(uint32_t tile_id, double amount_sol) = 0;
};

/// Convert a SOL amount to lamports (rounded to nearest)
Lamports sol_to_lamports(double amount_sol);

/**
 * Deploys by sending a signed System Program transfer from the miner's
 * keypair to the configured destination over JSON-RPC.
 */
class RpcDeploymentSink : public IDeploymentSink {
public:
  RpcDeploymentSink(std::shared_ptr<network::SolanaRpcClient> rpc,
                    std::optional<wallet::Keypair> payer,
                    std::optional<PublicKey> destination,
                    std::string configuration_error = "");

  /**
   * Resolve the keypair file and destination address from configuration.
   * Missing or invalid wallet settings produce a sink whose
   * configuration_error() explains the problem; this never throws.
   */
  static std::shared_ptr<RpcDeploymentSink>
  from_config(std::shared_ptr<network::SolanaRpcClient> rpc,
              const MinerConfig &config);

  std::string configuration_error() const override;
  Result<DeployReceipt> deploy(uint32_t tile_id, double amount_sol) override;

private:
  std::shared_ptr<network::SolanaRpcClient> rpc_;
  std::optional<wallet::Keypair> payer_;
  std::optional<PublicKey> destination_;
  std::string configuration_error_;
};

} // namespace miner
} // namespace oreminer
