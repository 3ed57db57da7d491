#pragma once

/**
 * @file ore_miner.h
 * @brief Public entry point of the ORE miner library
 *
 * Round accounts are fetched from a Solana RPC node, decoded into a
 * RoundSnapshot, handed to a strategy and acted upon by the DecisionLoop.
 */

#include "common/encoding.h"
#include "common/logging.h"
#include "common/types.h"
#include "miner/config.h"
#include "miner/decision_loop.h"
#include "miner/deployment_sink.h"
#include "miner/ledger.h"
#include "miner/stop_watcher.h"
#include "network/http_client.h"
#include "network/rpc_client.h"
#include "round/account_data.h"
#include "round/round_state.h"
#include "round/snapshot_builder.h"
#include "strategy/strategy.h"
#include "wallet/keypair.h"
#include "wallet/transfer.h"
