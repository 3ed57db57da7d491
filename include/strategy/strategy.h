#pragma once

#include "round/snapshot_builder.h"
#include <cstdint>
#include <vector>

namespace oreminer {
namespace strategy {

using round::RoundSnapshot;

/// Ordered, duplicate-free tile ids in 1..25
using TileSelection = std::vector<uint32_t>;

/**
 * Tile selection policy.
 *
 * Implementations must be deterministic for a given snapshot and must not
 * perform I/O; the decision loop does all reporting.
 */
class IStrategy {
public:
  virtual ~IStrategy() = default;

  /// Choose the tiles to deploy on this round (empty means sit out)
  virtual TileSelection pick_tiles(const RoundSnapshot &snapshot) const = 0;

  /// Simulated profit in SOL of deploying on `tiles`; may be negative
  virtual double estimate_profit(const RoundSnapshot &snapshot,
                                 const TileSelection &tiles) const = 0;
};

/**
 * Deploys on the least crowded tiles.
 *
 * Picks up to max_tiles tiles with the smallest SOL deployed (ties to the lower
 * tile id) and estimates the expected value of a unit deployment on each:
 * with p = 1 / tile_count the round's win probability for a tile, a winning
 * unit u on tile t takes its share u / (d_t + u) of the SOL deployed on every
 * other tile, a losing unit is forfeited.
 */
class LeastCrowdedStrategy : public IStrategy {
public:
  LeastCrowdedStrategy(uint32_t max_tiles, double unit_amount_sol);

  TileSelection pick_tiles(const RoundSnapshot &snapshot) const override;
  double estimate_profit(const RoundSnapshot &snapshot,
                         const TileSelection &tiles) const override;

  uint32_t max_tiles() const { return max_tiles_; }
  double unit_amount_sol() const { return unit_amount_sol_; }

private:
  uint32_t max_tiles_;
  double unit_amount_sol_;
};

/**
 * Enforce the selection contract on arbitrary strategy output: drops ids
 * outside 1..25 and repeated ids, keeping the first occurrence order.
 * @param rejected incremented once per dropped id when non-null
 */
TileSelection sanitize_selection(const TileSelection &tiles,
                                 size_t *rejected = nullptr);

} // namespace strategy
} // namespace oreminer
