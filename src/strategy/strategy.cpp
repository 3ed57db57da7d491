#include "strategy/strategy.h"
#include <algorithm>
#include <bitset>

namespace oreminer {
namespace strategy {

LeastCrowdedStrategy::LeastCrowdedStrategy(uint32_t max_tiles,
                                           double unit_amount_sol)
    : max_tiles_(std::min<uint32_t>(max_tiles,
                                    static_cast<uint32_t>(round::TILE_COUNT))),
      unit_amount_sol_(unit_amount_sol) {}

TileSelection
LeastCrowdedStrategy::pick_tiles(const RoundSnapshot &snapshot) const {
  std::vector<round::TileDeployment> candidates;
  candidates.reserve(snapshot.tiles.size());
  for (const auto &tile : snapshot.tiles) {
    if (tile.tile_id >= 1 && tile.tile_id <= round::TILE_COUNT) {
      candidates.push_back(tile);
    }
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const round::TileDeployment &a, const round::TileDeployment &b) {
              if (a.sol_deployed != b.sol_deployed)
                return a.sol_deployed < b.sol_deployed;
              return a.tile_id < b.tile_id;
            });

  size_t take = std::min<size_t>(max_tiles_, candidates.size());
  TileSelection chosen;
  chosen.reserve(take);
  for (size_t i = 0; i < take; ++i) {
    chosen.push_back(candidates[i].tile_id);
  }
  std::sort(chosen.begin(), chosen.end());
  chosen.erase(std::unique(chosen.begin(), chosen.end()), chosen.end());
  return chosen;
}

double LeastCrowdedStrategy::estimate_profit(const RoundSnapshot &snapshot,
                                             const TileSelection &tiles) const {
  if (tiles.empty() || snapshot.tiles.empty() || unit_amount_sol_ <= 0.0)
    return 0.0;

  double total_sol = 0.0;
  for (const auto &tile : snapshot.tiles) {
    total_sol += tile.sol_deployed;
  }

  const double p_win = 1.0 / static_cast<double>(snapshot.tiles.size());
  const double unit = unit_amount_sol_;

  double profit = 0.0;
  for (uint32_t tile_id : tiles) {
    auto it = std::find_if(snapshot.tiles.begin(), snapshot.tiles.end(),
                           [tile_id](const round::TileDeployment &tile) {
                             return tile.tile_id == tile_id;
                           });
    double deployed = it != snapshot.tiles.end() ? it->sol_deployed : 0.0;
    double losers_pool = std::max(0.0, total_sol - deployed);
    double share = unit / (deployed + unit);
    profit += p_win * share * losers_pool - (1.0 - p_win) * unit;
  }
  return profit;
}

TileSelection sanitize_selection(const TileSelection &tiles, size_t *rejected) {
  std::bitset<round::TILE_COUNT + 1> seen;
  TileSelection clean;
  clean.reserve(tiles.size());
  for (uint32_t tile_id : tiles) {
    if (tile_id < 1 || tile_id > round::TILE_COUNT || seen.test(tile_id)) {
      if (rejected)
        (*rejected)++;
      continue;
    }
    seen.set(tile_id);
    clean.push_back(tile_id);
  }
  return clean;
}

} // namespace strategy
} // namespace oreminer
