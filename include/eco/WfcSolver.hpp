#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "eco/AdjacencyRules.hpp"
#include "eco/Grid2D.hpp"
#include "eco/Rng.hpp"
#include "eco/Tile.hpp"

namespace eco {

struct WfcStats {
    std::size_t observations = 0;       // cells chosen by minimum entropy
    std::size_t propagationVisits = 0;  // queue pops
    std::size_t contradictions = 0;     // neighbor filtered down to nothing
    std::size_t repairs = 0;            // contradictions resolved by a forced draw
};

// Wave function collapse over a fixed tile universe.
//
// Each cell starts with every tile as a candidate. The uncollapsed cell with
// the fewest candidates (first in row-major order on ties) is collapsed to a
// uniform random candidate, then constraints spread breadth-first. When a
// neighbor would be left with no candidate it is forced to a random tile from
// what it had; the output may break a rule there but the run always ends.
class WfcSolver {
public:
    WfcSolver(const AdjacencyRuleTable& rules, Rng& rng) noexcept
        : rules_(rules), rng_(rng) {}

    // Throws std::invalid_argument if width <= 0, height <= 0 or the universe
    // is empty.
    [[nodiscard]] TileGrid generate(int width, int height, const TileSet& universe);

    // Uses rules.universe().
    [[nodiscard]] TileGrid generate(int width, int height);

    [[nodiscard]] const WfcStats& lastStats() const noexcept { return stats_; }

private:
    using Candidates = std::vector<int>;  // ascending indices into tiles_

    void prepare(int width, int height, const TileSet& universe);
    [[nodiscard]] int lowestEntropyCell() const;
    void observe(int cell);
    void propagate(int seed);
    void markCollapsed(int cell);

    const AdjacencyRuleTable& rules_;
    Rng& rng_;

    int W_ = 0, H_ = 0;
    TileSet tiles_;
    // compat_[d][a * T + b] != 0 when tiles_[b] may sit in direction d of tiles_[a]
    std::vector<std::uint8_t> compat_[4];
    std::vector<Candidates> wave_;
    std::vector<std::uint8_t> uncollapsed_;
    std::size_t remaining_ = 0;
    WfcStats stats_;
};

} // namespace eco
