#pragma once
#include <cstddef>
#include <functional>
#include <utility>
#include <variant>
#include <vector>

#include "eco/Grid2D.hpp"
#include "eco/Tile.hpp"

namespace eco {

// Per-kind tallies over the 8-neighborhood of one cell. Out-of-bounds
// positions are not counted, so corners see 3 neighbors and edges 5.
class NeighborCounts {
public:
    void add(TileKind t);
    [[nodiscard]] int operator[](TileKind t) const noexcept;
    [[nodiscard]] int total() const noexcept { return total_; }

private:
    std::vector<std::pair<TileKind, int>> counts_;  // few kinds; linear scan
    int total_ = 0;
};

struct AnyTile {
    friend constexpr bool operator==(AnyTile, AnyTile) noexcept { return true; }
};

using TileSelector = std::variant<TileKind, AnyTile>;
using Transition   = std::function<TileKind(TileKind current, const NeighborCounts& counts)>;

struct CaRule {
    TileSelector selector;
    Transition transform;
};

// "If at least `atLeast` neighbors are `neighbor`, become `becomes`."
struct ThresholdClause {
    TileKind neighbor;
    int atLeast = 0;
    TileKind becomes;
};

// First satisfied clause decides; none satisfied -> unchanged.
Transition thresholdTransition(std::vector<ThresholdClause> clauses);

// Built-in transitions for water, sand, grass and forest.
std::vector<CaRule> defaultCaRules();

// Ordered transition rules. An exact-kind rule beats a wildcard; among rules
// of the same kind the most recently added wins; no match leaves the cell as
// it is. step() reads one snapshot and writes a new grid, so the order cells
// are visited in cannot change the result.
class CaRuleEngine {
public:
    CaRuleEngine();

    void addRule(TileSelector selector, Transition transform);
    void addRule(CaRule rule);
    // resetRules() followed by addRule() for each entry.
    void installRules(const std::vector<CaRule>& rules);
    void resetRules();

    [[nodiscard]] const CaRule* findRule(TileKind tile) const noexcept;
    [[nodiscard]] std::size_t ruleCount() const noexcept { return rules_.size(); }

    [[nodiscard]] TileGrid step(const TileGrid& grid) const;

    [[nodiscard]] static NeighborCounts countNeighbors(const TileGrid& grid, int x, int y);

private:
    std::vector<CaRule> rules_;
};

} // namespace eco
