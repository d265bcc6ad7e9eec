#pragma once
#include <cstddef>
#include <map>

#include "eco/Direction.hpp"
#include "eco/Grid2D.hpp"
#include "eco/Tile.hpp"

namespace eco {

// tile -> direction -> tiles allowed as that neighbor.
using AdjacencyRules = std::map<TileKind, std::map<Direction, TileSet>>;

// The water/sand/grass/forest shoreline rule set.
AdjacencyRules defaultAdjacencyRules();

// Per (tile, direction) neighbor whitelist. A missing entry means
// "anything in the universe", not "nothing"; rules are used exactly as
// authored and are never mirrored.
class AdjacencyRuleTable {
public:
    AdjacencyRuleTable();
    AdjacencyRuleTable(AdjacencyRules rules, TileSet universe);

    // Replaces the rules with a copy of `rules`. The universe is kept.
    void install(const AdjacencyRules& rules);
    // Back to defaultAdjacencyRules() over the four base tiles.
    void reset();

    void setUniverse(TileSet universe);
    [[nodiscard]] const TileSet& universe() const noexcept { return universe_; }
    [[nodiscard]] const AdjacencyRules& rules() const noexcept { return rules_; }

    [[nodiscard]] const TileSet& allowedNeighbors(TileKind tile, Direction dir) const;
    [[nodiscard]] bool isAllowed(TileKind tile, TileKind neighbor, Direction dir) const;

    // Number of directed edges (cell -> in-bounds neighbor) the grid breaks.
    [[nodiscard]] std::size_t countViolations(const TileGrid& grid) const;

private:
    AdjacencyRules rules_;
    TileSet universe_;
};

} // namespace eco
