#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "eco/AdjacencyRules.hpp"
#include "eco/CaRuleEngine.hpp"
#include "eco/Simulation.hpp"
#include "eco/Tile.hpp"

namespace eco {

// One declarative CA rule; selector nullopt means "*".
struct EvolutionRuleSpec {
    std::optional<TileKind> tile;
    std::vector<ThresholdClause> clauses;
};

// Run parameters read from JSON:
//
//   {
//     "width": 64, "height": 64, "steps": 10, "seed": 7,
//     "tiles": [{"name": "mountain", "color": "#7f8c8d"}],
//     "adjacency": {"water": {"up": ["water", "sand"], "down": ["water"]}},
//     "evolution": [{"tile": "sand", "clauses":
//                      [{"neighbor": "water", "at_least": 5, "becomes": "water"}]}]
//   }
//
// Every key is optional. Tile names resolve through the registry given to
// parse()/load(); "tiles" entries are registered there first.
struct SimulationConfig {
    int width  = 64;
    int height = 64;
    int steps  = 10;
    std::optional<std::uint64_t> seed;

    std::vector<TileKind> extraTiles;
    std::optional<AdjacencyRules> adjacency;
    std::vector<EvolutionRuleSpec> evolution;

    // Throws std::runtime_error on malformed JSON, wrongly typed values or
    // integers outside the int range, TileNotFound on unknown tile names.
    // `registry` is only modified when parsing succeeds.
    static SimulationConfig parse(const std::string& text, TileRegistry& registry);

    // parse() on a file's contents; std::runtime_error if it cannot be read.
    static SimulationConfig load(const std::string& path, TileRegistry& registry);

    // Never throws; logs a warning and leaves `out` and `registry` untouched
    // on failure.
    static bool tryLoad(const std::string& path, TileRegistry& registry, SimulationConfig& out);

    // Universe = base tiles + extra tiles + every tile named in adjacency.
    [[nodiscard]] SimulationOptions toOptions() const;
};

} // namespace eco
