#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "eco/AdjacencyRules.hpp"
#include "eco/CaRuleEngine.hpp"
#include "eco/Grid2D.hpp"
#include "eco/Rng.hpp"
#include "eco/WfcSolver.hpp"

namespace eco {

// history[0] is the WFC map, history[k] the map after k CA steps.
using SimulationHistory = std::vector<TileGrid>;

struct SimulationOptions {
    std::optional<std::uint64_t> seed;             // reseed before WFC when set
    std::optional<AdjacencyRules> adjacencyRules;  // installed before WFC
    std::optional<std::vector<CaRule>> evolutionRules;
    std::optional<TileSet> tileUniverse;           // replaces the solver universe
};

// WFC terrain followed by N cellular-automaton steps.
//
// Each Simulation owns its rule tables and random stream, so separate
// instances never see each other's rules. Overrides passed to run() stay
// installed on this instance afterwards; call resetRules() to drop them.
class Simulation {
public:
    explicit Simulation(std::uint64_t seed = Rng::kDefaultSeed);

    // Throws std::invalid_argument for width <= 0, height <= 0 or steps < 0,
    // before any override is installed.
    [[nodiscard]] SimulationHistory run(int width, int height, int steps,
                                        const SimulationOptions& options = {});

    void resetRules();

    AdjacencyRuleTable&       adjacency() noexcept { return adjacency_; }
    const AdjacencyRuleTable& adjacency() const noexcept { return adjacency_; }
    CaRuleEngine&             evolution() noexcept { return evolution_; }
    const CaRuleEngine&       evolution() const noexcept { return evolution_; }

    [[nodiscard]] const WfcStats& lastWfcStats() const noexcept { return wfcStats_; }

private:
    AdjacencyRuleTable adjacency_;
    CaRuleEngine evolution_;
    Rng rng_;
    WfcStats wfcStats_;
};

} // namespace eco
