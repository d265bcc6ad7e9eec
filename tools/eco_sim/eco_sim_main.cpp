// eco_sim: run one WFC + cellular automaton simulation and log how the
// terrain mix changes per step.
//
//   eco_sim [config.json] [--verbose]
#include <cstring>
#include <exception>
#include <map>
#include <string>

#include "eco/Log.hpp"
#include "eco/Simulation.hpp"
#include "eco/SimulationConfig.hpp"
#include "eco/Tile.hpp"

using namespace eco;

static std::string histogram(const TileGrid& g, const TileRegistry& registry) {
    std::map<TileKind, int> counts;
    for (TileKind t : g) ++counts[t];
    std::string out;
    for (const auto& [tile, n] : counts) {
        if (!out.empty()) out += ", ";
        out += registry.describe(tile) + "=" + std::to_string(n);
    }
    return out;
}

int main(int argc, char** argv) {
    std::string configPath;
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0) verbose = true;
        else configPath = argv[i];
    }

    logsys::init(verbose ? spdlog::level::debug : spdlog::level::info);
    auto log = logsys::get();

    TileRegistry registry;
    SimulationConfig cfg;
    try {
        if (!configPath.empty()) cfg = SimulationConfig::load(configPath, registry);
    } catch (const std::exception& e) {
        log->error("{}", e.what());
        return 2;
    }

    Simulation sim;
    SimulationHistory history;
    try {
        history = sim.run(cfg.width, cfg.height, cfg.steps, cfg.toOptions());
    } catch (const std::exception& e) {
        log->error("Simulation failed: {}", e.what());
        return 1;
    }

    for (std::size_t k = 0; k < history.size(); ++k)
        log->info("step {:>3}: {}", k, histogram(history[k], registry));

    const WfcStats& stats = sim.lastWfcStats();
    log->info("WFC: {} observations, {} contradictions, {} repairs",
              stats.observations, stats.contradictions, stats.repairs);

    const auto violations = sim.adjacency().countViolations(history.front());
    log->info("Generated {}x{} map, {} steps, {} adjacency violations in the initial state",
              cfg.width, cfg.height, cfg.steps, violations);
    return 0;
}
