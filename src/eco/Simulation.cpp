#include "eco/Simulation.hpp"

#include <stdexcept>

#include "eco/Log.hpp"

namespace eco {

Simulation::Simulation(std::uint64_t seed) : rng_(seed) {}

void Simulation::resetRules() {
    adjacency_.reset();
    evolution_.resetRules();
}

SimulationHistory Simulation::run(int width, int height, int steps, const SimulationOptions& options) {
    if (width <= 0 || height <= 0)
        throw std::invalid_argument("Simulation::run: width and height must be > 0");
    if (steps < 0)
        throw std::invalid_argument("Simulation::run: steps must be >= 0");

    auto log = logsys::get();

    if (options.seed) rng_.reseed(*options.seed);
    if (options.tileUniverse) adjacency_.setUniverse(*options.tileUniverse);
    if (options.adjacencyRules) adjacency_.install(*options.adjacencyRules);
    if (options.evolutionRules) evolution_.installRules(*options.evolutionRules);

    SimulationHistory history;
    history.reserve(static_cast<std::size_t>(steps) + 1);

    log->info("Generating {}x{} initial state with WFC...", width, height);
    WfcSolver solver(adjacency_, rng_);
    history.push_back(solver.generate(width, height));
    wfcStats_ = solver.lastStats();
    if (wfcStats_.repairs > 0)
        log->info("WFC repaired {} contradictions; the map may break adjacency rules there",
                  wfcStats_.repairs);

    if (steps > 0) log->info("Evolving with cellular automaton for {} steps...", steps);
    for (int step = 1; step <= steps; ++step) {
        history.push_back(evolution_.step(history.back()));
        if (step % 5 == 0 || step == steps)
            log->info("Completed step {} of {}", step, steps);
    }
    return history;
}

} // namespace eco
