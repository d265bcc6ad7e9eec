#include "eco/WfcSolver.hpp"

#include <algorithm>
#include <deque>
#include <limits>
#include <stdexcept>

#include "eco/Log.hpp"

namespace eco {

TileGrid WfcSolver::generate(int width, int height) {
    return generate(width, height, rules_.universe());
}

TileGrid WfcSolver::generate(int width, int height, const TileSet& universe) {
    if (width <= 0 || height <= 0)
        throw std::invalid_argument("WfcSolver::generate: width and height must be > 0");
    if (universe.empty())
        throw std::invalid_argument("WfcSolver::generate: tile universe is empty");

    prepare(width, height, universe);

    while (remaining_ > 0) {
        const int cell = lowestEntropyCell();
        if (cell < 0) break;
        observe(cell);
        propagate(cell);
    }

    TileGrid out(W_, H_);
    for (std::size_t i = 0; i < wave_.size(); ++i)
        out[i] = tiles_[static_cast<std::size_t>(wave_[i].front())];

    logsys::get()->debug("WfcSolver: {}x{} over {} tiles, {} observations, {} visits, {} contradictions ({} repaired)",
                         W_, H_, tiles_.size(), stats_.observations, stats_.propagationVisits,
                         stats_.contradictions, stats_.repairs);
    return out;
}

void WfcSolver::prepare(int width, int height, const TileSet& universe) {
    W_ = width;
    H_ = height;
    stats_ = {};

    tiles_.clear();
    for (TileKind t : universe)
        if (std::find(tiles_.begin(), tiles_.end(), t) == tiles_.end()) tiles_.push_back(t);

    const std::size_t T = tiles_.size();
    for (Direction d : kDirections) {
        auto& table = compat_[static_cast<int>(d)];
        table.assign(T * T, 0);
        for (std::size_t a = 0; a < T; ++a) {
            const TileSet& allowed = rules_.allowedNeighbors(tiles_[a], d);
            for (std::size_t b = 0; b < T; ++b) {
                if (std::find(allowed.begin(), allowed.end(), tiles_[b]) != allowed.end())
                    table[a * T + b] = 1;
            }
        }
    }

    Candidates all(T);
    for (std::size_t i = 0; i < T; ++i) all[i] = static_cast<int>(i);

    const std::size_t N = static_cast<std::size_t>(W_) * static_cast<std::size_t>(H_);
    wave_.assign(N, all);
    uncollapsed_.assign(N, 1);
    remaining_ = N;
}

int WfcSolver::lowestEntropyCell() const {
    int best = -1;
    std::size_t bestEntropy = std::numeric_limits<std::size_t>::max();
    for (std::size_t i = 0; i < wave_.size(); ++i) {
        if (!uncollapsed_[i]) continue;
        const std::size_t e = wave_[i].size() - 1;
        if (e < bestEntropy) {
            bestEntropy = e;
            best = static_cast<int>(i);
            if (e == 0) break;
        }
    }
    return best;
}

void WfcSolver::observe(int cell) {
    auto& cands = wave_[static_cast<std::size_t>(cell)];
    const int chosen = rng_.pick(cands);
    cands.assign(1, chosen);
    markCollapsed(cell);
    ++stats_.observations;
}

void WfcSolver::markCollapsed(int cell) {
    auto& flag = uncollapsed_[static_cast<std::size_t>(cell)];
    if (flag) {
        flag = 0;
        --remaining_;
    }
}

void WfcSolver::propagate(int seed) {
    const std::size_t T = tiles_.size();
    std::vector<std::uint8_t> reachable(T);
    Candidates kept;

    std::deque<int> queue{seed};
    while (!queue.empty()) {
        const int i = queue.front();
        queue.pop_front();
        ++stats_.propagationVisits;

        const int x = i % W_, y = i / W_;
        for (Direction d : kDirections) {
            const auto [dx, dy] = offset(d);
            const int nx = x + dx, ny = y + dy;
            if (static_cast<unsigned>(nx) >= static_cast<unsigned>(W_) ||
                static_cast<unsigned>(ny) >= static_cast<unsigned>(H_)) continue;
            const int j = ny * W_ + nx;

            // Union of what the current cell's candidates admit on side d.
            const auto& table = compat_[static_cast<int>(d)];
            std::fill(reachable.begin(), reachable.end(), 0);
            for (int a : wave_[static_cast<std::size_t>(i)]) {
                const std::size_t row = static_cast<std::size_t>(a) * T;
                for (std::size_t b = 0; b < T; ++b) reachable[b] |= table[row + b];
            }

            auto& np = wave_[static_cast<std::size_t>(j)];
            kept.clear();
            for (int c : np)
                if (reachable[static_cast<std::size_t>(c)]) kept.push_back(c);

            if (kept.empty()) {
                ++stats_.contradictions;
                // A singleton that conflicts has nothing to repair with.
                if (np.size() <= 1) continue;
                const int forced = rng_.pick(np);
                logsys::get()->debug("WfcSolver: contradiction at ({}, {}), forcing tile id {}",
                                     nx, ny, tiles_[static_cast<std::size_t>(forced)].id);
                np.assign(1, forced);
                ++stats_.repairs;
                markCollapsed(j);
                queue.push_back(j);
            } else if (kept.size() < np.size()) {
                np = kept;
                if (np.size() == 1) markCollapsed(j);
                queue.push_back(j);
            }
        }
    }
}

} // namespace eco
