#include "eco/CaRuleEngine.hpp"

namespace eco {

void NeighborCounts::add(TileKind t) {
    ++total_;
    for (auto& [kind, n] : counts_) {
        if (kind == t) { ++n; return; }
    }
    counts_.emplace_back(t, 1);
}

int NeighborCounts::operator[](TileKind t) const noexcept {
    for (const auto& [kind, n] : counts_)
        if (kind == t) return n;
    return 0;
}

Transition thresholdTransition(std::vector<ThresholdClause> clauses) {
    return [clauses = std::move(clauses)](TileKind current, const NeighborCounts& counts) {
        for (const auto& c : clauses)
            if (counts[c.neighbor] >= c.atLeast) return c.becomes;
        return current;
    };
}

std::vector<CaRule> defaultCaRules() {
    using namespace tiles;
    return {
        {water,  thresholdTransition({})},
        {sand,   thresholdTransition({{water, 5, water}, {grass, 3, grass}})},
        {grass,  thresholdTransition({{forest, 3, forest}, {sand, 5, sand}})},
        {forest, thresholdTransition({{water, 4, grass}, {sand, 5, grass}})},
    };
}

CaRuleEngine::CaRuleEngine() {
    resetRules();
}

void CaRuleEngine::addRule(TileSelector selector, Transition transform) {
    rules_.push_back(CaRule{selector, std::move(transform)});
}

void CaRuleEngine::addRule(CaRule rule) {
    rules_.push_back(std::move(rule));
}

void CaRuleEngine::installRules(const std::vector<CaRule>& rules) {
    resetRules();
    for (const auto& r : rules) addRule(r);
}

void CaRuleEngine::resetRules() {
    rules_ = defaultCaRules();
}

const CaRule* CaRuleEngine::findRule(TileKind tile) const noexcept {
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        if (const auto* kind = std::get_if<TileKind>(&it->selector); kind && *kind == tile)
            return &*it;
    }
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        if (std::holds_alternative<AnyTile>(it->selector))
            return &*it;
    }
    return nullptr;
}

NeighborCounts CaRuleEngine::countNeighbors(const TileGrid& grid, int x, int y) {
    NeighborCounts counts;
    for (int dy = -1; dy <= 1; ++dy)
    for (int dx = -1; dx <= 1; ++dx) {
        if (dx == 0 && dy == 0) continue;
        const int nx = x + dx, ny = y + dy;
        if (!grid.inBounds(nx, ny)) continue;  // no wraparound
        counts.add(grid.at(nx, ny));
    }
    return counts;
}

TileGrid CaRuleEngine::step(const TileGrid& grid) const {
    TileGrid out(grid.width(), grid.height());
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            const TileKind current = grid.at(x, y);
            const CaRule* rule = findRule(current);
            if (!rule || !rule->transform) {
                out.at(x, y) = current;
                continue;
            }
            out.at(x, y) = rule->transform(current, countNeighbors(grid, x, y));
        }
    }
    return out;
}

} // namespace eco
