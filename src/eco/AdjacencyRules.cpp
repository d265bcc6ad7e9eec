#include "eco/AdjacencyRules.hpp"

#include <algorithm>
#include <utility>

namespace eco {

using namespace tiles;

AdjacencyRules defaultAdjacencyRules() {
    AdjacencyRules r;
    r[water] = {
        {Direction::Up,    {water, sand}},
        {Direction::Down,  {water}},
        {Direction::Left,  {water, sand}},
        {Direction::Right, {water, sand}},
    };
    r[sand] = {
        {Direction::Up,    {sand, grass}},
        {Direction::Down,  {water, sand}},
        {Direction::Left,  {water, sand, grass}},
        {Direction::Right, {water, sand, grass}},
    };
    r[grass] = {
        {Direction::Up,    {grass, forest}},
        {Direction::Down,  {sand, grass}},
        {Direction::Left,  {sand, grass, forest}},
        {Direction::Right, {sand, grass, forest}},
    };
    r[forest] = {
        {Direction::Up,    {forest}},
        {Direction::Down,  {grass, forest}},
        {Direction::Left,  {grass, forest}},
        {Direction::Right, {grass, forest}},
    };
    return r;
}

AdjacencyRuleTable::AdjacencyRuleTable()
    : rules_(defaultAdjacencyRules()), universe_(baseTiles()) {}

AdjacencyRuleTable::AdjacencyRuleTable(AdjacencyRules rules, TileSet universe)
    : rules_(std::move(rules)), universe_(std::move(universe)) {}

void AdjacencyRuleTable::install(const AdjacencyRules& rules) {
    rules_ = rules;
}

void AdjacencyRuleTable::reset() {
    rules_ = defaultAdjacencyRules();
    universe_ = baseTiles();
}

void AdjacencyRuleTable::setUniverse(TileSet universe) {
    universe_ = std::move(universe);
}

const TileSet& AdjacencyRuleTable::allowedNeighbors(TileKind tile, Direction dir) const {
    auto it = rules_.find(tile);
    if (it == rules_.end()) return universe_;
    auto jt = it->second.find(dir);
    if (jt == it->second.end()) return universe_;
    return jt->second;
}

bool AdjacencyRuleTable::isAllowed(TileKind tile, TileKind neighbor, Direction dir) const {
    const TileSet& allowed = allowedNeighbors(tile, dir);
    return std::find(allowed.begin(), allowed.end(), neighbor) != allowed.end();
}

std::size_t AdjacencyRuleTable::countViolations(const TileGrid& grid) const {
    std::size_t n = 0;
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            for (Direction d : kDirections) {
                const auto [dx, dy] = offset(d);
                if (!grid.inBounds(x + dx, y + dy)) continue;
                if (!isAllowed(grid.at(x, y), grid.at(x + dx, y + dy), d)) ++n;
            }
        }
    }
    return n;
}

} // namespace eco
