#include "eco/SimulationConfig.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "eco/Log.hpp"

using json = nlohmann::json;

namespace eco {

namespace
{
    template <typename T>
    T GetOr(const json& j, const char* key, const T& fallback)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return fallback;
        try
        {
            return it->get<T>();
        }
        catch (const json::exception& e)
        {
            throw std::runtime_error(std::string("SimulationConfig: bad value for '") + key + "': " + e.what());
        }
    }

    // Integers only; anything that does not fit an int is rejected rather
    // than narrowed.
    int GetIntOr(const json& j, const char* key, int fallback)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return fallback;
        if (!it->is_number_integer())
            throw std::runtime_error(std::string("SimulationConfig: '") + key + "' must be an integer");

        constexpr std::int64_t lo = std::numeric_limits<int>::min();
        constexpr std::int64_t hi = std::numeric_limits<int>::max();
        const bool fits = it->is_number_unsigned()
            ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(hi)
            : (it->get<std::int64_t>() >= lo && it->get<std::int64_t>() <= hi);
        if (!fits)
            throw std::runtime_error(std::string("SimulationConfig: '") + key + "' out of range");
        return static_cast<int>(it->get<std::int64_t>());
    }

    Direction ParseDirection(const std::string& s)
    {
        if (s == "up")    return Direction::Up;
        if (s == "down")  return Direction::Down;
        if (s == "left")  return Direction::Left;
        if (s == "right") return Direction::Right;
        throw std::runtime_error("SimulationConfig: unknown direction '" + s + "'");
    }

    void AddUnique(TileSet& set, TileKind t)
    {
        if (std::find(set.begin(), set.end(), t) == set.end())
            set.push_back(t);
    }

    void ReadTiles(const json& tiles, TileRegistry& registry, SimulationConfig& cfg)
    {
        if (!tiles.is_array())
            throw std::runtime_error("SimulationConfig: 'tiles' must be an array");
        for (const json& entry : tiles)
        {
            const std::string name = entry.is_string() ? entry.get<std::string>()
                                                       : GetOr<std::string>(entry, "name", "");
            if (name.empty())
                throw std::runtime_error("SimulationConfig: tile entry without a name");

            const TileKind t = registry.add(name);
            if (entry.is_object() && entry.contains("color"))
            {
                const std::string text = GetOr<std::string>(entry, "color", "");
                if (auto c = parseHexColor(text))
                    registry.setColor(t, *c);
                else
                    logsys::get()->warn("SimulationConfig: ignoring color '{}' for tile '{}'", text, name);
            }
            AddUnique(cfg.extraTiles, t);
        }
    }

    AdjacencyRules ReadAdjacency(const json& adjacency, const TileRegistry& registry)
    {
        if (!adjacency.is_object())
            throw std::runtime_error("SimulationConfig: 'adjacency' must be an object");
        AdjacencyRules rules;
        for (auto it = adjacency.begin(); it != adjacency.end(); ++it)
        {
            const json& dirs = it.value();
            if (!dirs.is_object())
                throw std::runtime_error("SimulationConfig: adjacency for '" + it.key() + "' must be an object");
            auto& perDir = rules[registry.fromName(it.key())];
            for (auto dt = dirs.begin(); dt != dirs.end(); ++dt)
            {
                TileSet allowed;
                for (const std::string& n : dt.value().get<std::vector<std::string>>())
                    AddUnique(allowed, registry.fromName(n));
                perDir[ParseDirection(dt.key())] = std::move(allowed);
            }
        }
        return rules;
    }

    std::vector<EvolutionRuleSpec> ReadEvolution(const json& evolution, const TileRegistry& registry)
    {
        if (!evolution.is_array())
            throw std::runtime_error("SimulationConfig: 'evolution' must be an array");
        std::vector<EvolutionRuleSpec> out;
        for (const json& entry : evolution)
        {
            EvolutionRuleSpec rule;
            const std::string tile = GetOr<std::string>(entry, "tile", "*");
            if (tile != "*")
                rule.tile = registry.fromName(tile);

            const json clauses = entry.value("clauses", json::array());
            for (const json& c : clauses)
            {
                ThresholdClause clause;
                clause.neighbor = registry.fromName(GetOr<std::string>(c, "neighbor", ""));
                clause.atLeast  = GetIntOr(c, "at_least", 0);
                clause.becomes  = registry.fromName(GetOr<std::string>(c, "becomes", ""));
                rule.clauses.push_back(clause);
            }
            out.push_back(std::move(rule));
        }
        return out;
    }
}

SimulationConfig SimulationConfig::parse(const std::string& text, TileRegistry& registry)
{
    json root;
    try
    {
        root = json::parse(text);
    }
    catch (const json::parse_error& e)
    {
        throw std::runtime_error(std::string("SimulationConfig: parse error: ") + e.what());
    }
    if (!root.is_object())
        throw std::runtime_error("SimulationConfig: top level must be an object");

    // Tiles are registered into a copy that replaces `registry` only once
    // the whole document has been read.
    TileRegistry staged = registry;
    SimulationConfig cfg;
    try
    {
        cfg.width  = GetIntOr(root, "width",  cfg.width);
        cfg.height = GetIntOr(root, "height", cfg.height);
        cfg.steps  = GetIntOr(root, "steps",  cfg.steps);
        if (root.contains("seed") && !root.at("seed").is_null())
        {
            if (!root.at("seed").is_number_unsigned())
                throw std::runtime_error("SimulationConfig: 'seed' must be a non-negative integer");
            cfg.seed = root.at("seed").get<std::uint64_t>();
        }

        if (root.contains("tiles"))
            ReadTiles(root.at("tiles"), staged, cfg);
        if (root.contains("adjacency"))
            cfg.adjacency = ReadAdjacency(root.at("adjacency"), staged);
        if (root.contains("evolution"))
            cfg.evolution = ReadEvolution(root.at("evolution"), staged);
    }
    catch (const json::exception& e)
    {
        throw std::runtime_error(std::string("SimulationConfig: ") + e.what());
    }
    registry = std::move(staged);
    return cfg;
}

SimulationConfig SimulationConfig::load(const std::string& path, TileRegistry& registry)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f)
        throw std::runtime_error("SimulationConfig: could not open '" + path + "'");
    std::ostringstream ss;
    ss << f.rdbuf();
    return parse(ss.str(), registry);
}

bool SimulationConfig::tryLoad(const std::string& path, TileRegistry& registry, SimulationConfig& out)
{
    try
    {
        out = load(path, registry);
        return true;
    }
    catch (const std::exception& e)
    {
        logsys::get()->warn("{}; keeping previous settings", e.what());
        return false;
    }
}

SimulationOptions SimulationConfig::toOptions() const
{
    SimulationOptions opts;
    opts.seed = seed;

    if (!extraTiles.empty() || adjacency)
    {
        TileSet universe = baseTiles();
        for (TileKind t : extraTiles)
            AddUnique(universe, t);
        if (adjacency)
        {
            for (const auto& [tile, perDir] : *adjacency)
            {
                AddUnique(universe, tile);
                for (const auto& [dir, allowed] : perDir)
                    for (TileKind t : allowed)
                        AddUnique(universe, t);
            }
        }
        opts.tileUniverse = std::move(universe);
    }

    opts.adjacencyRules = adjacency;

    if (!evolution.empty())
    {
        std::vector<CaRule> rules;
        for (const auto& entry : evolution)
        {
            TileSelector selector = AnyTile{};
            if (entry.tile)
                selector = *entry.tile;
            rules.push_back(CaRule{selector, thresholdTransition(entry.clauses)});
        }
        opts.evolutionRules = std::move(rules);
    }
    return opts;
}

} // namespace eco
