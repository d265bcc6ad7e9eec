// tests/test_simulation_config.cpp
//
// JSON configuration: defaults, full documents, error reporting and the
// file-based entry points.

#include <doctest/doctest.h>

#include "eco/SimulationConfig.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace eco;
using namespace eco::tiles;

namespace {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("eco_config_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

const char* kFullConfig = R"({
    "width": 12,
    "height": 9,
    "steps": 3,
    "seed": 7,
    "tiles": [{"name": "mountain", "color": "#7f8c8d"}, "tundra"],
    "adjacency": {
        "water":    {"up": ["water", "sand"], "down": ["water"]},
        "mountain": {"left": ["mountain", "forest"]}
    },
    "evolution": [
        {"tile": "sand", "clauses": [{"neighbor": "mountain", "at_least": 2, "becomes": "mountain"}]},
        {"tile": "*",    "clauses": []}
    ]
})";

} // namespace

TEST_CASE("SimulationConfig: empty document keeps defaults")
{
    TileRegistry reg;
    const SimulationConfig cfg = SimulationConfig::parse("{}", reg);
    CHECK(cfg.width == 64);
    CHECK(cfg.height == 64);
    CHECK(cfg.steps == 10);
    CHECK_FALSE(cfg.seed.has_value());
    CHECK_FALSE(cfg.adjacency.has_value());
    CHECK(cfg.evolution.empty());

    const SimulationOptions opts = cfg.toOptions();
    CHECK_FALSE(opts.seed.has_value());
    CHECK_FALSE(opts.tileUniverse.has_value());
    CHECK_FALSE(opts.adjacencyRules.has_value());
    CHECK_FALSE(opts.evolutionRules.has_value());
}

TEST_CASE("SimulationConfig: full document")
{
    TileRegistry reg;
    const SimulationConfig cfg = SimulationConfig::parse(kFullConfig, reg);

    CHECK(cfg.width == 12);
    CHECK(cfg.height == 9);
    CHECK(cfg.steps == 3);
    REQUIRE(cfg.seed.has_value());
    CHECK(*cfg.seed == 7);

    const TileKind mountain = reg.fromName("mountain");
    const TileKind tundra = reg.fromName("tundra");
    CHECK(reg.color(mountain) == Rgb8{0x7f, 0x8c, 0x8d});
    CHECK(cfg.extraTiles == TileSet{mountain, tundra});

    REQUIRE(cfg.adjacency.has_value());
    const AdjacencyRules& adj = *cfg.adjacency;
    CHECK(adj.at(water).at(Direction::Up) == TileSet{water, sand});
    CHECK(adj.at(water).at(Direction::Down) == TileSet{water});
    CHECK(adj.at(water).count(Direction::Left) == 0);
    CHECK(adj.at(mountain).at(Direction::Left) == TileSet{mountain, forest});

    REQUIRE(cfg.evolution.size() == 2);
    CHECK(cfg.evolution[0].tile == sand);
    REQUIRE(cfg.evolution[0].clauses.size() == 1);
    CHECK(cfg.evolution[0].clauses[0].neighbor == mountain);
    CHECK(cfg.evolution[0].clauses[0].atLeast == 2);
    CHECK(cfg.evolution[0].clauses[0].becomes == mountain);
    CHECK_FALSE(cfg.evolution[1].tile.has_value());
}

TEST_CASE("SimulationConfig: toOptions builds the universe and rules")
{
    TileRegistry reg;
    const SimulationConfig cfg = SimulationConfig::parse(kFullConfig, reg);
    const SimulationOptions opts = cfg.toOptions();

    REQUIRE(opts.tileUniverse.has_value());
    CHECK(*opts.tileUniverse == TileSet{water, sand, grass, forest,
                                        reg.fromName("mountain"), reg.fromName("tundra")});
    REQUIRE(opts.evolutionRules.has_value());
    CHECK(opts.evolutionRules->size() == 2);
    CHECK(std::holds_alternative<AnyTile>(opts.evolutionRules->at(1).selector));

    CaRuleEngine engine;
    engine.installRules(*opts.evolutionRules);
    const CaRule* rule = engine.findRule(sand);
    REQUIRE(rule != nullptr);
    NeighborCounts c;
    c.add(reg.fromName("mountain"));
    c.add(reg.fromName("mountain"));
    CHECK(rule->transform(sand, c) == reg.fromName("mountain"));
}

TEST_CASE("SimulationConfig: a configured run is reproducible")
{
    TileRegistry reg;
    const SimulationConfig cfg = SimulationConfig::parse(kFullConfig, reg);

    Simulation a, b;
    const SimulationHistory ha = a.run(cfg.width, cfg.height, cfg.steps, cfg.toOptions());
    const SimulationHistory hb = b.run(cfg.width, cfg.height, cfg.steps, cfg.toOptions());
    CHECK(ha.size() == 4);
    CHECK(ha == hb);
}

TEST_CASE("SimulationConfig: errors")
{
    TileRegistry reg;
    CHECK_THROWS_AS(SimulationConfig::parse("{ not json", reg), std::runtime_error);
    CHECK_THROWS_AS(SimulationConfig::parse("[1, 2]", reg), std::runtime_error);
    CHECK_THROWS_AS(SimulationConfig::parse(R"({"width": "wide"})", reg), std::runtime_error);
    CHECK_THROWS_AS(SimulationConfig::parse(R"({"adjacency": {"water": {"north": ["sand"]}}})", reg),
                    std::runtime_error);
    CHECK_THROWS_AS(SimulationConfig::parse(R"({"adjacency": {"swamp": {"up": ["sand"]}}})", reg),
                    TileNotFound);
    CHECK_THROWS_AS(SimulationConfig::parse(
                        R"({"evolution": [{"tile": "sand", "clauses": [{"neighbor": "lava", "at_least": 1, "becomes": "sand"}]}]})",
                        reg),
                    TileNotFound);
}

TEST_CASE("SimulationConfig: integers must fit without narrowing")
{
    TileRegistry reg;
    CHECK_THROWS_AS(SimulationConfig::parse(R"({"width": 4294967297})", reg), std::runtime_error);
    CHECK_THROWS_AS(SimulationConfig::parse(R"({"height": -4294967297})", reg), std::runtime_error);
    CHECK_THROWS_AS(SimulationConfig::parse(R"({"steps": 2147483648})", reg), std::runtime_error);
    CHECK_THROWS_AS(SimulationConfig::parse(R"({"width": 12.5})", reg), std::runtime_error);
    CHECK_THROWS_AS(SimulationConfig::parse(
                        R"({"evolution": [{"tile": "sand", "clauses": [{"neighbor": "water", "at_least": 9999999999, "becomes": "water"}]}]})",
                        reg),
                    std::runtime_error);

    CHECK_THROWS_AS(SimulationConfig::parse(R"({"seed": -1})", reg), std::runtime_error);
    CHECK_THROWS_AS(SimulationConfig::parse(R"({"seed": 1.5})", reg), std::runtime_error);
    CHECK_THROWS_AS(SimulationConfig::parse(R"({"seed": "7"})", reg), std::runtime_error);

    const SimulationConfig edge = SimulationConfig::parse(
        R"({"width": 2147483647, "steps": 0, "seed": 18446744073709551615})", reg);
    CHECK(edge.width == 2147483647);
    CHECK(edge.steps == 0);
    REQUIRE(edge.seed.has_value());
    CHECK(*edge.seed == 18446744073709551615ULL);

    // Negative sizes parse; Simulation::run is what rejects them.
    CHECK(SimulationConfig::parse(R"({"width": -3})", reg).width == -3);
}

TEST_CASE("SimulationConfig: a failed parse registers no tiles")
{
    TileRegistry reg;
    const std::size_t before = reg.size();
    CHECK_THROWS_AS(SimulationConfig::parse(
                        R"({"tiles": ["mountain"], "adjacency": {"mountain": {"up": ["lava"]}}})", reg),
                    TileNotFound);
    CHECK(reg.size() == before);
    CHECK_FALSE(reg.contains("mountain"));

    const SimulationConfig ok = SimulationConfig::parse(R"({"tiles": ["mountain"]})", reg);
    CHECK(reg.contains("mountain"));
    REQUIRE(ok.extraTiles.size() == 1);
    CHECK(ok.extraTiles[0] == reg.fromName("mountain"));
}

TEST_CASE("SimulationConfig: load and tryLoad")
{
    const fs::path dir = make_unique_temp_dir() / "load";
    std::error_code ec;
    fs::create_directories(dir, ec);

    const fs::path good = dir / "sim.json";
    {
        std::ofstream f(good);
        f << kFullConfig;
    }

    TileRegistry reg;
    const SimulationConfig loaded = SimulationConfig::load(good.string(), reg);
    CHECK(loaded.width == 12);

    SimulationConfig out;
    out.width = 3;
    CHECK(SimulationConfig::tryLoad(good.string(), reg, out));
    CHECK(out.width == 12);

    SimulationConfig untouched;
    untouched.width = 3;
    CHECK_FALSE(SimulationConfig::tryLoad((dir / "missing.json").string(), reg, untouched));
    CHECK(untouched.width == 3);
    CHECK_THROWS_AS(SimulationConfig::load((dir / "missing.json").string(), reg), std::runtime_error);

    const fs::path broken = dir / "broken.json";
    {
        std::ofstream f(broken);
        f << R"({"width": 8, "tiles": ["glacier"], "evolution": [{"tile": "glacier", "clauses": [{"neighbor": "magma", "at_least": 1, "becomes": "water"}]}]})";
    }
    SimulationConfig kept;
    kept.width = 3;
    CHECK_FALSE(SimulationConfig::tryLoad(broken.string(), reg, kept));
    CHECK(kept.width == 3);
    CHECK_FALSE(reg.contains("glacier"));

    std::error_code dec;
    fs::remove_all(dir, dec);
}
