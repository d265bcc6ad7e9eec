#include "eco/Tile.hpp"

#include <cctype>

#include "eco/Log.hpp"

namespace eco {

TileSet baseTiles() {
    return { tiles::water, tiles::sand, tiles::grass, tiles::forest };
}

std::optional<Rgb8> parseHexColor(const std::string& text) {
    if (text.size() != 7 || text[0] != '#') return std::nullopt;
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };
    std::uint8_t rgb[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = nibble(text[1 + 2 * i]);
        const int lo = nibble(text[2 + 2 * i]);
        if (hi < 0 || lo < 0) return std::nullopt;
        rgb[i] = static_cast<std::uint8_t>(hi * 16 + lo);
    }
    return Rgb8{rgb[0], rgb[1], rgb[2]};
}

TileRegistry::TileRegistry() {
    // Order matters: ids 1..4 must line up with eco::tiles.
    add("water",  Rgb8{ 65, 105, 225});  // royalblue
    add("sand",   Rgb8{255, 193,  37});  // goldenrod1
    add("grass",  Rgb8{154, 205,  50});  // yellowgreen
    add("forest", Rgb8{ 34, 139,  34});  // forestgreen
}

TileKind TileRegistry::add(const std::string& name) {
    if (auto it = byName_.find(name); it != byName_.end()) {
        logsys::get()->debug("TileRegistry: '{}' already registered as id {}", name, it->second.id);
        return it->second;
    }
    const TileKind t{nextId_++};
    names_.emplace(t.id, name);
    byName_.emplace(name, t);
    return t;
}

TileKind TileRegistry::add(const std::string& name, Rgb8 color) {
    if (contains(name))
        return add(name);
    const TileKind t = add(name);
    colors_.emplace(t.id, color);
    return t;
}

void TileRegistry::setColor(TileKind tile, Rgb8 color) {
    if (!contains(tile))
        throw TileNotFound("TileRegistry::setColor: unregistered tile id " + std::to_string(tile.id));
    colors_[tile.id] = color;
}

const std::string& TileRegistry::name(TileKind tile) const {
    auto it = names_.find(tile.id);
    if (it == names_.end())
        throw TileNotFound("TileRegistry::name: unregistered tile id " + std::to_string(tile.id));
    return it->second;
}

Rgb8 TileRegistry::color(TileKind tile) const {
    auto it = colors_.find(tile.id);
    if (it == colors_.end())
        throw TileNotFound("TileRegistry::color: no color for tile id " + std::to_string(tile.id));
    return it->second;
}

TileKind TileRegistry::fromName(const std::string& name) const {
    auto it = byName_.find(name);
    if (it == byName_.end())
        throw TileNotFound("TileRegistry::fromName: unknown tile '" + name + "'");
    return it->second;
}

TileKind TileRegistry::fromId(std::uint32_t id) const {
    if (names_.find(id) == names_.end())
        throw TileNotFound("TileRegistry::fromId: unregistered tile id " + std::to_string(id));
    return TileKind{id};
}

bool TileRegistry::contains(const std::string& name) const noexcept {
    return byName_.find(name) != byName_.end();
}

bool TileRegistry::contains(TileKind tile) const noexcept {
    return names_.find(tile.id) != names_.end();
}

std::string TileRegistry::describe(TileKind tile) const {
    auto it = names_.find(tile.id);
    if (it == names_.end()) return "Tile(id=" + std::to_string(tile.id) + ")";
    return "Tile(" + it->second + ")";
}

TileSet TileRegistry::universe() const {
    TileSet out;
    out.reserve(names_.size());
    for (const auto& [id, name] : names_) out.push_back(TileKind{id});
    return out;
}

} // namespace eco
