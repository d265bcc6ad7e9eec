#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace eco {

// Opaque terrain category. Identity is the id; names and colors live in
// the TileRegistry and are never consulted by the solver or the CA engine.
struct TileKind {
    std::uint32_t id = 0;

    friend constexpr bool operator==(TileKind a, TileKind b) noexcept { return a.id == b.id; }
    friend constexpr bool operator!=(TileKind a, TileKind b) noexcept { return a.id != b.id; }
    friend constexpr bool operator<(TileKind a, TileKind b) noexcept  { return a.id < b.id; }
};

using TileSet = std::vector<TileKind>;

namespace tiles {
    inline constexpr TileKind water {1};
    inline constexpr TileKind sand  {2};
    inline constexpr TileKind grass {3};
    inline constexpr TileKind forest{4};
}

// The four base kinds in id order.
TileSet baseTiles();

struct Rgb8 {
    std::uint8_t r = 0, g = 0, b = 0;
    friend bool operator==(Rgb8 a, Rgb8 b) noexcept { return a.r == b.r && a.g == b.g && a.b == b.b; }
};

// "#rrggbb" -> Rgb8; nullopt on anything else.
std::optional<Rgb8> parseHexColor(const std::string& text);

class TileNotFound : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Assigns stable ids to tile names. A fresh registry already holds the
// four base kinds (ids 1..4); new names get the next free id.
class TileRegistry {
public:
    TileRegistry();

    // Registering a name twice returns the kind registered first; its color
    // is left as it was (use setColor to change it).
    TileKind add(const std::string& name);
    TileKind add(const std::string& name, Rgb8 color);
    void setColor(TileKind tile, Rgb8 color);

    [[nodiscard]] const std::string& name(TileKind tile) const;
    [[nodiscard]] Rgb8 color(TileKind tile) const;
    [[nodiscard]] TileKind fromName(const std::string& name) const;
    [[nodiscard]] TileKind fromId(std::uint32_t id) const;

    [[nodiscard]] bool contains(const std::string& name) const noexcept;
    [[nodiscard]] bool contains(TileKind tile) const noexcept;

    // "Tile(water)" for registered kinds, "Tile(id=7)" otherwise.
    [[nodiscard]] std::string describe(TileKind tile) const;

    [[nodiscard]] TileSet universe() const;
    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

private:
    std::uint32_t nextId_ = 1;
    std::map<std::uint32_t, std::string> names_;
    std::unordered_map<std::string, TileKind> byName_;
    std::unordered_map<std::uint32_t, Rgb8> colors_;
};

} // namespace eco

namespace std {
template <>
struct hash<eco::TileKind> {
    std::size_t operator()(eco::TileKind t) const noexcept { return std::hash<std::uint32_t>{}(t.id); }
};
} // namespace std
