#pragma once
#include <array>
#include <utility>

namespace eco {

enum class Direction { Up = 0, Down = 1, Left = 2, Right = 3 };

inline constexpr std::array<Direction, 4> kDirections{
    Direction::Up, Direction::Down, Direction::Left, Direction::Right
};

constexpr Direction opposite(Direction d) noexcept {
    switch (d) {
        case Direction::Up:   return Direction::Down;
        case Direction::Down: return Direction::Up;
        case Direction::Left: return Direction::Right;
        default:              return Direction::Left;
    }
}

// (dx, dy) with y growing downwards.
constexpr std::pair<int, int> offset(Direction d) noexcept {
    switch (d) {
        case Direction::Up:   return {0, -1};
        case Direction::Down: return {0,  1};
        case Direction::Left: return {-1, 0};
        default:              return {1,  0};
    }
}

} // namespace eco
