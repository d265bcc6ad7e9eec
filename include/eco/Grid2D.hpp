#pragma once
#include <cassert>
#include <cstddef>
#include <vector>

#include "eco/Tile.hpp"

namespace eco {

// Fixed-size row-major 2D grid. (x, y) = (column, row); y grows downwards.
// Iteration visits row 0 left to right, then row 1, and so on.
template <class T>
class Grid2D {
public:
    using value_type     = T;
    using iterator       = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    Grid2D() = default;

    Grid2D(int w, int h)
        : w_(w), h_(h), data_(static_cast<std::size_t>(w) * static_cast<std::size_t>(h)) {}

    Grid2D(int w, int h, const T& init)
        : w_(w), h_(h), data_(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), init) {}

    [[nodiscard]] int width()  const noexcept { return w_; }
    [[nodiscard]] int height() const noexcept { return h_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

    [[nodiscard]] bool inBounds(int x, int y) const noexcept {
        return static_cast<unsigned>(x) < static_cast<unsigned>(w_) &&
               static_cast<unsigned>(y) < static_cast<unsigned>(h_);
    }

    [[nodiscard]] std::size_t index(int x, int y) const noexcept {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(w_) + static_cast<std::size_t>(x);
    }

    // Checked in debug builds only.
    T& at(int x, int y) noexcept {
#ifndef NDEBUG
        assert(inBounds(x, y));
#endif
        return data_[index(x, y)];
    }
    const T& at(int x, int y) const noexcept {
#ifndef NDEBUG
        assert(inBounds(x, y));
#endif
        return data_[index(x, y)];
    }

    T&       operator[](std::size_t i)       noexcept { return data_[i]; }
    const T& operator[](std::size_t i) const noexcept { return data_[i]; }

    iterator       begin()       noexcept { return data_.begin(); }
    iterator       end()         noexcept { return data_.end(); }
    const_iterator begin() const noexcept { return data_.begin(); }
    const_iterator end()   const noexcept { return data_.end(); }

    friend bool operator==(const Grid2D& a, const Grid2D& b) {
        return a.w_ == b.w_ && a.h_ == b.h_ && a.data_ == b.data_;
    }
    friend bool operator!=(const Grid2D& a, const Grid2D& b) { return !(a == b); }

private:
    int w_ = 0;
    int h_ = 0;
    std::vector<T> data_;
};

using TileGrid = Grid2D<TileKind>;

} // namespace eco
