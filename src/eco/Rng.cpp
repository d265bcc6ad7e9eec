#include "eco/Rng.hpp"

namespace {
inline std::uint64_t rotl(const std::uint64_t x, int k) { return (x << k) | (x >> (64 - k)); }

inline std::uint64_t splitmix64(std::uint64_t& x) {
    std::uint64_t z = (x += 0x9e3779b97f4a7c15ull);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
    return z ^ (z >> 31);
}
}

namespace eco {

void Rng::reseed(std::uint64_t seed) {
    std::uint64_t x = seed ? seed : kDefaultSeed;
    s_[0] = splitmix64(x);
    s_[1] = splitmix64(x);
    s_[2] = splitmix64(x);
    s_[3] = splitmix64(x);
}

std::uint64_t Rng::nextU64() {
    const std::uint64_t result = rotl(s_[1] * 5ull, 7) * 9ull;
    const std::uint64_t t = s_[1] << 17;
    s_[2] ^= s_[0]; s_[3] ^= s_[1];
    s_[1] ^= s_[2]; s_[0] ^= s_[3];
    s_[2] ^= t; s_[3] = rotl(s_[3], 45);
    return result;
}

double Rng::next01() { return (nextU64() >> 11) * (1.0 / (1ull << 53)); }

std::size_t Rng::index(std::size_t n) {
    if (n <= 1) return 0;
    // Rejection sampling keeps the draw unbiased for any n.
    const std::uint64_t bound = static_cast<std::uint64_t>(n);
    const std::uint64_t limit = ~std::uint64_t{0} - (~std::uint64_t{0} % bound);
    std::uint64_t r = nextU64();
    while (r >= limit) r = nextU64();
    return static_cast<std::size_t>(r % bound);
}

} // namespace eco
