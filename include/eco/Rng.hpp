#pragma once
#include <cstddef>
#include <cstdint>

namespace eco {

// xoshiro256** seeded through SplitMix64. Same seed, same stream, on every
// platform; std:: distributions are avoided for that reason.
class Rng {
public:
    static constexpr std::uint64_t kDefaultSeed = 0x106689d45497fdb5ULL;

    Rng() : Rng(kDefaultSeed) {}
    explicit Rng(std::uint64_t seed) { reseed(seed); }

    static Rng fromSeed(std::uint64_t seed) { return Rng(seed); }
    void reseed(std::uint64_t seed);

    std::uint64_t nextU64();
    double        next01();   // [0,1)

    // Uniform in [0, n); n must be > 0.
    std::size_t index(std::size_t n);

    // Uniform element of a non-empty random-access container.
    template <class Container>
    const typename Container::value_type& pick(const Container& items) {
        return items[index(items.size())];
    }

private:
    std::uint64_t s_[4]{};
};

} // namespace eco
