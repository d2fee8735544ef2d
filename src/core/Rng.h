// src/core/Rng.h
#pragma once
#include <cstdint>

namespace brazier::rng {

using Seed = std::uint64_t;

// Independent streams drawn from one run seed.
enum class Stream : std::uint64_t {
    Breaks = 1,   // controller break rolls
    Cold   = 2,   // simulator damage timing
};

// SplitMix64 finalizer: spreads small seeds over the whole state.
inline std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

// PCG32 (XSH-RR). Same seed and stream, same sequence, on every platform.
class Pcg32 {
public:
    Pcg32() : Pcg32(0, Stream::Breaks) {}
    Pcg32(Seed seed, Stream stream) { reseed(seed, stream); }

    void reseed(Seed seed, Stream stream) {
        state_ = 0;
        inc_ = (mix64(static_cast<std::uint64_t>(stream)) << 1u) | 1u;
        next_u32();
        state_ += mix64(seed);
        next_u32();
    }

    std::uint32_t next_u32() {
        const std::uint64_t old = state_;
        state_ = old * 6364136223846793005ull + inc_;
        const auto xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        const auto rot = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-static_cast<int>(rot)) & 31));
    }

    // [0,1) with 53 bits.
    double next_double01() {
        const std::uint64_t hi = next_u32();
        const std::uint64_t lo = next_u32();
        return (((hi << 32) | lo) >> 11) * (1.0 / 9007199254740992.0);
    }

    // [lo,hi)
    double uniform(double lo, double hi) { return lo + (hi - lo) * next_double01(); }

    // true with probability p
    bool chance(double p) { return next_double01() < p; }

private:
    std::uint64_t state_ = 0;
    std::uint64_t inc_   = 1; // odd
};

} // namespace brazier::rng
