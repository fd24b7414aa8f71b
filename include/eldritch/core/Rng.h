// include/eldritch/core/Rng.h
#pragma once
#include <cstdint>
#include <string>

namespace eldritch::rng {

using Seed = std::uint64_t;

// SplitMix64 finalizer; turns small ids into well-scrambled seeds.
inline std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

// PCG32 (XSH-RR). Deterministic per seed so progress rolls replay in tests.
struct Pcg32 {
    std::uint64_t state = 0;
    std::uint64_t inc   = 1;

    Pcg32() = default;
    explicit Pcg32(Seed s, Seed stream = 0) { seed(s, stream); }

    void seed(Seed s, Seed stream = 0) {
        state = 0;
        inc   = (mix64(stream) << 1u) | 1u;
        next_u32();
        state += mix64(s);
        next_u32();
    }

    std::uint32_t next_u32() {
        const std::uint64_t old = state;
        state = old * 6364136223846793005ull + inc;
        const auto xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        const auto rot        = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-static_cast<int>(rot)) & 31));
    }

    std::uint64_t next_u64() {
        const auto hi = static_cast<std::uint64_t>(next_u32());
        return (hi << 32) | next_u32();
    }

    // [0,1)
    double next_double01() {
        return (next_u64() >> 11) * (1.0 / 9007199254740992.0);
    }

    // True with probability p.
    bool chance(double p) { return next_double01() < p; }
};

// Seed drawn from std::random_device mixed with the wall clock.
[[nodiscard]] Seed entropySeed();

// Random (version 4) UUID in canonical 8-4-4-4-12 form.
[[nodiscard]] std::string uuid4();

} // namespace eldritch::rng
