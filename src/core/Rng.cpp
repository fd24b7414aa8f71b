// src/core/Rng.cpp
#include "eldritch/core/Rng.h"

#include <chrono>
#include <cstdio>
#include <mutex>
#include <random>

namespace eldritch::rng {

Seed entropySeed()
{
    std::random_device rd;
    const auto hi = static_cast<std::uint64_t>(rd()) << 32;
    const auto lo = static_cast<std::uint64_t>(rd());
    const auto t  = static_cast<std::uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
    return mix64(hi | lo) ^ mix64(t);
}

std::string uuid4()
{
    static std::mutex mutex;
    static Pcg32 gen(entropySeed(), 0x5eed);

    std::uint64_t a = 0, b = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        a = gen.next_u64();
        b = gen.next_u64();
    }
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull; // version 4
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull; // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(a >> 32),
                  static_cast<unsigned>((a >> 16) & 0xFFFF),
                  static_cast<unsigned>(a & 0xFFFF),
                  static_cast<unsigned>(b >> 48),
                  static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFull));
    return buf;
}

} // namespace eldritch::rng
