#pragma once

#include <cstdint>
#include <random>

namespace qtraj {

// Per-trajectory random source. The engine is seeded from (global seed,
// trajectory index) through std::seed_seq, so each trajectory replays the same
// draws whatever thread runs it.
class RandomStream {
public:
    RandomStream(std::uint64_t seed, std::uint64_t index) {
        std::seed_seq seq{static_cast<std::uint32_t>(seed & 0xffffffffULL),
                          static_cast<std::uint32_t>(seed >> 32),
                          static_cast<std::uint32_t>(index & 0xffffffffULL),
                          static_cast<std::uint32_t>(index >> 32)};
        gen_.seed(seq);
    }

    // Uniform draw on [0, 1)
    double uniform() { return dist_(gen_); }

    // Uniform draw on the open interval (0, 1)
    double uniform_open() {
        double u = dist_(gen_);
        while (u <= 0.0) u = dist_(gen_);
        return u;
    }

private:
    std::mt19937_64 gen_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

} // namespace qtraj
