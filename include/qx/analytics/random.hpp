// QX Analytics - Random Sources
// Injectable uniform generators for the stochastic optimizers

#pragma once

#include <cstdint>
#include <memory>
#include <random>

namespace qx::analytics {

// Source of uniform variates in [0, 1). Optimizers draw from a caller-owned
// source so runs can be reproduced by seeding it.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual double next_uniform() = 0;
};

// Mersenne Twister (64-bit) source with an explicit seed
class SeededRandom final : public RandomSource {
public:
    explicit SeededRandom(uint64_t seed) : engine_(seed), seed_(seed) {}

    double next_uniform() override { return dist_(engine_); }

    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

    void reseed(uint64_t seed) {
        seed_ = seed;
        engine_.seed(seed);
        dist_.reset();
    }

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
    uint64_t seed_;
};

// Seeded from std::random_device; use when reproducibility is not needed
std::unique_ptr<SeededRandom> make_entropy_random();

}  // namespace qx::analytics
