#pragma once
#include <cstdint>
#include <random>

// Uniform integer source injected into everything that draws at random.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // uniform value in [0, bound); bound must be > 0
    virtual uint64_t below(uint64_t bound) = 0;
};

template <typename Engine>
class EngineSource : public RandomSource {
public:
    EngineSource() {
        std::random_device rd;
        m_engine.seed(rd());
    }
    explicit EngineSource(uint64_t seed) : m_engine(seed) {}

    uint64_t below(uint64_t bound) override {
        std::uniform_int_distribution<uint64_t> d(0, bound - 1);
        return d(m_engine);
    }

private:
    Engine m_engine;
};

// Fast pseudo-random source for bulk and test generation.
using MersenneSource = EngineSource<std::mt19937_64>;

// Operating system entropy (std::random_device); used for passwords people keep.
class SystemSource : public RandomSource {
public:
    uint64_t below(uint64_t bound) override;

private:
    std::random_device m_device;
};
