#include "RandomSource.hpp"

uint64_t SystemSource::below(uint64_t bound) {
    std::uniform_int_distribution<uint64_t> d(0, bound - 1);
    return d(m_device);
}
