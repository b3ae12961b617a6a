#pragma once
#include <string>

#include "RandomSource.hpp"
#include "TransitionTable.hpp"

namespace Sampler {
    // Picks one character with probability count/total.
    char draw(const ChoiceSet& choices, RandomSource& rng);

    // Walks the table from the start-marker prefix for exactly `length` draws.
    // Throws ExhaustedTransitionsError when a prefix has no continuation.
    std::string generate(const TransitionTable& table, size_t length, RandomSource& rng);
}
