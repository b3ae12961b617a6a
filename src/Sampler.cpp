#include "Sampler.hpp"
#include "Errors.hpp"

char Sampler::draw(const ChoiceSet& choices, RandomSource& rng) {
    uint64_t r = rng.below(choices.total);
    uint64_t cum = 0;
    for (const auto& kv : choices.counts) {
        cum += kv.second;
        if (r < cum) return kv.first;
    }
    // unreachable while total equals the sum of counts
    return choices.counts.rbegin()->first;
}

std::string Sampler::generate(const TransitionTable& table, size_t length, RandomSource& rng) {
    const size_t order = (size_t)table.order();
    std::string buf(order, TransitionTable::kStartMarker);
    buf.reserve(order + length);

    while (buf.size() < order + length) {
        std::string prefix = buf.substr(buf.size() - order);
        const ChoiceSet* choices = table.find(prefix);
        if (!choices) {
            throw ExhaustedTransitionsError(prefix,
                "No transitions found for prefix '" + prefix + "'. "
                "Consider decreasing the order or using a different word list.");
        }
        buf.push_back(draw(*choices, rng));
    }
    return buf.substr(order);
}
