#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>

#include "Reporter.hpp"
#include "WordList.hpp"

// Observed continuations of one prefix. Counts are always > 0 and kept in
// character order so a given random draw always maps to the same character.
struct ChoiceSet {
    std::map<char, uint32_t> counts;
    uint64_t total = 0;
};

// prefix (exactly order() chars) -> observed next characters
class TransitionTable {
public:
    static constexpr char kStartMarker = '^';

    // Throws InvalidStateError for an empty word set or order < 1.
    static TransitionTable build(const TrainingSet& words, int order,
                                 Reporter& reporter = NullReporter::instance());

    int order() const { return m_order; }
    size_t size() const { return m_prefixes.size(); }

    // nullptr when the prefix was never observed
    const ChoiceSet* find(const std::string& prefix) const;

    std::unordered_map<std::string, ChoiceSet>::const_iterator begin() const { return m_prefixes.begin(); }
    std::unordered_map<std::string, ChoiceSet>::const_iterator end() const { return m_prefixes.end(); }

private:
    explicit TransitionTable(int order) : m_order(order) {}

    int m_order;
    std::unordered_map<std::string, ChoiceSet> m_prefixes;
};
