#include "TransitionTable.hpp"
#include "Errors.hpp"

TransitionTable TransitionTable::build(const TrainingSet& words, int order, Reporter& reporter) {
    if (order < 1) {
        throw InvalidStateError("Order must be at least 1, got " + std::to_string(order));
    }
    if (words.empty()) {
        throw InvalidStateError("Word list is empty, load a word list with valid words first.");
    }
    reporter.message("Building transition table with order " + std::to_string(order));

    TransitionTable table(order);
    std::string padded;
    size_t done = 0;
    for (const auto& word : words) {
        // apple -> ^^apple for order 2; one observation per character of the word
        padded.assign((size_t)order, kStartMarker);
        padded += word;
        for (size_t i = 0; i + (size_t)order < padded.size(); ++i) {
            ChoiceSet& choices = table.m_prefixes[padded.substr(i, (size_t)order)];
            choices.counts[padded[i + (size_t)order]]++;
            choices.total++;
        }
        if (++done % 10000 == 0) reporter.progress("building", done, words.size());
    }
    reporter.progress("building", words.size(), words.size());
    reporter.message("Transition table has " + std::to_string(table.size()) + " prefixes");
    return table;
}

const ChoiceSet* TransitionTable::find(const std::string& prefix) const {
    auto it = m_prefixes.find(prefix);
    if (it == m_prefixes.end() || it->second.total == 0) return nullptr;
    return &it->second;
}
