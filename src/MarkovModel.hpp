#pragma once
#include <memory>
#include <string>

#include "RandomSource.hpp"
#include "Reporter.hpp"
#include "TransitionTable.hpp"
#include "WordList.hpp"

struct GenerationResult {
    enum class Status : int { Ok = 0, Exhausted = 1 };

    Status status = Status::Exhausted;
    std::string word; // set when Ok
    int attempts = 0;

    bool ok() const { return status == Status::Ok; }
};

// Character n-gram model over a word list. The table is built explicitly
// and is read-only afterwards, so const members are safe to call from
// several threads as long as each passes its own RandomSource.
class MarkovModel {
public:
    explicit MarkovModel(int order = 3);

    // lifecycle
    void loadWordList(const std::string& path, Reporter& reporter = NullReporter::instance());
    void setTrainingSet(std::shared_ptr<const TrainingSet> words);
    void setOrder(int order); // discards any built table
    void build(Reporter& reporter = NullReporter::instance());

    // expose
    int order() const { return m_order; }
    bool hasWords() const { return m_words != nullptr; }
    bool isBuilt() const { return m_table != nullptr; }
    const TrainingSet& trainingSet() const;
    std::shared_ptr<const TrainingSet> sharedTrainingSet() const { return m_words; }
    const TransitionTable& table() const;

    // generation
    std::string generate(size_t length, RandomSource& rng) const;
    bool isKnownWord(const std::string& candidate) const;
    // Regenerates until the output is not in the word list, at most
    // maxAttempts times.
    GenerationResult generateUnknown(size_t length, RandomSource& rng, int maxAttempts) const;

private:
    int m_order;
    std::shared_ptr<const TrainingSet> m_words;
    std::unique_ptr<TransitionTable> m_table;
};
