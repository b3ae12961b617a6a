#include "MarkovModel.hpp"
#include "Errors.hpp"
#include "Sampler.hpp"

MarkovModel::MarkovModel(int order) : m_order(order) {}

void MarkovModel::loadWordList(const std::string& path, Reporter& reporter) {
    setTrainingSet(std::make_shared<const TrainingSet>(WordList::loadFromFile(path, reporter)));
}

void MarkovModel::setTrainingSet(std::shared_ptr<const TrainingSet> words) {
    m_words = std::move(words);
    m_table.reset();
}

void MarkovModel::setOrder(int order) {
    if (order == m_order) return;
    m_order = order;
    m_table.reset();
}

void MarkovModel::build(Reporter& reporter) {
    if (!m_words) {
        throw InvalidStateError("Word list is not loaded, load a word list first.");
    }
    m_table = std::make_unique<TransitionTable>(TransitionTable::build(*m_words, m_order, reporter));
}

const TrainingSet& MarkovModel::trainingSet() const {
    if (!m_words) {
        throw InvalidStateError("Word list is not loaded, load a word list first.");
    }
    return *m_words;
}

const TransitionTable& MarkovModel::table() const {
    if (!m_table) {
        throw InvalidStateError("Transition table is not available, build the transition table first.");
    }
    return *m_table;
}

std::string MarkovModel::generate(size_t length, RandomSource& rng) const {
    return Sampler::generate(table(), length, rng);
}

bool MarkovModel::isKnownWord(const std::string& candidate) const {
    return m_words && WordList::isKnownWord(*m_words, candidate);
}

GenerationResult MarkovModel::generateUnknown(size_t length, RandomSource& rng, int maxAttempts) const {
    if (maxAttempts < 1) {
        throw InvalidStateError("Attempt budget must be at least 1, got " + std::to_string(maxAttempts));
    }
    const TransitionTable& t = table();

    GenerationResult res;
    for (int i = 0; i < maxAttempts; ++i) {
        res.attempts = i + 1;
        std::string word = Sampler::generate(t, length, rng);
        if (!isKnownWord(word)) {
            res.status = GenerationResult::Status::Ok;
            res.word = std::move(word);
            return res;
        }
    }
    return res;
}
