#pragma once
#include <iosfwd>
#include <string>
#include <unordered_set>

#include "Reporter.hpp"

// Deduplicated lowercase words, each matching ^[a-z]+$.
using TrainingSet = std::unordered_set<std::string>;

namespace WordList {
    // One word per line; lines that are not purely ASCII letters are dropped,
    // the rest lower-cased. Throws NotFoundError if the file can't be read.
    TrainingSet loadFromFile(const std::string& path, Reporter& reporter = NullReporter::instance());

    TrainingSet loadFromStream(std::istream& in, Reporter& reporter = NullReporter::instance());

    bool isValidWord(const std::string& line);

    bool isKnownWord(const TrainingSet& words, const std::string& candidate);
}
