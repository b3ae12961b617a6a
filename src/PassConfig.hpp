#pragma once
#include <string>

struct PassConfig {
    std::string wordlistPath = "/usr/share/dict/words";
    int order = 3;          // n-gram context length
    int sections = 3;       // words per password
    int sectionLength = 6;  // characters per word
    int capitals = 1;       // per section
    int digits = 1;         // per section
    std::string delimiter = "-";
    int maxAttempts = 10;   // retries before giving up on a non-dictionary word
    bool secureRandom = true;
    bool autoCopy = true;

    // Throws InvalidStateError naming the first out-of-range field.
    void validate() const;
};
