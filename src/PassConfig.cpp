#include "PassConfig.hpp"
#include "Errors.hpp"

static void requireRange(const char* name, int v, int lo, int hi) {
    if (v < lo || v > hi) {
        throw InvalidStateError(std::string(name) + " must be in [" + std::to_string(lo) + ", "
                                + std::to_string(hi) + "], got " + std::to_string(v));
    }
}

void PassConfig::validate() const {
    if (wordlistPath.empty()) throw InvalidStateError("word list path is empty");
    requireRange("order", order, 1, 6);
    requireRange("sections", sections, 1, 8);
    requireRange("section length", sectionLength, 3, 16);
    requireRange("capitals", capitals, 0, sectionLength);
    requireRange("digits", digits, 0, sectionLength);
    if (capitals + digits > sectionLength) {
        throw InvalidStateError("capitals + digits must not exceed the section length");
    }
    requireRange("max attempts", maxAttempts, 1, 100);
}
