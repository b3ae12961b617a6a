#include "PasswordShape.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>

// Picks up to `count` distinct indices of lowercase letters, uniformly.
static std::vector<size_t> pickLowerPositions(const std::string& s, int count, RandomSource& rng) {
    std::vector<size_t> idx;
    for (size_t i=0;i<s.size();++i) if (std::islower((unsigned char)s[i])) idx.push_back(i);
    size_t n = std::min(idx.size(), (size_t)std::max(count, 0));
    // partial Fisher-Yates
    for (size_t i=0;i<n;++i) {
        size_t j = i + (size_t)rng.below(idx.size() - i);
        std::swap(idx[i], idx[j]);
    }
    idx.resize(n);
    return idx;
}

std::string PasswordShape::capitalize(const std::string& word, int count, RandomSource& rng) {
    std::string out = word;
    for (size_t i : pickLowerPositions(out, count, rng)) {
        out[i] = (char)std::toupper((unsigned char)out[i]);
    }
    return out;
}

std::string PasswordShape::insertDigits(const std::string& word, int count, RandomSource& rng) {
    std::string out = word;
    for (size_t i : pickLowerPositions(out, count, rng)) {
        out[i] = (char)('0' + rng.below(10));
    }
    return out;
}

PasswordResult composePassword(const MarkovModel& model, const PassConfig& cfg, RandomSource& rng) {
    cfg.validate();
    if (model.order() != cfg.order || !model.isBuilt()) {
        throw InvalidStateError("Model must be built with order " + std::to_string(cfg.order));
    }

    PasswordResult res;
    std::string password;
    for (int s=0;s<cfg.sections;++s) {
        GenerationResult g = model.generateUnknown((size_t)cfg.sectionLength, rng, cfg.maxAttempts);
        res.attempts.push_back(g.attempts);
        if (!g.ok()) {
            res.failedSection = s;
            return res;
        }
        std::string word = PasswordShape::capitalize(g.word, cfg.capitals, rng);
        word = PasswordShape::insertDigits(word, cfg.digits, rng);
        if (s > 0) password += cfg.delimiter;
        password += word;
    }
    res.status = GenerationResult::Status::Ok;
    res.password = std::move(password);
    return res;
}
