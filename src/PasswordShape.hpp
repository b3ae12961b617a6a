#pragma once
#include <string>
#include <vector>

#include "MarkovModel.hpp"
#include "PassConfig.hpp"
#include "RandomSource.hpp"

namespace PasswordShape {
    // Upper-cases `count` distinct lowercase positions (fewer if the word has fewer).
    std::string capitalize(const std::string& word, int count, RandomSource& rng);
    // Overwrites `count` distinct lowercase positions with random digits.
    std::string insertDigits(const std::string& word, int count, RandomSource& rng);
}

struct PasswordResult {
    GenerationResult::Status status = GenerationResult::Status::Exhausted;
    std::string password;
    std::vector<int> attempts;   // per generated section
    int failedSection = -1;      // set when Exhausted

    bool ok() const { return status == GenerationResult::Status::Ok; }
};

// Generates cfg.sections non-dictionary words, shapes and joins them.
// The model must be built with cfg.order.
PasswordResult composePassword(const MarkovModel& model, const PassConfig& cfg, RandomSource& rng);
