#include <gtest/gtest.h>
#include <memory>
#include <string>

#include "Errors.hpp"
#include "MarkovModel.hpp"
#include "TestSupport.hpp"

namespace {

std::shared_ptr<const TrainingSet> words(TrainingSet w) {
    return std::make_shared<const TrainingSet>(std::move(w));
}

}

TEST(MarkovModelTest, BuildWithoutWordsIsInvalidState) {
    MarkovModel m(2);
    EXPECT_FALSE(m.hasWords());
    EXPECT_THROW(m.build(), InvalidStateError);
    EXPECT_THROW(m.trainingSet(), InvalidStateError);
}

TEST(MarkovModelTest, BuildWithEmptyWordsIsInvalidState) {
    MarkovModel m(2);
    m.setTrainingSet(words({}));
    EXPECT_THROW(m.build(), InvalidStateError);
    EXPECT_FALSE(m.isBuilt());
}

TEST(MarkovModelTest, GenerateBeforeBuildIsInvalidState) {
    MarkovModel m(2);
    m.setTrainingSet(words({"apple"}));
    MersenneSource rng(1);
    EXPECT_THROW(m.generate(5, rng), InvalidStateError);
    EXPECT_THROW(m.generateUnknown(5, rng, 3), InvalidStateError);
}

TEST(MarkovModelTest, ChangingOrderDiscardsTable) {
    MarkovModel m(2);
    m.setTrainingSet(words({"apple", "apply"}));
    m.build();
    ASSERT_TRUE(m.isBuilt());

    m.setOrder(2);
    EXPECT_TRUE(m.isBuilt());
    m.setOrder(3);
    EXPECT_FALSE(m.isBuilt());
    m.build();
    EXPECT_EQ(m.table().order(), 3);
}

TEST(MarkovModelTest, ReplacingWordsDiscardsTable) {
    MarkovModel m(1);
    m.setTrainingSet(words({"apple"}));
    m.build();
    m.setTrainingSet(words({"pear"}));
    EXPECT_FALSE(m.isBuilt());
}

TEST(MarkovModelTest, ModelsCanShareOneWordList) {
    auto shared = words({"river", "rover", "raven", "riven"});
    MarkovModel a(1), b(2);
    a.setTrainingSet(shared);
    b.setTrainingSet(shared);
    a.build();
    b.build();
    EXPECT_EQ(&a.trainingSet(), &b.trainingSet());
    EXPECT_NE(a.table().size(), 0u);
    EXPECT_NE(b.table().size(), 0u);
}

TEST(MarkovModelTest, IsKnownWord) {
    MarkovModel m(2);
    EXPECT_FALSE(m.isKnownWord("apple"));
    m.setTrainingSet(words({"apple"}));
    EXPECT_TRUE(m.isKnownWord("apple"));
    EXPECT_FALSE(m.isKnownWord("apply"));
}

TEST(MarkovModelTest, LoadWordListFromFile) {
    MarkovModel m(2);
    RecordingReporter rep;
    m.loadWordList(std::string(PASSCLIP_TEST_DATA_DIR) + "/sample_words.txt", rep);
    m.build(rep);
    EXPECT_EQ(m.trainingSet().size(), 4u);
    EXPECT_TRUE(m.isKnownWord("zebra"));
}

TEST(MarkovModelTest, LoadMissingWordListKeepsPreviousState) {
    MarkovModel m(1);
    m.setTrainingSet(words({"apple"}));
    m.build();
    EXPECT_THROW(m.loadWordList(std::string(PASSCLIP_TEST_DATA_DIR) + "/missing.txt"), NotFoundError);
    EXPECT_TRUE(m.isKnownWord("apple"));
    EXPECT_TRUE(m.isBuilt());
}

// Every output of this corpus at length 5 is a real word.
TEST(MarkovModelTest, UnknownExhaustsWhenEveryAttemptIsAWord) {
    MarkovModel m(2);
    m.setTrainingSet(words({"apple", "apply"}));
    m.build();
    MersenneSource rng(3);
    GenerationResult r = m.generateUnknown(5, rng, 10);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.status, GenerationResult::Status::Exhausted);
    EXPECT_EQ(r.attempts, 10);
    EXPECT_TRUE(r.word.empty());
}

TEST(MarkovModelTest, ExhaustedReportsExactlyTheBudget) {
    MarkovModel m(2);
    m.setTrainingSet(words({"apple", "apply"}));
    m.build();
    SequenceSource seq({0});
    GenerationResult r = m.generateUnknown(5, seq, 1);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.attempts, 1);
    // five draws per attempt, one attempt
    EXPECT_EQ(seq.draws(), 5u);
}

TEST(MarkovModelTest, UnknownRetriesPastRealWords) {
    // order 1 over "ab","ba": ^ -> {a,b}, a -> {b}, b -> {a}
    // length 2 can only produce "ab" or "ba", both real; length 3 never is.
    MarkovModel m(1);
    m.setTrainingSet(words({"ab", "ba"}));
    m.build();
    SequenceSource seq({0});
    EXPECT_FALSE(m.generateUnknown(2, seq, 4).ok());

    GenerationResult r = m.generateUnknown(3, seq, 4);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.word, "aba");
    EXPECT_EQ(r.attempts, 1);
}

TEST(MarkovModelTest, UnknownCountsAttemptsUntilSuccess) {
    // order 1 over {"ab","aab"}: ^ -> {a:2}, a -> {a:1, b:2}
    // at length 2 only "aa" is not a word
    MarkovModel m(1);
    m.setTrainingSet(words({"ab", "aab"}));
    m.build();
    SequenceSource seq({0, 1, 0, 2, 0, 0});
    GenerationResult r = m.generateUnknown(2, seq, 5);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.word, "aa");
    EXPECT_EQ(r.attempts, 3);
    EXPECT_EQ(seq.draws(), 6u);
}

TEST(MarkovModelTest, NonPositiveAttemptBudgetIsInvalidState) {
    MarkovModel m(1);
    m.setTrainingSet(words({"apple"}));
    m.build();
    MersenneSource rng(1);
    EXPECT_THROW(m.generateUnknown(5, rng, 0), InvalidStateError);
}

TEST(MarkovModelTest, ExhaustedTransitionsPropagatesFromRetryLoop) {
    MarkovModel m(5);
    m.setTrainingSet(words({"cat", "dog"}));
    m.build();
    MersenneSource rng(1);
    EXPECT_THROW(m.generateUnknown(5, rng, 10), ExhaustedTransitionsError);
}
