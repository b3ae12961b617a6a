#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "Errors.hpp"
#include "TestSupport.hpp"
#include "WordList.hpp"

TEST(WordListTest, KeepsOnlyAlphabeticLinesLowercased) {
    std::istringstream in("Apple\nAPPLY\n\nit's\nco-op\nhello world\nabc123\n  space\nbanana\n");
    TrainingSet words = WordList::loadFromStream(in);
    EXPECT_EQ(words, (TrainingSet{"apple", "apply", "banana"}));
}

TEST(WordListTest, CollapsesDuplicatesAcrossCase) {
    std::istringstream in("Zebra\nzebra\nZEBRA\n");
    TrainingSet words = WordList::loadFromStream(in);
    ASSERT_EQ(words.size(), 1u);
    EXPECT_TRUE(words.count("zebra"));
}

TEST(WordListTest, StripsCarriageReturns) {
    std::istringstream in("alpha\r\nbeta\r\n");
    EXPECT_EQ(WordList::loadFromStream(in), (TrainingSet{"alpha", "beta"}));
}

TEST(WordListTest, RejectsNonAsciiLetters) {
    std::istringstream in("caf\xc3\xa9\nnaive\n");
    EXPECT_EQ(WordList::loadFromStream(in), (TrainingSet{"naive"}));
}

TEST(WordListTest, LineOrderDoesNotMatter) {
    std::istringstream a("pear\nplum\nfig\nplum\n");
    std::istringstream b("fig\nPlum\npear\n");
    EXPECT_EQ(WordList::loadFromStream(a), WordList::loadFromStream(b));
}

TEST(WordListTest, EmptyOrInvalidInputGivesEmptySet) {
    std::istringstream empty("");
    EXPECT_TRUE(WordList::loadFromStream(empty).empty());
    std::istringstream junk("123\n--\n \n");
    EXPECT_TRUE(WordList::loadFromStream(junk).empty());
}

TEST(WordListTest, IsValidWord) {
    EXPECT_TRUE(WordList::isValidWord("Hello"));
    EXPECT_FALSE(WordList::isValidWord(""));
    EXPECT_FALSE(WordList::isValidWord("he llo"));
    EXPECT_FALSE(WordList::isValidWord("hello1"));
    EXPECT_FALSE(WordList::isValidWord("o'clock"));
}

TEST(WordListTest, IsKnownWordIsExactMatch) {
    TrainingSet words{"apple", "apply"};
    EXPECT_TRUE(WordList::isKnownWord(words, "apple"));
    EXPECT_FALSE(WordList::isKnownWord(words, "Apple"));
    EXPECT_FALSE(WordList::isKnownWord(words, "appl"));
    EXPECT_FALSE(WordList::isKnownWord(words, ""));
}

TEST(WordListTest, LoadsFromFile) {
    RecordingReporter rep;
    TrainingSet words = WordList::loadFromFile(std::string(PASSCLIP_TEST_DATA_DIR) + "/sample_words.txt", rep);
    EXPECT_EQ(words, (TrainingSet{"apple", "apply", "zebra", "banana"}));

    ASSERT_FALSE(rep.messages.empty());
    EXPECT_NE(rep.messages.front().find("sample_words.txt"), std::string::npos);
    EXPECT_EQ(rep.lastDone, 13u);
    EXPECT_EQ(rep.lastTotal, 13u);
}

TEST(WordListTest, ReportingDoesNotChangeResult) {
    const std::string path = std::string(PASSCLIP_TEST_DATA_DIR) + "/sample_words.txt";
    RecordingReporter rep;
    EXPECT_EQ(WordList::loadFromFile(path, rep), WordList::loadFromFile(path));
}

TEST(WordListTest, MissingFileThrowsNotFound) {
    EXPECT_THROW(WordList::loadFromFile(std::string(PASSCLIP_TEST_DATA_DIR) + "/no_such_file.txt"),
                 NotFoundError);
}

TEST(WordListTest, DirectoryThrowsNotFound) {
    EXPECT_THROW(WordList::loadFromFile(PASSCLIP_TEST_DATA_DIR), NotFoundError);
}
