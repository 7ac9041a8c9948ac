#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include "errors.hpp"
#include "toy_corpus.hpp"
#include "test_util.hpp"
#include "vocabulary.hpp"

using namespace count2vec;

TEST(DistinctWordsTest, ToyCorpus) {
    DistinctWordsResult result = DistinctWords(fixtures::ToyCorpus());
    
    std::vector<std::string> expected = {
        "All", "All's", "END", "START", "ends",
        "glitters", "gold", "isn't", "that", "well",
    };
    EXPECT_EQ(result.words, expected);
    EXPECT_EQ(result.count, 10u);
}

TEST(DistinctWordsTest, StrictlyAscendingWithoutDuplicates) {
    Corpus corpus = {
        {"b", "a", "B", "a", "c"},
        {"c", "A", "b", "aa", "a"},
    };
    DistinctWordsResult result = DistinctWords(corpus);
    
    ASSERT_EQ(result.words.size(), result.count);
    for (size_t i = 1; i < result.words.size(); ++i) {
        EXPECT_LT(result.words[i - 1], result.words[i]);
    }
    // 大写字母排在小写之前
    std::vector<std::string> expected = {"A", "B", "a", "aa", "b", "c"};
    EXPECT_EQ(result.words, expected);
}

TEST(DistinctWordsTest, DeterministicAcrossCallsAndDocumentOrder) {
    Corpus corpus = fixtures::ToyCorpus();
    Corpus reversed(corpus.rbegin(), corpus.rend());
    
    DistinctWordsResult first = DistinctWords(corpus);
    DistinctWordsResult second = DistinctWords(corpus);
    DistinctWordsResult third = DistinctWords(reversed);
    EXPECT_EQ(first.words, second.words);
    EXPECT_EQ(first.words, third.words);
    EXPECT_EQ(first.count, third.count);
}

TEST(DistinctWordsTest, EmptyCorpusAndEmptyDocuments) {
    DistinctWordsResult empty = DistinctWords(Corpus{});
    EXPECT_TRUE(empty.words.empty());
    EXPECT_EQ(empty.count, 0u);
    
    DistinctWordsResult partial = DistinctWords(Corpus{{}, {"well", "well"}, {}});
    EXPECT_EQ(partial.count, 1u);
    EXPECT_EQ(partial.words.front(), "well");
}

TEST(VocabularyTest, BasicConstruction) {
    Vocabulary vocab;
    EXPECT_EQ(vocab.Size(), 0u);
    EXPECT_EQ(vocab.GetWordIndex("anything"), -1);
}

TEST(VocabularyTest, IndicesFollowSortedOrder) {
    Vocabulary vocab = Vocabulary::FromCorpus(fixtures::ToyCorpus());
    
    ASSERT_EQ(vocab.Size(), 10u);
    EXPECT_EQ(vocab.WordToIndex(), fixtures::ToyWordToIndex());
    for (size_t i = 0; i < vocab.Size(); ++i) {
        EXPECT_EQ(vocab.GetWordIndex(vocab.GetWord(static_cast<int>(i))),
                  static_cast<int>(i));
    }
}

TEST(VocabularyTest, WordIndexLookup) {
    Vocabulary vocab = Vocabulary::FromCorpus(fixtures::ToyCorpus());
    
    EXPECT_EQ(vocab.GetWordIndex("that"), 8);
    EXPECT_EQ(vocab.IndexOf("All"), 0);
    EXPECT_TRUE(vocab.Contains("gold"));
    EXPECT_FALSE(vocab.Contains("all"));  // 区分大小写
    EXPECT_EQ(vocab.GetWordIndex("nonexistent"), -1);
    EXPECT_THROW(vocab.IndexOf("nonexistent"), LookupError);
}

TEST(VocabularyTest, LookupErrorCarriesWord) {
    Vocabulary vocab = Vocabulary::FromWords({"a"});
    try {
        vocab.IndexOf("zebra");
        FAIL() << "expected LookupError";
    } catch (const LookupError& e) {
        EXPECT_EQ(e.Word(), "zebra");
    }
}

TEST(VocabularyTest, FromWordsSortsAndDeduplicates) {
    Vocabulary vocab = Vocabulary::FromWords({"well", "All", "well", "ends"});
    std::vector<std::string> expected = {"All", "ends", "well"};
    EXPECT_EQ(vocab.Words(), expected);
}

class VocabularyFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ScratchPath("vocab.txt");
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    std::string path_;
};

TEST_F(VocabularyFileTest, SaveAndLoad) {
    Vocabulary vocab1 = Vocabulary::FromCorpus(fixtures::ToyCorpus());
    vocab1.Save(path_);
    
    Vocabulary vocab2;
    vocab2.Load(path_);
    
    EXPECT_EQ(vocab1.Words(), vocab2.Words());
    EXPECT_EQ(vocab2.IndexOf("well"), 9);
}

TEST_F(VocabularyFileTest, SaveAndLoadKeepsSpacesAndEmptyWord) {
    Vocabulary vocab1 = Vocabulary::FromCorpus(Corpus{{"New York", "", "b", " padded "}});
    ASSERT_EQ(vocab1.Size(), 4u);
    vocab1.Save(path_);
    
    Vocabulary vocab2;
    vocab2.Load(path_);
    
    EXPECT_EQ(vocab2.Words(), vocab1.Words());
    EXPECT_TRUE(vocab2.Contains("New York"));
    EXPECT_TRUE(vocab2.Contains(""));
    EXPECT_TRUE(vocab2.Contains(" padded "));
    EXPECT_FALSE(vocab2.Contains("New"));
}

TEST_F(VocabularyFileTest, SaveRejectsLineBreakInWord) {
    Vocabulary vocab = Vocabulary::FromWords({"ok", "two\nlines"});
    EXPECT_THROW(vocab.Save(path_), InvalidParameterError);
    
    std::ifstream file(path_);
    EXPECT_FALSE(file.good());  // 校验失败时不创建文件
}

TEST_F(VocabularyFileTest, LoadRejectsDuplicates) {
    {
        std::ofstream file(path_);
        file << "gold\nwell\ngold\n";
    }
    Vocabulary vocab;
    EXPECT_THROW(vocab.Load(path_), std::runtime_error);
}

TEST_F(VocabularyFileTest, LoadMissingFileThrows) {
    Vocabulary vocab;
    EXPECT_THROW(vocab.Load(ScratchPath("missing_vocab.txt")), std::runtime_error);
}
