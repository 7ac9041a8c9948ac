#include <gtest/gtest.h>
#include <fstream>
#include <stdexcept>
#include "corpus.hpp"
#include "test_util.hpp"

using namespace count2vec;

TEST(ParseDocumentTest, AddsBoundaryMarkers) {
    Document doc = ParseDocument("All that glitters");
    Document expected = {"START", "All", "that", "glitters", "END"};
    EXPECT_EQ(doc, expected);
}

TEST(ParseDocumentTest, WithoutMarkers) {
    Document doc = ParseDocument("  All\tthat   glitters ", false);
    Document expected = {"All", "that", "glitters"};
    EXPECT_EQ(doc, expected);
}

TEST(ParseDocumentTest, BlankLineIsEmptyEvenWithMarkers) {
    EXPECT_TRUE(ParseDocument("   ").empty());
    EXPECT_TRUE(ParseDocument("").empty());
}

TEST(ParseDocumentTest, KeepsCaseAndPunctuation) {
    Document doc = ParseDocument("All's well, ALL", false);
    Document expected = {"All's", "well,", "ALL"};
    EXPECT_EQ(doc, expected);
}

class ReadCorpusTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ScratchPath("corpus.txt");
        std::ofstream file(path_);
        file << "All that glitters isn't gold\n";
        file << "\n";
        file << "All's well that ends well\n";
    }

    std::string path_;
};

TEST_F(ReadCorpusTest, OneDocumentPerNonBlankLine) {
    Corpus corpus = ReadCorpus(path_);
    ASSERT_EQ(corpus.size(), 2u);
    EXPECT_EQ(corpus[0].front(), "START");
    EXPECT_EQ(corpus[0].back(), "END");
    EXPECT_EQ(corpus[0].size(), 7u);
    EXPECT_EQ(corpus[1][1], "All's");
    EXPECT_EQ(CorpusTokenCount(corpus), 14);
}

TEST_F(ReadCorpusTest, WithoutMarkers) {
    Corpus corpus = ReadCorpus(path_, false);
    ASSERT_EQ(corpus.size(), 2u);
    EXPECT_EQ(corpus[0].front(), "All");
    EXPECT_EQ(CorpusTokenCount(corpus), 10);
}

TEST(ReadCorpusErrorTest, MissingFileThrows) {
    EXPECT_THROW(ReadCorpus(ScratchPath("does_not_exist.txt")), std::runtime_error);
}

TEST(CorpusTokenCountTest, EmptyCorpus) {
    EXPECT_EQ(CorpusTokenCount(Corpus{}), 0);
    EXPECT_EQ(CorpusTokenCount(Corpus{{}, {}}), 0);
}
