//
// Created by Matthew Krueger on 10/22/26.
//

#include <gtest/gtest.h>

#include "text/StopWords.hpp"
#include "text/Tokenizer.hpp"

using featureminer::Tokenizer;

TEST(TokenizerTests, LowercasesAndSplitsOnPunctuation) {
    const std::vector<std::string> expected{"add", "dark", "mode", "v2"};
    EXPECT_EQ(Tokenizer::tokenize("Add Dark-Mode, v2 & a X!"), expected);
}

TEST(TokenizerTests, KeepsUnderscoresAndDigits) {
    const std::vector<std::string> expected{"snake_case", "id", "42"};
    EXPECT_EQ(Tokenizer::tokenize("snake_case id 42"), expected);
}

TEST(TokenizerTests, TreatsNonAsciiBytesAsTokenText) {
    const std::vector<std::string> expected{"caf\xc3\xa9", "au", "lait"};
    EXPECT_EQ(Tokenizer::tokenize("Caf\xc3\xa9 au lait"), expected);
}

TEST(TokenizerTests, EmptyTextHasNoTokens) {
    EXPECT_TRUE(Tokenizer::tokenize("").empty());
    EXPECT_TRUE(Tokenizer::tokenize("  ... ! a ").empty());
}

TEST(TokenizerTests, BuildsUnigramsThenBigrams) {
    const std::vector<std::string> tokens{"add", "dark", "mode", "toggle"};
    const std::unordered_set<std::string> stopWords{"add"};

    const std::vector<std::string> expected{"dark", "mode", "toggle", "dark mode", "mode toggle"};
    EXPECT_EQ(Tokenizer::buildNgrams(tokens, stopWords, 1, 2), expected);
}

TEST(TokenizerTests, RemovesStopWordsBeforeFormingNgrams) {
    const std::vector<std::string> tokens{"dark", "the", "mode"};
    const std::unordered_set<std::string> stopWords{"the"};

    const std::vector<std::string> expected{"dark mode"};
    EXPECT_EQ(Tokenizer::buildNgrams(tokens, stopWords, 2, 2), expected);
}

TEST(TokenizerTests, NgramsLongerThanTheDocumentAreSkipped) {
    const std::vector<std::string> tokens{"api"};
    const std::vector<std::string> expected{"api"};
    EXPECT_EQ(Tokenizer::buildNgrams(tokens, {}, 1, 3), expected);
}

TEST(StopWordTests, ExtraWordsAreTrimmedAndLowercased) {
    const auto stopWords = featureminer::buildStopWordSet({"  Feature ", "ISSUE"});

    EXPECT_TRUE(stopWords.contains("feature"));
    EXPECT_TRUE(stopWords.contains("issue"));
    EXPECT_TRUE(stopWords.contains("the"));
    EXPECT_FALSE(stopWords.contains("api"));
}

TEST(StopWordTests, EnglishListHasCommonWords) {
    const auto& english = featureminer::englishStopWords();
    EXPECT_TRUE(english.contains("please"));
    EXPECT_TRUE(english.contains("and"));
    EXPECT_FALSE(english.contains("upgrade"));
}
