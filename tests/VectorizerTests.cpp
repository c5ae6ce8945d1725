//
// Created by Matthew Krueger on 10/22/26.
//

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shared/Errors.hpp"
#include "text/Vectorizer.hpp"

using featureminer::SparseVector;
using featureminer::Vectorizer;

namespace {

    Vectorizer::Config unigrams() {
        Vectorizer::Config config;
        config.ngramMin = 1;
        config.ngramMax = 1;
        return config;
    }

    const std::vector<std::string> apiCorpus{"api upgrade", "api crash", "login slow"};

}

TEST(VectorizerTests, VocabularyIsLexicographicAndHoldsBigrams) {
    Vectorizer vectorizer;
    const auto& vocabulary = vectorizer.fit({"dark mode toggle"});

    const std::vector<std::string> expected{"dark", "dark mode", "mode", "mode toggle", "toggle"};
    EXPECT_EQ(vocabulary.getTerms(), expected);
    EXPECT_EQ(vocabulary.find("mode toggle").value(), 3u);
    EXPECT_FALSE(vocabulary.find("dark toggle").has_value());
}

TEST(VectorizerTests, StandardAndExtraStopWordsAreExcluded) {
    Vectorizer vectorizer(unigrams());
    const auto& vocabulary = vectorizer.fit({"Please add the feature", "Issue with login"});

    const std::vector<std::string> expected{"add", "login"};
    EXPECT_EQ(vocabulary.getTerms(), expected);
}

TEST(VectorizerTests, SmoothedInverseDocumentFrequency) {
    Vectorizer vectorizer(unigrams());
    vectorizer.fit({"api upgrade", "api crash"});

    // api, crash, upgrade
    ASSERT_EQ(vectorizer.getIdf().size(), 3u);
    EXPECT_DOUBLE_EQ(vectorizer.getIdf()[0], 1.0);
    EXPECT_DOUBLE_EQ(vectorizer.getIdf()[1], std::log(3.0 / 2.0) + 1.0);
    EXPECT_DOUBLE_EQ(vectorizer.getIdf()[2], std::log(3.0 / 2.0) + 1.0);
}

TEST(VectorizerTests, UnsmoothedInverseDocumentFrequency) {
    auto config = unigrams();
    config.smoothIdf = false;
    Vectorizer vectorizer(config);
    vectorizer.fit({"api upgrade", "api crash"});

    EXPECT_DOUBLE_EQ(vectorizer.getIdf()[0], 1.0);
    EXPECT_DOUBLE_EQ(vectorizer.getIdf()[1], std::log(2.0) + 1.0);
}

TEST(VectorizerTests, RowsAreUnitLength) {
    Vectorizer vectorizer(unigrams());
    const auto rows = vectorizer.fitTransform(apiCorpus);

    ASSERT_EQ(rows.size(), apiCorpus.size());
    for (const auto& row : rows) {
        EXPECT_NEAR(row.squaredNorm(), 1.0, 1e-12);
    }
}

TEST(VectorizerTests, RawWeightsWithoutNormalization) {
    auto config = unigrams();
    config.normalize = false;
    Vectorizer vectorizer(config);
    vectorizer.fit({"api upgrade", "api crash"});

    const SparseVector row = vectorizer.transform("api api upgrade");
    EXPECT_DOUBLE_EQ(row.valueAt(0), 2.0);
    EXPECT_DOUBLE_EQ(row.valueAt(1), 0.0);
    EXPECT_DOUBLE_EQ(row.valueAt(2), std::log(3.0 / 2.0) + 1.0);
}

TEST(VectorizerTests, UnknownAndEmptyTextGiveTheZeroVector) {
    Vectorizer vectorizer(unigrams());
    vectorizer.fit(apiCorpus);

    EXPECT_TRUE(vectorizer.transform("completely unseen words").empty());
    EXPECT_TRUE(vectorizer.transform("").empty());

    const SparseVector partial = vectorizer.transform("api and something unseen");
    EXPECT_EQ(partial.nonZeroCount(), 1u);
}

TEST(VectorizerTests, TransformIsIdempotent) {
    Vectorizer vectorizer;
    vectorizer.fit(apiCorpus);

    const SparseVector first = vectorizer.transform("slow api upgrade after login");
    const SparseVector second = vectorizer.transform("slow api upgrade after login");
    EXPECT_EQ(first, second);
}

TEST(VectorizerTests, MinimumDocumentFrequencyPrunes) {
    auto config = unigrams();
    config.minDocumentFrequency = 2;
    Vectorizer vectorizer(config);

    const std::vector<std::string> expected{"api"};
    EXPECT_EQ(vectorizer.fit(apiCorpus).getTerms(), expected);
}

TEST(VectorizerTests, MaximumDocumentFrequencyPrunes) {
    auto config = unigrams();
    config.maxDocumentFrequency = 0.5;
    Vectorizer vectorizer(config);

    const std::vector<std::string> expected{"crash", "login", "slow", "upgrade"};
    EXPECT_EQ(vectorizer.fit(apiCorpus).getTerms(), expected);
}

TEST(VectorizerTests, MaxFeaturesKeepsMostFrequentTermsTiesByTerm) {
    auto config = unigrams();
    config.maxFeatures = 2;
    Vectorizer vectorizer(config);

    const std::vector<std::string> expected{"api", "crash"};
    EXPECT_EQ(vectorizer.fit(apiCorpus).getTerms(), expected);
}

TEST(VectorizerTests, ParallelTransformMatchesSequential) {
    std::vector<std::string> corpus;
    for (int document = 0; document < 64; ++document) {
        corpus.push_back("api upgrade " + std::to_string(document % 7) + "x login crash" +
                         (document % 3 == 0 ? " dark mode" : " slow export"));
    }

    Vectorizer sequential;
    const auto expected = sequential.fitTransform(corpus);

    Vectorizer::Config config;
    config.numThreads = 4;
    Vectorizer parallel(config);
    const auto actual = parallel.fitTransform(corpus);

    EXPECT_EQ(actual, expected);
}

TEST(VectorizerTests, EmptyCorpusThrows) {
    Vectorizer vectorizer;
    EXPECT_THROW(vectorizer.fit({}), featureminer::EmptyCorpusError);
}

TEST(VectorizerTests, UseBeforeFitThrows) {
    Vectorizer vectorizer;
    EXPECT_FALSE(vectorizer.isFitted());
    EXPECT_THROW((void) vectorizer.transform("api"), std::logic_error);
    EXPECT_THROW((void) vectorizer.getVocabulary(), std::logic_error);

    vectorizer.fit({"api upgrade"});
    EXPECT_TRUE(vectorizer.isFitted());
}

TEST(VectorizerTests, InvalidConfigurationThrows) {
    Vectorizer::Config reversed;
    reversed.ngramMin = 2;
    reversed.ngramMax = 1;
    EXPECT_THROW(Vectorizer{reversed}, std::invalid_argument);

    Vectorizer::Config zero;
    zero.ngramMin = 0;
    EXPECT_THROW(Vectorizer{zero}, std::invalid_argument);

    Vectorizer::Config maxDf;
    maxDf.maxDocumentFrequency = 0.0;
    EXPECT_THROW(Vectorizer{maxDf}, std::invalid_argument);

    Vectorizer::Config noThreads;
    noThreads.numThreads = 0;
    EXPECT_THROW(Vectorizer{noThreads}, std::invalid_argument);

    Vectorizer::Config wrappedThreads;
    wrappedThreads.numThreads = std::numeric_limits<size_t>::max();
    EXPECT_THROW(Vectorizer{wrappedThreads}, std::invalid_argument);
}
