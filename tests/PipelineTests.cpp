//
// Created by Matthew Krueger on 10/22/26.
//

#include <gtest/gtest.h>

#include "pipeline/Pipeline.hpp"
#include "pipeline/ReportWriter.hpp"
#include "shared/Errors.hpp"

using featureminer::Cluster;
using featureminer::Issue;
using featureminer::Pipeline;

namespace {

    std::vector<Issue> threeIssues() {
        return {
            Issue(1, 5, "upgrade the api please"),
            Issue(2, 3, "please upgrade api"),
            Issue(3, 0, "add a dark mode")
        };
    }

    Pipeline::Config unigramConfig(size_t numClusters) {
        Pipeline::Config config;
        config.vectorizer.ngramMin = 1;
        config.vectorizer.ngramMax = 1;
        config.clustering.numClusters = numClusters;
        return config;
    }

    std::vector<Issue> requestCorpus() {
        const std::vector<std::string> templates{
            "export report as csv", "csv export for reports", "export csv from dashboard",
            "dark mode theme", "add dark theme", "dark mode for editor",
            "login with saml sso", "sso login via okta", "saml single sign on",
            "offline sync for mobile", "mobile app offline mode", "sync notes offline"
        };

        std::vector<Issue> issues;
        for (size_t copy = 0; copy < 4; ++copy) {
            for (size_t index = 0; index < templates.size(); ++index) {
                const auto id = static_cast<int64_t>(copy * templates.size() + index);
                issues.emplace_back(id, static_cast<uint64_t>((id * 7) % 11), templates[index] + " v" + std::to_string(copy));
            }
        }
        return issues;
    }

}

TEST(PipelineTests, ThreeIssueCorpusRanksTheApiClusterFirst) {
    const auto issues = threeIssues();
    const Pipeline pipeline = Pipeline::train(issues, unigramConfig(2));

    const auto aggregation = pipeline.aggregate(issues);
    ASSERT_EQ(aggregation.assignments.size(), 3u);
    EXPECT_EQ(aggregation.assignments[0].cluster, aggregation.assignments[1].cluster);
    EXPECT_NE(aggregation.assignments[0].cluster, aggregation.assignments[2].cluster);

    const auto ranked = pipeline.rank(aggregation);
    ASSERT_EQ(ranked.size(), 2u);

    EXPECT_EQ(ranked[0].index, aggregation.assignments[0].cluster);
    EXPECT_EQ(ranked[0].issueCount, 2u);
    EXPECT_EQ(ranked[0].voteSum, 8u);
    EXPECT_DOUBLE_EQ(ranked[0].combinedScore, 1.0);
    EXPECT_EQ(ranked[0].topTerms, (std::vector<std::string>{"api", "upgrade"}));

    EXPECT_EQ(ranked[1].index, aggregation.assignments[2].cluster);
    EXPECT_EQ(ranked[1].issueCount, 1u);
    EXPECT_EQ(ranked[1].voteSum, 0u);
    EXPECT_DOUBLE_EQ(ranked[1].combinedScore, 0.0);
    EXPECT_EQ(ranked[1].topTerms, (std::vector<std::string>{"add", "dark", "mode"}));
}

TEST(PipelineTests, PredictionsStayInRangeAndAggregationRepeats) {
    const auto issues = requestCorpus();
    auto config = Pipeline::Config{};
    config.clustering.numClusters = 4;
    config.clustering.numInits = 3;
    const Pipeline pipeline = Pipeline::train(issues, config);

    const auto first = pipeline.aggregate(issues);
    const auto second = pipeline.aggregate(issues);

    for (const auto& assignment : first.assignments) {
        EXPECT_LT(assignment.cluster, 4u);
    }
    EXPECT_EQ(first.totals, second.totals);
    EXPECT_EQ(first.assignments, second.assignments);

    size_t totalIssues = 0;
    for (const auto& totals : first.totals) {
        totalIssues += totals.issueCount;
    }
    EXPECT_EQ(totalIssues, issues.size());

    EXPECT_EQ(pipeline.rank(first), pipeline.rank(second));
}

TEST(PipelineTests, ClustersAreLabelledWithDistinctIndices) {
    const auto issues = requestCorpus();
    auto config = Pipeline::Config{};
    config.clustering.numClusters = 4;
    config.topTermsCount = 3;
    const Pipeline pipeline = Pipeline::train(issues, config);

    ASSERT_EQ(pipeline.getClusters().size(), 4u);
    for (size_t index = 0; index < pipeline.getClusters().size(); ++index) {
        const Cluster& cluster = pipeline.getClusters()[index];
        EXPECT_EQ(cluster.index, index);
        EXPECT_LE(cluster.topTerms.size(), 3u);
        EXPECT_FALSE(cluster.topTerms.empty());
    }
}

TEST(PipelineTests, ThreadCountDoesNotChangeTheRanking) {
    const auto issues = requestCorpus();
    auto config = Pipeline::Config{};
    config.clustering.numClusters = 5;
    config.clustering.numInits = 2;

    const Pipeline sequential = Pipeline::train(issues, config);
    config.clustering.numThreads = 4;
    config.vectorizer.numThreads = 4;
    const Pipeline parallel = Pipeline::train(issues, config);

    EXPECT_EQ(parallel.getModel().getCentroids(), sequential.getModel().getCentroids());
    EXPECT_EQ(parallel.rank(parallel.aggregate(issues)), sequential.rank(sequential.aggregate(issues)));
}

TEST(PipelineTests, NewTextIsAssignedWithoutChangingTheModel) {
    const auto issues = threeIssues();
    const Pipeline pipeline = Pipeline::train(issues, unigramConfig(2));
    const auto centroids = pipeline.getModel().getCentroids();

    const std::vector<Issue> unseen{Issue(9, 1, "api upgrade soon"), Issue(10, 0, "nothing known here")};
    const auto aggregation = pipeline.aggregate(unseen);

    EXPECT_EQ(aggregation.assignments[0].cluster, pipeline.aggregate(issues).assignments[0].cluster);
    EXPECT_EQ(pipeline.getModel().getCentroids(), centroids);
}

TEST(PipelineTests, ReportCarriesTheTrainingSummary) {
    const auto issues = threeIssues();
    auto config = unigramConfig(2);
    config.clustering.seed = 77;
    const Pipeline pipeline = Pipeline::train(issues, config);

    const auto report = featureminer::ReportWriter::buildReport(pipeline, pipeline.rank(pipeline.aggregate(issues)));

    EXPECT_EQ(report.issueCount, 3u);
    EXPECT_EQ(report.clusterCount, 2u);
    EXPECT_EQ(report.seed, 77u);
    EXPECT_GE(report.iterations, 1u);
    EXPECT_TRUE(report.converged);
    EXPECT_NEAR(report.inertia, 0.0, 1e-12);
    EXPECT_EQ(report.clusters.size(), 2u);
}

TEST(PipelineTests, RejectsUntrainableInput) {
    EXPECT_THROW((void) Pipeline::train({}, unigramConfig(2)), featureminer::EmptyCorpusError);
    EXPECT_THROW((void) Pipeline::train(threeIssues(), unigramConfig(3)), featureminer::InvalidClusterCount);
    EXPECT_THROW((void) Pipeline::train(threeIssues(), unigramConfig(0)), featureminer::InvalidClusterCount);

    auto badScoring = unigramConfig(2);
    badScoring.scoring.voteMultiplier = 2.0;
    EXPECT_THROW((void) Pipeline::train(threeIssues(), badScoring), std::invalid_argument);
}

TEST(PipelineTests, RankRejectsAggregationOfAnotherSize) {
    const auto issues = threeIssues();
    const Pipeline pipeline = Pipeline::train(issues, unigramConfig(2));

    featureminer::AggregationResult aggregation = pipeline.aggregate(issues);
    aggregation.totals.pop_back();
    EXPECT_THROW((void) pipeline.rank(aggregation), std::invalid_argument);
}
