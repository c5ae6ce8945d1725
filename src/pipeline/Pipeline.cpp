//
// Created by Matthew Krueger on 10/21/26.
//

#include "Pipeline.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "../ranking/ClusterLabeler.hpp"
#include "../shared/Errors.hpp"
#include "../shared/Instrumentation.hpp"
#include "../shared/Logging.hpp"

namespace featureminer {

    Pipeline::Pipeline(Config config, Vectorizer vectorizer, KMeansModel model, std::vector<Cluster> clusters,
                       TrainingSummary summary)
        : m_Config(std::move(config)), m_Vectorizer(std::move(vectorizer)), m_Model(std::move(model)),
          m_Clusters(std::move(clusters)), m_Summary(summary) {}

    Pipeline Pipeline::train(const std::vector<Issue>& issues, Config config) {
        PROFILE_FUNCTION();

        if (issues.empty()) {
            throw EmptyCorpusError("No issues to train on");
        }

        // construct everything first so a bad setting fails before any work is done
        Vectorizer vectorizer(config.vectorizer);
        const KMeansSolver solver(config.clustering);
        const Scorer scorer(config.scoring);

        std::vector<std::string> corpus;
        corpus.reserve(issues.size());
        for (const auto& issue : issues) {
            corpus.push_back(issue.description);
        }

        const std::vector<SparseVector> matrix = vectorizer.fitTransform(corpus);
        const size_t numDimensions = vectorizer.getVocabulary().size();

        KMeansSolver::TrainingResult result = solver.train(matrix, numDimensions);
        LOG_INFO("Trained " << result.model.numClusters() << " clusters in " << result.iterations
                 << " iterations, inertia " << result.inertia);

        std::vector<Cluster> clusters;
        clusters.reserve(result.model.numClusters());
        for (size_t clusterIndex = 0; clusterIndex < result.model.numClusters(); ++clusterIndex) {
            Cluster cluster;
            cluster.index = clusterIndex;
            cluster.topTerms = ClusterLabeler::label(result.model.getCentroids()[clusterIndex],
                                                     vectorizer.getVocabulary(), config.topTermsCount);
            clusters.push_back(std::move(cluster));
        }

        TrainingSummary summary{issues.size(), result.iterations, result.inertia, result.converged, result.bestInit};

        return {std::move(config), std::move(vectorizer), std::move(result.model), std::move(clusters), summary};
    }

    AggregationResult Pipeline::aggregate(const std::vector<Issue>& issues) const {
        return Aggregator::aggregate(issues, m_Vectorizer, m_Model, m_Config.clustering.numThreads);
    }

    std::vector<Cluster> Pipeline::rank(const AggregationResult& aggregation) const {
        if (aggregation.totals.size() != m_Clusters.size()) {
            throw std::invalid_argument(
                "Aggregation has totals for " + std::to_string(aggregation.totals.size()) + " clusters, expected " +
                std::to_string(m_Clusters.size()));
        }

        // start from the labelled clusters every time so nothing carries over between passes
        std::vector<Cluster> clusters = m_Clusters;
        for (auto& cluster : clusters) {
            cluster.issueCount = aggregation.totals[cluster.index].issueCount;
            cluster.voteSum = aggregation.totals[cluster.index].voteSum;
        }

        return Scorer(m_Config.scoring).rank(std::move(clusters));
    }

}
