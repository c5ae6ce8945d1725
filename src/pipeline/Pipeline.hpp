//
// Created by Matthew Krueger on 10/21/26.
//

#ifndef FEATUREMINER_PIPELINE_HPP
#define FEATUREMINER_PIPELINE_HPP

#include <vector>

#include "../clustering/KMeansModel.hpp"
#include "../clustering/KMeansSolver.hpp"
#include "../ranking/Aggregator.hpp"
#include "../ranking/Cluster.hpp"
#include "../ranking/Scorer.hpp"
#include "../shared/Issue.hpp"
#include "../text/Vectorizer.hpp"

namespace featureminer {

    /**
     * @brief A trained pipeline: the fitted vectorizer, the frozen centroids and the labelled clusters.
     *
     * Everything the later stages need travels inside this value. After train() it is read-only, so aggregate()
     * and rank() can be called any number of times.
     */
    class Pipeline {
    public:
        struct Config {
            Vectorizer::Config vectorizer;
            KMeansSolver::Config clustering;
            Scorer::Config scoring;
            size_t topTermsCount = 10;
        };

        struct TrainingSummary {
            size_t issueCount = 0;
            size_t iterations = 0;
            double inertia = 0.0;
            bool converged = false;
            size_t bestInit = 0;
        };

        /**
         * @brief Fits the vocabulary on every description, clusters the rows and labels each cluster.
         * @throws EmptyCorpusError if there are no issues
         * @throws InvalidClusterCount if the corpus cannot hold the requested number of clusters
         */
        static Pipeline train(const std::vector<Issue>& issues, Config config);

        /**
         * @brief Assigns every issue to a cluster and sums counts and votes. See Aggregator::aggregate.
         */
        [[nodiscard]] AggregationResult aggregate(const std::vector<Issue>& issues) const;

        /**
         * @brief Combines the labelled clusters with one aggregation pass and orders them by priority.
         * @throws std::invalid_argument if the aggregation does not have one entry per cluster
         */
        [[nodiscard]] std::vector<Cluster> rank(const AggregationResult& aggregation) const;

        [[nodiscard]] inline const Vectorizer& getVectorizer() const { return m_Vectorizer; }
        [[nodiscard]] inline const KMeansModel& getModel() const { return m_Model; }
        [[nodiscard]] inline const std::vector<Cluster>& getClusters() const { return m_Clusters; }
        [[nodiscard]] inline const Config& getConfig() const { return m_Config; }
        [[nodiscard]] inline const TrainingSummary& getTrainingSummary() const { return m_Summary; }

    private:
        Pipeline(Config config, Vectorizer vectorizer, KMeansModel model, std::vector<Cluster> clusters,
                 TrainingSummary summary);

        Config m_Config;
        Vectorizer m_Vectorizer;
        KMeansModel m_Model;
        std::vector<Cluster> m_Clusters;
        TrainingSummary m_Summary;
    };

}

#endif //FEATUREMINER_PIPELINE_HPP
