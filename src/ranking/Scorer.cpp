//
// Created by Matthew Krueger on 10/20/26.
//

#include "Scorer.hpp"

#include <algorithm>
#include <stdexcept>

#include "../shared/Instrumentation.hpp"

namespace featureminer {

    namespace {

        double normalize(double value, double minimum, double maximum, double multiplier) {
            if (maximum == minimum) {
                return 0.0;
            }
            return multiplier * (value - minimum) / (maximum - minimum);
        }

    }

    Scorer::Scorer() : Scorer(Config{}) {}

    Scorer::Scorer(Config config) : m_Config(config) {
        if (!(m_Config.issueMultiplier >= 0.0 && m_Config.issueMultiplier <= 1.0)) {
            throw std::invalid_argument("Issue multiplier must be in [0, 1]");
        }
        if (!(m_Config.voteMultiplier >= 0.0 && m_Config.voteMultiplier <= 1.0)) {
            throw std::invalid_argument("Vote multiplier must be in [0, 1]");
        }
    }

    std::vector<Cluster> Scorer::rank(std::vector<Cluster> clusters) const {
        PROFILE_FUNCTION();

        if (clusters.empty()) {
            return clusters;
        }

        const auto [minIssues, maxIssues] = std::ranges::minmax(clusters, {}, &Cluster::issueCount);
        const auto [minVotes, maxVotes] = std::ranges::minmax(clusters, {}, &Cluster::voteSum);

        for (auto& cluster : clusters) {
            cluster.issueScore = normalize(static_cast<double>(cluster.issueCount),
                                           static_cast<double>(minIssues.issueCount),
                                           static_cast<double>(maxIssues.issueCount),
                                           m_Config.issueMultiplier);
            cluster.voteScore = normalize(static_cast<double>(cluster.voteSum),
                                          static_cast<double>(minVotes.voteSum),
                                          static_cast<double>(maxVotes.voteSum),
                                          m_Config.voteMultiplier);
            cluster.combinedScore = (cluster.issueScore + cluster.voteScore) / 2.0;
        }

        std::ranges::sort(clusters, [](const Cluster& left, const Cluster& right) {
            if (left.combinedScore != right.combinedScore) {
                return left.combinedScore > right.combinedScore;
            }
            return left.index < right.index;
        });

        return clusters;
    }

}
