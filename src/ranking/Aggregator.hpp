//
// Created by Matthew Krueger on 10/20/26.
//

#ifndef FEATUREMINER_AGGREGATOR_HPP
#define FEATUREMINER_AGGREGATOR_HPP

#include <cstdint>
#include <vector>

#include "../clustering/KMeansModel.hpp"
#include "../shared/Issue.hpp"
#include "../text/Vectorizer.hpp"

namespace featureminer {

    struct ClusterTotals {
        size_t issueCount = 0;
        uint64_t voteSum = 0;

        bool operator==(const ClusterTotals& other) const = default;
    };

    struct IssueAssignment {
        int64_t issueId = 0;
        size_t cluster = 0;

        bool operator==(const IssueAssignment& other) const = default;
    };

    struct AggregationResult {
        /// One entry per cluster, indexed by cluster.
        std::vector<ClusterTotals> totals;
        /// One entry per issue, in the order the issues were given.
        std::vector<IssueAssignment> assignments;
    };

    /**
     * @brief Predicts a cluster for every issue and sums issue counts and votes per cluster.
     */
    class Aggregator {
    public:
        /**
         * @brief Runs one aggregation pass. Totals always start from zero, so repeating the call gives the same result.
         *
         * The issues are only read. The predictions come back as a separate list that can be applied afterwards
         * with applyAssignments().
         *
         * @throws std::invalid_argument if the vectorizer and model disagree on the vocabulary size
         */
        static AggregationResult aggregate(const std::vector<Issue>& issues, const Vectorizer& vectorizer,
                                           const KMeansModel& model, size_t numThreads = 1);

        /**
         * @brief Returns a copy of the issues with their cluster field filled in.
         * @throws std::invalid_argument if the assignments were made for a different issue list
         */
        static std::vector<Issue> applyAssignments(std::vector<Issue> issues, const AggregationResult& result);
    };

}

#endif //FEATUREMINER_AGGREGATOR_HPP
