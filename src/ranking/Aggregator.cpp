//
// Created by Matthew Krueger on 10/20/26.
//

#include "Aggregator.hpp"

#include <stdexcept>
#include <string>

#include "../shared/Instrumentation.hpp"
#include "../shared/Logging.hpp"

namespace featureminer {

    AggregationResult Aggregator::aggregate(const std::vector<Issue>& issues, const Vectorizer& vectorizer,
                                            const KMeansModel& model, size_t numThreads) {
        PROFILE_FUNCTION();

        if (vectorizer.getVocabulary().size() != model.numDimensions()) {
            throw std::invalid_argument(
                "Vocabulary has " + std::to_string(vectorizer.getVocabulary().size()) + " terms but the model has " +
                std::to_string(model.numDimensions()) + " dimensions");
        }

        std::vector<std::string> descriptions;
        descriptions.reserve(issues.size());
        for (const auto& issue : issues) {
            descriptions.push_back(issue.description);
        }

        const std::vector<SparseVector> rows = vectorizer.transform(descriptions);
        const std::vector<size_t> labels = model.predict(rows, numThreads);

        AggregationResult result;
        result.totals.assign(model.numClusters(), ClusterTotals{});
        result.assignments.reserve(issues.size());

        for (size_t issueIndex = 0; issueIndex < issues.size(); ++issueIndex) {
            const size_t cluster = labels[issueIndex];
            result.totals[cluster].issueCount += 1;
            result.totals[cluster].voteSum += issues[issueIndex].votes;
            result.assignments.push_back(IssueAssignment{issues[issueIndex].id, cluster});
        }

        DEBUG_PRINT("Aggregated " << issues.size() << " issues into " << model.numClusters() << " clusters");

        return result;
    }

    std::vector<Issue> Aggregator::applyAssignments(std::vector<Issue> issues, const AggregationResult& result) {
        if (issues.size() != result.assignments.size()) {
            throw std::invalid_argument(
                "Got " + std::to_string(result.assignments.size()) + " assignments for " +
                std::to_string(issues.size()) + " issues");
        }

        for (size_t issueIndex = 0; issueIndex < issues.size(); ++issueIndex) {
            const auto& assignment = result.assignments[issueIndex];
            if (issues[issueIndex].id != assignment.issueId) {
                throw std::invalid_argument(
                    "Assignment " + std::to_string(issueIndex) + " is for issue " + std::to_string(assignment.issueId) +
                    ", not issue " + std::to_string(issues[issueIndex].id));
            }
            issues[issueIndex].cluster = assignment.cluster;
        }

        return issues;
    }

}
