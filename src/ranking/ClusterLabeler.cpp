//
// Created by Matthew Krueger on 10/20/26.
//

#include "ClusterLabeler.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace featureminer {

    std::vector<std::string> ClusterLabeler::label(const Point& centroid, const Vocabulary& vocabulary,
                                                   size_t topTermsCount) {
        if (centroid.numDimensions() != vocabulary.size()) {
            throw std::invalid_argument(
                "Centroid has " + std::to_string(centroid.numDimensions()) + " dimensions but the vocabulary has " +
                std::to_string(vocabulary.size()) + " terms");
        }

        std::vector<size_t> candidates;
        for (size_t column = 0; column < centroid.numDimensions(); ++column) {
            if (centroid[column] > 0.0) {
                candidates.push_back(column);
            }
        }

        // columns are already in term order, so the index breaks weight ties lexically
        auto heavierFirst = [&centroid](size_t left, size_t right) {
            if (centroid[left] != centroid[right]) {
                return centroid[left] > centroid[right];
            }
            return left < right;
        };

        const size_t keep = std::min(topTermsCount, candidates.size());
        std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(keep), candidates.end(),
                          heavierFirst);

        std::vector<std::string> terms;
        terms.reserve(keep);
        for (size_t rank = 0; rank < keep; ++rank) {
            terms.push_back(vocabulary.getTerm(candidates[rank]));
        }
        return terms;
    }

}
