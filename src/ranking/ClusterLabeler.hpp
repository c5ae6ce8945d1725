//
// Created by Matthew Krueger on 10/20/26.
//

#ifndef FEATUREMINER_CLUSTERLABELER_HPP
#define FEATUREMINER_CLUSTERLABELER_HPP

#include <string>
#include <vector>

#include "../shared/Point.hpp"
#include "../text/Vocabulary.hpp"

namespace featureminer {

    class ClusterLabeler {
    public:
        /**
         * @brief The terms with the largest weight in a centroid.
         *
         * Ordered by weight descending, equal weights by term ascending. Only positive weights count, so
         * fewer than topTermsCount terms come back when the centroid is sparse.
         *
         * @throws std::invalid_argument if the centroid and vocabulary sizes differ
         */
        static std::vector<std::string> label(const Point& centroid, const Vocabulary& vocabulary,
                                              size_t topTermsCount = 10);
    };

}

#endif //FEATUREMINER_CLUSTERLABELER_HPP
