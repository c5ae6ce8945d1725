//
// Created by Matthew Krueger on 10/20/26.
//

#ifndef FEATUREMINER_SCORER_HPP
#define FEATUREMINER_SCORER_HPP

#include <vector>

#include "Cluster.hpp"

namespace featureminer {

    /**
     * @brief Min-max normalizes issue counts and vote sums and orders clusters by their combined score.
     *
     * A metric that is the same for every cluster scores zero everywhere.
     */
    class Scorer {
    public:
        struct Config {
            double issueMultiplier = 1.0;
            double voteMultiplier = 1.0;
        };

        Scorer();

        /**
         * @throws std::invalid_argument if a multiplier is outside [0, 1]
         */
        explicit Scorer(Config config);

        /**
         * @brief Fills in the scores and sorts by combined score descending, then by index ascending.
         */
        [[nodiscard]] std::vector<Cluster> rank(std::vector<Cluster> clusters) const;

        [[nodiscard]] inline const Config& getConfig() const { return m_Config; }

    private:
        Config m_Config;
    };

}

#endif //FEATUREMINER_SCORER_HPP
