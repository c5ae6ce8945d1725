//
// Created by Matthew Krueger on 10/20/26.
//

#ifndef FEATUREMINER_CLUSTER_HPP
#define FEATUREMINER_CLUSTER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <boost/serialization/nvp.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

namespace featureminer {

    /**
     * @brief One labelled cluster with its aggregated totals and scores.
     *
     * Totals and scores are overwritten on every aggregation and scoring pass.
     */
    struct Cluster {
        size_t index = 0;
        std::vector<std::string> topTerms;
        size_t issueCount = 0;
        uint64_t voteSum = 0;
        double issueScore = 0.0;
        double voteScore = 0.0;
        double combinedScore = 0.0;

        template<class Archive>
        void serialize(Archive& archive, const unsigned int /*version*/) {
            archive & BOOST_SERIALIZATION_NVP(index);
            archive & BOOST_SERIALIZATION_NVP(topTerms);
            archive & BOOST_SERIALIZATION_NVP(issueCount);
            archive & BOOST_SERIALIZATION_NVP(voteSum);
            archive & BOOST_SERIALIZATION_NVP(issueScore);
            archive & BOOST_SERIALIZATION_NVP(voteScore);
            archive & BOOST_SERIALIZATION_NVP(combinedScore);
        }

        bool operator==(const Cluster& other) const = default;
    };

}

#endif //FEATUREMINER_CLUSTER_HPP
