//
// Created by Matthew Krueger on 10/21/26.
//

#ifndef FEATUREMINER_REPORT_HPP
#define FEATUREMINER_REPORT_HPP

#include <cstdint>
#include <vector>

#include <boost/serialization/nvp.hpp>
#include <boost/serialization/vector.hpp>

#include "../ranking/Cluster.hpp"

namespace featureminer {

    /**
     * @brief The ranked clusters of one run together with a short summary of how they were trained.
     */
    struct Report {
        size_t issueCount = 0;
        size_t clusterCount = 0;
        uint64_t seed = 0;
        size_t iterations = 0;
        double inertia = 0.0;
        bool converged = false;
        /// Ordered by priority, highest first.
        std::vector<Cluster> clusters;

        template<class Archive>
        void serialize(Archive& archive, const unsigned int /*version*/) {
            archive & BOOST_SERIALIZATION_NVP(issueCount);
            archive & BOOST_SERIALIZATION_NVP(clusterCount);
            archive & BOOST_SERIALIZATION_NVP(seed);
            archive & BOOST_SERIALIZATION_NVP(iterations);
            archive & BOOST_SERIALIZATION_NVP(inertia);
            archive & BOOST_SERIALIZATION_NVP(converged);
            archive & BOOST_SERIALIZATION_NVP(clusters);
        }

        bool operator==(const Report& other) const = default;
    };

}

#endif //FEATUREMINER_REPORT_HPP
