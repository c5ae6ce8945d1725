//
// Created by Matthew Krueger on 10/14/25.
//

#ifndef FEATUREMINER_KMEANSMODEL_HPP
#define FEATUREMINER_KMEANSMODEL_HPP

#include <vector>

#include "../shared/Point.hpp"
#include "../shared/SparseVector.hpp"

namespace featureminer {

    /**
     * @brief A trained, frozen centroid set. Nothing here mutates the centroids after construction.
     */
    class KMeansModel {
    public:
        KMeansModel() = default;

        /**
         * @throws std::invalid_argument if the centroids do not all share one dimensionality
         */
        explicit KMeansModel(std::vector<Point> centroids);

        /**
         * @brief Index of the nearest centroid. Equal distances go to the lowest index.
         * @throws std::logic_error if the model has no centroids
         * @throws std::invalid_argument if the row has columns outside the model's space
         */
        [[nodiscard]] size_t predict(const SparseVector& row) const;

        /**
         * @brief Predicts many rows on numThreads OpenMP threads.
         * @throws std::invalid_argument if numThreads is zero or does not fit in an int
         */
        [[nodiscard]] std::vector<size_t> predict(const std::vector<SparseVector>& rows, size_t numThreads = 1) const;

        [[nodiscard]] inline size_t numClusters() const { return m_Centroids.size(); }
        [[nodiscard]] inline size_t numDimensions() const { return m_Centroids.empty() ? 0 : m_Centroids.front().numDimensions(); }
        [[nodiscard]] inline const std::vector<Point>& getCentroids() const { return m_Centroids; }

        /**
         * @brief Nearest centroid without any checks. Shared with the training loop, where the rows were
         * validated once up front.
         */
        static size_t nearestCentroid(const SparseVector& row, const std::vector<Point>& centroids,
                                      const std::vector<double>& centroidSquaredNorms);

    private:
        void validate(const SparseVector& row) const;

        std::vector<Point> m_Centroids;
        std::vector<double> m_CentroidSquaredNorms;
    };

}

#endif //FEATUREMINER_KMEANSMODEL_HPP
