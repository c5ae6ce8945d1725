//
// Created by Matthew Krueger on 10/13/25.
//

#ifndef FEATUREMINER_KMEANSSOLVER_HPP
#define FEATUREMINER_KMEANSSOLVER_HPP

#include <cstdint>
#include <vector>

#include "KMeansModel.hpp"
#include "../shared/Point.hpp"
#include "../shared/SparseVector.hpp"

namespace featureminer {

    /**
     * @brief Lloyd's k-means over sparse TF-IDF rows with k-means++ seeding and best-of-N restarts.
     *
     * Work inside one run is spread over OpenMP threads. Per-cluster sums always add rows in row order,
     * so for a given seed the result is the same for every thread count.
     */
    class KMeansSolver {
    public:
        struct Config {
            size_t numClusters = 50;
            size_t maxIterations = 100;
            size_t numInits = 1;
            uint64_t seed = 1234;
            /// Zero disables the check. Otherwise training also stops once no centroid moves farther than this.
            double convergenceThreshold = 0.0;
            size_t numThreads = 1;
        };

        struct TrainingResult {
            KMeansModel model;
            /// Assignment of every training row against the final centroids.
            std::vector<size_t> labels;
            /// Sum of squared distances from each row to its centroid.
            double inertia = 0.0;
            size_t iterations = 0;
            bool converged = false;
            /// Which restart produced this result.
            size_t bestInit = 0;
        };

        KMeansSolver();
        explicit KMeansSolver(Config config);

        /**
         * @brief Trains on the rows of a document-term matrix.
         * @param matrix One sparse row per document.
         * @param numDimensions Vocabulary size. Every row must fit in it.
         * @throws EmptyCorpusError if the matrix has no rows
         * @throws InvalidClusterCount if K < 1 or K exceeds the number of distinct non-zero rows
         */
        [[nodiscard]] TrainingResult train(const std::vector<SparseVector>& matrix, size_t numDimensions) const;

        /**
         * @brief The number of distinct rows that are not all-zero.
         */
        static size_t countDistinctNonZeroRows(const std::vector<SparseVector>& matrix);

        /**
         * @brief k-means++ seeding: the first centroid is a uniformly random row, each following one is drawn
         * with probability proportional to the squared distance to its nearest chosen centroid.
         */
        [[nodiscard]] std::vector<Point> seedCentroids(const std::vector<SparseVector>& matrix, size_t numDimensions,
                                                       uint64_t runSeed) const;

        [[nodiscard]] inline const Config& getConfig() const { return m_Config; }

    private:
        [[nodiscard]] TrainingResult runOnce(const std::vector<SparseVector>& matrix, size_t numDimensions,
                                             uint64_t runSeed) const;

        [[nodiscard]] std::vector<size_t> assign(const std::vector<SparseVector>& matrix,
                                                 const std::vector<Point>& centroids) const;

        [[nodiscard]] std::vector<Point> update(const std::vector<SparseVector>& matrix, const std::vector<size_t>& labels,
                                                const std::vector<Point>& previousCentroids, size_t numDimensions) const;

        [[nodiscard]] double computeInertia(const std::vector<SparseVector>& matrix, const std::vector<size_t>& labels,
                                            const std::vector<Point>& centroids) const;

        Config m_Config;
    };

}

#endif //FEATUREMINER_KMEANSSOLVER_HPP
