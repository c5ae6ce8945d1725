//
// Created by Matthew Krueger on 10/14/25.
//

#include "KMeansModel.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>

#include <omp.h>

#include "../shared/Instrumentation.hpp"
#include "../shared/Threads.hpp"

namespace featureminer {

    KMeansModel::KMeansModel(std::vector<Point> centroids) : m_Centroids(std::move(centroids)) {
        if (!m_Centroids.empty()) {
            const size_t dimensions = m_Centroids.front().numDimensions();
            bool allSameDimensions = std::ranges::all_of(m_Centroids, [dimensions](const Point& centroid) {
                return centroid.numDimensions() == dimensions;
            });
            if (!allSameDimensions) {
                throw std::invalid_argument("All centroids must have the same number of dimensions");
            }
        }

        m_CentroidSquaredNorms.reserve(m_Centroids.size());
        std::ranges::transform(m_Centroids, std::back_inserter(m_CentroidSquaredNorms),
                               [](const Point& centroid) { return centroid.squaredNorm(); });
    }

    size_t KMeansModel::nearestCentroid(const SparseVector& row, const std::vector<Point>& centroids,
                                        const std::vector<double>& centroidSquaredNorms) {
        size_t nearest = 0;
        double minDistance = std::numeric_limits<double>::max();

        // strict less-than keeps the lowest index on ties
        for (size_t centroidIndex = 0; centroidIndex < centroids.size(); ++centroidIndex) {
            if (auto distance = centroids[centroidIndex].squaredDistanceTo(row, centroidSquaredNorms[centroidIndex]); distance < minDistance) {
                minDistance = distance;
                nearest = centroidIndex;
            }
        }

        return nearest;
    }

    void KMeansModel::validate(const SparseVector& row) const {
        if (m_Centroids.empty()) {
            throw std::logic_error("KMeansModel has no centroids; train it first");
        }
        if (row.requiredDimensions() > numDimensions()) {
            throw std::invalid_argument(
                "Row needs " + std::to_string(row.requiredDimensions()) + " dimensions, model has " +
                std::to_string(numDimensions()));
        }
    }

    size_t KMeansModel::predict(const SparseVector& row) const {
        validate(row);
        return nearestCentroid(row, m_Centroids, m_CentroidSquaredNorms);
    }

    std::vector<size_t> KMeansModel::predict(const std::vector<SparseVector>& rows, size_t numThreads) const {
        PROFILE_FUNCTION();

        const int threadCount = checkedThreadCount(numThreads, "Prediction");
        std::ranges::for_each(rows, [this](const SparseVector& row) { validate(row); });

        std::vector<size_t> labels(rows.size(), 0);

#pragma omp parallel for schedule(static) num_threads(threadCount)
        for (size_t rowIndex = 0; rowIndex < rows.size(); ++rowIndex) {
            labels[rowIndex] = nearestCentroid(rows[rowIndex], m_Centroids, m_CentroidSquaredNorms);
        }

        return labels;
    }

}
