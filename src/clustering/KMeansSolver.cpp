//
// Created by Matthew Krueger on 10/13/25.
//

#include "KMeansSolver.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

#include <boost/random/discrete_distribution.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>

#include <omp.h>

#include "../shared/Errors.hpp"
#include "../shared/Instrumentation.hpp"
#include "../shared/Logging.hpp"
#include "../shared/Threads.hpp"

namespace featureminer {

    KMeansSolver::KMeansSolver() : KMeansSolver(Config{}) {}

    KMeansSolver::KMeansSolver(Config config) : m_Config(config) {
        if (m_Config.maxIterations < 1) {
            throw std::invalid_argument("Maximum iterations must be at least 1");
        }
        if (m_Config.numInits < 1) {
            throw std::invalid_argument("Number of initializations must be at least 1");
        }
        checkedThreadCount(m_Config.numThreads, "k-means");
        if (m_Config.convergenceThreshold < 0.0) {
            throw std::invalid_argument("Convergence threshold must not be negative");
        }
    }

    size_t KMeansSolver::countDistinctNonZeroRows(const std::vector<SparseVector>& matrix) {
        std::vector<const SparseVector*> nonZeroRows;
        nonZeroRows.reserve(matrix.size());
        for (const auto& row : matrix) {
            if (!row.empty()) {
                nonZeroRows.push_back(&row);
            }
        }

        std::ranges::sort(nonZeroRows, [](const SparseVector* left, const SparseVector* right) {
            return SparseVector::lexicographicalLess(*left, *right);
        });
        auto duplicates = std::ranges::unique(nonZeroRows, [](const SparseVector* left, const SparseVector* right) {
            return *left == *right;
        });

        return nonZeroRows.size() - duplicates.size();
    }

    KMeansSolver::TrainingResult KMeansSolver::train(const std::vector<SparseVector>& matrix, size_t numDimensions) const {
        PROFILE_FUNCTION();

        if (matrix.empty()) {
            throw EmptyCorpusError("Cannot cluster an empty document-term matrix");
        }

        // rows are checked once here so nothing inside a parallel region can throw
        bool allRowsFit = std::ranges::all_of(matrix, [numDimensions](const SparseVector& row) {
            return row.requiredDimensions() <= numDimensions;
        });
        if (!allRowsFit) {
            throw std::invalid_argument("Matrix rows exceed the given number of dimensions");
        }

        if (m_Config.numClusters < 1) {
            throw InvalidClusterCount("Number of clusters must be at least 1, got " + std::to_string(m_Config.numClusters));
        }

        const size_t distinctRows = countDistinctNonZeroRows(matrix);
        if (m_Config.numClusters > distinctRows) {
            throw InvalidClusterCount(
                "Cannot form " + std::to_string(m_Config.numClusters) + " clusters from " +
                std::to_string(distinctRows) + " distinct non-empty documents");
        }

        DEBUG_PRINT("Training " << m_Config.numClusters << " clusters over " << matrix.size() << " rows, "
                    << numDimensions << " dimensions, " << m_Config.numInits << " initializations");

        // every restart gets its own seed, drawn up front from the configured one
        boost::random::mt19937_64 seedSequence(m_Config.seed);
        std::vector<uint64_t> runSeeds(m_Config.numInits);
        std::ranges::generate(runSeeds, [&seedSequence]() { return seedSequence(); });

        TrainingResult best;
        for (size_t init = 0; init < m_Config.numInits; ++init) {
            PROFILE_SCOPE("Initialization");

            TrainingResult result = runOnce(matrix, numDimensions, runSeeds[init]);
            DEBUG_PRINT("Initialization " << init << ": inertia " << result.inertia << " after "
                        << result.iterations << " iterations");

            // strict less-than keeps the earliest run on ties
            if (init == 0 || result.inertia < best.inertia) {
                best = std::move(result);
                best.bestInit = init;
            }
        }

        if (!best.converged) {
            LOG_WARNING("k-means stopped at the iteration cap of " << m_Config.maxIterations << " without converging");
        }

        return best;
    }

    std::vector<Point> KMeansSolver::seedCentroids(const std::vector<SparseVector>& matrix, size_t numDimensions,
                                                   uint64_t runSeed) const {
        PROFILE_FUNCTION();

        const size_t numRows = matrix.size();
        boost::random::mt19937_64 rng(runSeed);

        std::vector<Point> centroids;
        centroids.reserve(m_Config.numClusters);

        boost::random::uniform_int_distribution<size_t> firstPick(0, numRows - 1);
        centroids.push_back(Point::fromSparse(matrix[firstPick(rng)], numDimensions));

        std::vector<double> minDistances(numRows, std::numeric_limits<double>::max());
        auto refreshDistances = [&](const Point& newest) {
            const double newestNorm = newest.squaredNorm();
#pragma omp parallel for schedule(static) num_threads(static_cast<int>(m_Config.numThreads))
            for (size_t rowIndex = 0; rowIndex < numRows; ++rowIndex) {
                minDistances[rowIndex] = std::min(minDistances[rowIndex], newest.squaredDistanceTo(matrix[rowIndex], newestNorm));
            }
        };
        refreshDistances(centroids.back());

        while (centroids.size() < m_Config.numClusters) {
            const double total = std::accumulate(minDistances.begin(), minDistances.end(), 0.0);
            if (!(total > 0.0)) {
                throw InvalidClusterCount("Ran out of distinct documents after " + std::to_string(centroids.size()) + " centroids");
            }

            boost::random::discrete_distribution<size_t, double> weightedPick(minDistances.begin(), minDistances.end());
            centroids.push_back(Point::fromSparse(matrix[weightedPick(rng)], numDimensions));
            refreshDistances(centroids.back());
        }

        return centroids;
    }

    KMeansSolver::TrainingResult KMeansSolver::runOnce(const std::vector<SparseVector>& matrix, size_t numDimensions,
                                                       uint64_t runSeed) const {
        PROFILE_FUNCTION();

        std::vector<Point> currentCentroids = seedCentroids(matrix, numDimensions, runSeed);
        std::vector<size_t> labels;

        // so the algorithm is roughly this
        // class every row to its closest centroid, stop if nothing moved between clusters,
        // otherwise every centroid becomes the mean of its rows
        size_t iteration = 0;
        bool converged = false;
        bool labelsMatchCentroids = false;
        while (iteration < m_Config.maxIterations) {
            PROFILE_SCOPE("Iteration");

            std::vector<size_t> newLabels = assign(matrix, currentCentroids);
            const bool changed = iteration == 0 || newLabels != labels;
            labels = std::move(newLabels);
            ++iteration;

            if (!changed) {
                converged = true;
                labelsMatchCentroids = true;
                break;
            }

            std::vector<Point> previousCentroids = std::move(currentCentroids);
            currentCentroids = update(matrix, labels, previousCentroids, numDimensions);
            labelsMatchCentroids = false;

            if (m_Config.convergenceThreshold > 0.0) {
                double maxShift = 0.0;
                for (size_t centroidIndex = 0; centroidIndex < currentCentroids.size(); ++centroidIndex) {
                    maxShift = std::max(maxShift, currentCentroids[centroidIndex].calculateEuclideanDistance(previousCentroids[centroidIndex]));
                }
                if (maxShift <= m_Config.convergenceThreshold) {
                    converged = true;
                    break;
                }
            }
        }

        if (!labelsMatchCentroids) {
            labels = assign(matrix, currentCentroids);
        }

        TrainingResult result;
        result.inertia = computeInertia(matrix, labels, currentCentroids);
        result.labels = std::move(labels);
        result.model = KMeansModel(std::move(currentCentroids));
        result.iterations = iteration;
        result.converged = converged;
        return result;
    }

    std::vector<size_t> KMeansSolver::assign(const std::vector<SparseVector>& matrix,
                                             const std::vector<Point>& centroids) const {
        std::vector<double> centroidNorms;
        centroidNorms.reserve(centroids.size());
        std::ranges::transform(centroids, std::back_inserter(centroidNorms),
                               [](const Point& centroid) { return centroid.squaredNorm(); });

        std::vector<size_t> labels(matrix.size(), 0);

#pragma omp parallel for schedule(static) num_threads(static_cast<int>(m_Config.numThreads))
        for (size_t rowIndex = 0; rowIndex < matrix.size(); ++rowIndex) {
            labels[rowIndex] = KMeansModel::nearestCentroid(matrix[rowIndex], centroids, centroidNorms);
        }

        return labels;
    }

    std::vector<Point> KMeansSolver::update(const std::vector<SparseVector>& matrix, const std::vector<size_t>& labels,
                                            const std::vector<Point>& previousCentroids, size_t numDimensions) const {
        // members are listed in row order, which fixes the summation order for every thread count
        std::vector<std::vector<size_t>> members(previousCentroids.size());
        for (size_t rowIndex = 0; rowIndex < labels.size(); ++rowIndex) {
            members[labels[rowIndex]].push_back(rowIndex);
        }

        std::vector<Point> updated(previousCentroids.size());

#pragma omp parallel for schedule(dynamic) num_threads(static_cast<int>(m_Config.numThreads))
        for (size_t centroidIndex = 0; centroidIndex < previousCentroids.size(); ++centroidIndex) {
            if (members[centroidIndex].empty()) {
                // stay where we were
                updated[centroidIndex] = previousCentroids[centroidIndex];
                continue;
            }

            Point sum = Point::zeros(numDimensions);
            for (const size_t rowIndex : members[centroidIndex]) {
                sum += matrix[rowIndex];
            }
            sum /= static_cast<double>(members[centroidIndex].size());
            updated[centroidIndex] = std::move(sum);
        }

        return updated;
    }

    double KMeansSolver::computeInertia(const std::vector<SparseVector>& matrix, const std::vector<size_t>& labels,
                                        const std::vector<Point>& centroids) const {
        std::vector<double> centroidNorms;
        centroidNorms.reserve(centroids.size());
        std::ranges::transform(centroids, std::back_inserter(centroidNorms),
                               [](const Point& centroid) { return centroid.squaredNorm(); });

        std::vector<double> distances(matrix.size(), 0.0);

#pragma omp parallel for schedule(static) num_threads(static_cast<int>(m_Config.numThreads))
        for (size_t rowIndex = 0; rowIndex < matrix.size(); ++rowIndex) {
            const size_t label = labels[rowIndex];
            distances[rowIndex] = centroids[label].squaredDistanceTo(matrix[rowIndex], centroidNorms[label]);
        }

        // summed sequentially so the total does not depend on the thread count
        return std::accumulate(distances.begin(), distances.end(), 0.0);
    }

}
