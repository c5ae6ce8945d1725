//
// Created by Matthew Krueger on 10/10/25.
// This file defines the Point class, a dense vector in vocabulary space. Centroids are Points.

#ifndef FEATUREMINER_POINT_HPP
#define FEATUREMINER_POINT_HPP

#include <utility>
#include <vector>
#include <cstddef>

#include "SparseVector.hpp"

namespace featureminer {
    class Point {
    public:

        Point() = default;

        /**
         *
         * @param data Data to store
         */
        explicit Point(std::vector<double> data) noexcept: m_Data(std::move(data)) {}

        /**
         * @brief Creates the origin of a space with the given dimensionality.
         */
        static Point zeros(size_t numDimensions) { return Point(std::vector<double>(numDimensions, 0.0)); }

        /**
         * @brief Expands a sparse row into a dense point.
         * @throws std::invalid_argument if the row does not fit in numDimensions
         */
        static Point fromSparse(const SparseVector& row, size_t numDimensions);

        Point(const Point& other) = default;
        Point(Point&& other) noexcept : m_Data{std::move(other.m_Data)} {}

        /**
         * @brief Copy-and-swap assignment operator.
         */
        Point& operator=(Point other) {
            std::swap(m_Data, other.m_Data);
            return *this;
        }

        ~Point() = default;

        [[nodiscard]] const std::vector<double>& getData() const { return m_Data; };

        [[nodiscard]] inline size_t numDimensions() const { return m_Data.size(); }

        [[nodiscard]] inline double operator[](const size_t index) const { return m_Data[index]; }

        /**
         * @brief Calculates the Euclidean distance between this point and another point.
         * @param other The other point to calculate the distance to.
         * @return Euclidean distance as a double
         */
        double calculateEuclideanDistance(const Point& other) const;

        [[nodiscard]] double squaredNorm() const;

        /**
         * @brief Squared Euclidean distance to a sparse row.
         *
         * Uses the precomputed squared norm of this point so the cost is proportional to the number of
         * non-zero entries in the row, not to the vocabulary size.
         *
         * @param row The sparse row. Every index must be below numDimensions().
         * @param pointSquaredNorm The value of squaredNorm() for this point.
         * @return The squared distance. Values within rounding noise of zero are returned as exactly zero.
         */
        [[nodiscard]] double squaredDistanceTo(const SparseVector& row, double pointSquaredNorm) const;

        Point& operator+=(const SparseVector& row);
        Point& operator/=(double scalar);

        bool operator==(const Point& other) const { return m_Data == other.m_Data; }

        using const_iterator = std::vector<double>::const_iterator;

        [[nodiscard]] inline const_iterator begin() const { return m_Data.begin(); }
        [[nodiscard]] inline const_iterator end() const { return m_Data.end(); }

    private:
        static constexpr double s_RoundingTolerance = 1e-12;

        std::vector<double> m_Data;
    };

} // featureminer

#endif //FEATUREMINER_POINT_HPP
