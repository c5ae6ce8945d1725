//
// Created by Matthew Krueger on 10/10/25.
//

#include "Point.hpp"

#include <algorithm>
#include <functional>
#include <numeric>
#include <cmath>
#include <stdexcept>
#include <string>


namespace featureminer {

    Point Point::fromSparse(const SparseVector& row, size_t numDimensions) {
        if (row.requiredDimensions() > numDimensions) {
            throw std::invalid_argument(
                "Row needs " + std::to_string(row.requiredDimensions()) + " dimensions, point has " +
                std::to_string(numDimensions) + ".");
        }

        Point result(std::vector<double>(numDimensions, 0.0));
        for (const auto& entry : row) {
            result.m_Data[entry.index] = entry.value;
        }
        return result;
    }

    double Point::calculateEuclideanDistance(const Point &other) const {
        // Guard against dimension mismatch.
        if (m_Data.size() != other.m_Data.size()) {
            throw std::invalid_argument(
                "Dimensions mismatch. This has " + std::to_string(m_Data.size()) + " dimensions, that has " +
                std::to_string(other.m_Data.size()) + " dimensions.");
        }

        auto squaredifference = [](double first, double second) -> double {
            double fms = first - second;
            return fms * fms;
        };

        double totalSum = std::transform_reduce(
            m_Data.begin(),
            m_Data.end(),
            other.m_Data.begin(),
            0.0,
            std::plus<>(),
            squaredifference
        );

        return std::sqrt(totalSum);
    }

    double Point::squaredNorm() const {
        return std::transform_reduce(m_Data.begin(), m_Data.end(), 0.0, std::plus<>(),
                                     [](double value) { return value * value; });
    }

    double Point::squaredDistanceTo(const SparseVector &row, double pointSquaredNorm) const {
        // |x - c|^2 = |c|^2 + sum over non-zero x_i of ((x_i - c_i)^2 - c_i^2)
        double distance = pointSquaredNorm;
        double rowSquaredNorm = 0.0;
        for (const auto& entry : row) {
            const double centroidValue = m_Data[entry.index];
            const double difference = entry.value - centroidValue;
            distance += difference * difference - centroidValue * centroidValue;
            rowSquaredNorm += entry.value * entry.value;
        }

        // anything below the rounding noise of the expansion is the same point
        if (distance <= s_RoundingTolerance * (pointSquaredNorm + rowSquaredNorm)) {
            return 0.0;
        }
        return distance;
    }

    Point& Point::operator+=(const SparseVector &row) {
        if (row.requiredDimensions() > m_Data.size()) {
            throw std::invalid_argument("Sparse row does not fit in this point's dimensions.");
        }

        for (const auto& entry : row) {
            m_Data[entry.index] += entry.value;
        }

        return *this;
    }

    Point& Point::operator/=(const double scalar) {
        // no need to check for compatability in a scalar division
        std::ranges::transform(
            m_Data,
            m_Data.begin(),
            [scalar](const double dimension){ return dimension/scalar ; }
        );

        return *this;
    }

} // featureminer
