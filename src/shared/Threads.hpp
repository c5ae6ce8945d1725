//
// Created by Matthew Krueger on 10/27/26.
//

#ifndef FEATUREMINER_THREADS_HPP
#define FEATUREMINER_THREADS_HPP

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace featureminer {

    /**
     * @brief Checks a configured thread count and converts it for an OpenMP num_threads clause.
     *
     * A negative command line value wraps to a huge size_t, and OpenMP takes an int, so both ends are checked.
     *
     * @param numThreads The configured count
     * @param owner Named in the error message
     * @throws std::invalid_argument if numThreads is zero or does not fit in an int
     */
    inline int checkedThreadCount(size_t numThreads, const std::string& owner) {
        if (numThreads < 1 || numThreads > static_cast<size_t>(std::numeric_limits<int>::max())) {
            throw std::invalid_argument(
                owner + " needs between 1 and " + std::to_string(std::numeric_limits<int>::max()) +
                " threads, got " + std::to_string(numThreads));
        }
        return static_cast<int>(numThreads);
    }

}

#endif //FEATUREMINER_THREADS_HPP
