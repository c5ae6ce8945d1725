//
// Created by Matthew Krueger on 10/17/25.
//

#ifndef FEATUREMINER_TIMER_HPP
#define FEATUREMINER_TIMER_HPP

#include <chrono>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace timer {

    /**
     * Represents the result of a function execution along with the time taken, measured in microseconds.
     *
     * @tparam T Type of the function result.
     */
    template<typename T>
    struct TimeResult {
        T functionResult;
        uint64_t timeMicroseconds;

        inline uint64_t getTimeMilliseconds() const { return timeMicroseconds / 1000UL; }
        inline double getTimeSecondsDouble() const { return timeMicroseconds / static_cast<double>(1e6); }
    };

    template<>
    struct TimeResult<void> {
        uint64_t timeMicroseconds;

        inline uint64_t getTimeMilliseconds() const { return timeMicroseconds / 1000UL; }
        inline double getTimeSecondsDouble() const { return timeMicroseconds / static_cast<double>(1e6); }
    };

    /**
     * Writes the microseconds elapsed between construction and destruction into the referenced counter.
     */
    class Timer {
    public:
        explicit Timer(uint64_t& elapsedMicroseconds);
        ~Timer();

        Timer(const Timer&) = delete;
        Timer& operator=(const Timer&) = delete;

    private:
        std::chrono::steady_clock::time_point m_StartTimePoint;
        uint64_t& m_ElapsedMicroseconds;
    };

    /**
     * Measures the execution time of a callable returning a value.
     * The result type must be move constructible; it is returned together with the elapsed time.
     */
    template <typename FuncToTime>
    std::enable_if_t<!std::is_void_v<std::invoke_result_t<FuncToTime>>, TimeResult<std::invoke_result_t<FuncToTime>>>
    time(FuncToTime&& toTime) {
        using ResultType = std::invoke_result_t<FuncToTime>;
        uint64_t elapsed = 0;
        auto result = [&]() -> ResultType {
            Timer timer(elapsed);
            return toTime();
        }();
        return TimeResult<ResultType>{std::move(result), elapsed};
    }

    /**
     * Overload for callables returning void.
     */
    template <typename FuncToTime>
    std::enable_if_t<std::is_void_v<std::invoke_result_t<FuncToTime>>, TimeResult<void>>
    time(FuncToTime&& toTime) {
        uint64_t elapsed = 0;
        {
            Timer timer(elapsed);
            toTime();
        }
        return TimeResult<void>{elapsed};
    }

}

#endif //FEATUREMINER_TIMER_HPP
