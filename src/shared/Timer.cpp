//
// Created by Matthew Krueger on 10/17/25.
//

#include "Timer.hpp"

namespace timer {

    Timer::Timer(uint64_t& elapsedMicroseconds)
        : m_StartTimePoint(std::chrono::steady_clock::now()), m_ElapsedMicroseconds(elapsedMicroseconds) {}

    Timer::~Timer() {
        auto elapsed = std::chrono::steady_clock::now() - m_StartTimePoint;
        m_ElapsedMicroseconds = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    }

}
