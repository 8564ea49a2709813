#include "util/scoped_timer.hpp"

#include "util/string_utils.hpp"

#include <chrono>
#include <iostream>
#include <string_view>

ScopedTimer::ScopedTimer(std::string_view startMessage, std::string_view endMessage) : m_endMessage{ endMessage } {
    if (!startMessage.empty()) {
        std::cout << startMessage << "\n" << std::flush;
    }

    m_startTime = std::chrono::steady_clock::now();
}

ScopedTimer::~ScopedTimer() {
    std::cout << m_endMessage << " in " << formatFixedPoint(getSecondsElapsed(), 3) << "s.\n";
}

double ScopedTimer::getSecondsElapsed() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - m_startTime).count();
}
