#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include <chrono>
#include <string>
#include <string_view>

// Prints the elapsed wall time when it goes out of scope
class ScopedTimer {
public:
    ScopedTimer(std::string_view startMessage, std::string_view endMessage);
    ~ScopedTimer();

    double getSecondsElapsed() const;

private:
    std::chrono::steady_clock::time_point m_startTime;
    std::string m_endMessage;
};

#endif // SCOPED_TIMER_HPP
