#ifndef PATHTRACER_TIMER_HPP
#define PATHTRACER_TIMER_HPP

#include <chrono>

// Wall clock stopwatch for reporting render and scene setup times.
class Timer {
private:
    std::chrono::steady_clock::time_point start_time;
public:
    Timer() : start_time(std::chrono::steady_clock::now()) {}
    void reset() {
        start_time = std::chrono::steady_clock::now();
    }
    // seconds since construction or the last reset
    double elapsed() const {
        const std::chrono::duration<double> diff = std::chrono::steady_clock::now() - start_time;
        return diff.count();
    }
};

#endif //PATHTRACER_TIMER_HPP
