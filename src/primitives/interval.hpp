#ifndef PATHTRACER_INTERVAL_HPP
#define PATHTRACER_INTERVAL_HPP

#include <limits>

// Real range [min, max]. min > max is the empty interval.
class Interval {
private:
    double min;
    double max;
public:
    Interval() : Interval(empty()) {}
    Interval(double min, double max) : min(min), max(max) {}

    double getMin() const { return min; }
    double getMax() const { return max; }

    double size() const { return max - min; }

    // min <= x <= max
    bool contains(double x) const { return min <= x && x <= max; }

    // min < x < max
    bool surrounds(double x) const { return min < x && x < max; }

    double clamp(double x) const {
        if (x < min) return min;
        if (x > max) return max;
        return x;
    }

    static Interval empty() {
        return {std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity()};
    }

    static Interval universe() {
        return {-std::numeric_limits<double>::infinity(), std::numeric_limits<double>::infinity()};
    }

    friend bool operator==(const Interval &a, const Interval &b) {
        return a.min == b.min && a.max == b.max;
    }
};

#endif //PATHTRACER_INTERVAL_HPP
