#ifndef PATHTRACER_RANDOM_HPP
#define PATHTRACER_RANDOM_HPP

#include <cstdint>
#include <random>

// Uniform random source shared by sampling code. Every thread owns its own
// engine, so concurrent draws never race and never share state.
class Random {
private:
    static std::mt19937_64& engine() {
        thread_local std::mt19937_64 generator{std::random_device{}()};
        return generator;
    }
public:
    // Restart the calling thread's sequence. Used for reproducible renders.
    static void seedThread(uint64_t seed) {
        engine().seed(seed);
    }

    // [0, 1)
    static double uniform() {
        std::uniform_real_distribution<double> distribution{0.0, 1.0};
        return distribution(engine());
    }

    // [min, max)
    static double uniform(double min, double max) {
        return min + (max - min) * uniform();
    }
};

#endif //PATHTRACER_RANDOM_HPP
