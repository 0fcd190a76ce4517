// utils/noise.hpp
#pragma once

#include <cmath>
#include <cstdint>
#include <random>

namespace utils {

/**
 * NoiseGenerator - Seeded random source for synthetic input traces
 *
 * seed == 0 draws a non-deterministic seed from std::random_device.
 */
class NoiseGenerator {
public:
    explicit NoiseGenerator(uint64_t seed = 0)
        : gen_(seed == 0 ? std::random_device{}() : seed),
          dist_(0.0, 1.0)
    {}

    /**
     * Gaussian white noise: N(0, stddev)
     */
    double gaussian(double stddev) {
        if (stddev <= 0.0) return 0.0;
        return dist_(gen_) * stddev;
    }

    /**
     * Random walk increment (integrated white noise)
     */
    double random_walk(double sigma, double dt) {
        return gaussian(sigma * std::sqrt(dt));
    }

    /**
     * Exponential decay with time constant tau
     */
    double decay(double current_value, double tau, double dt) {
        if (tau <= 0.0) return current_value;
        return current_value * std::exp(-dt / tau);
    }

private:
    std::mt19937_64 gen_;
    std::normal_distribution<double> dist_;
};

/**
 * GaussMarkov - First-order Gauss-Markov process
 *
 *   dx/dt = -x/tau + white_noise(sigma)
 *
 * Stationary standard deviation is approximately sigma * sqrt(tau / 2).
 * Used for the slowly wandering grid-frequency deviation.
 */
class GaussMarkov {
public:
    GaussMarkov(double tau_s = 60.0, double sigma = 0.004, uint64_t seed = 0)
        : tau_(tau_s),
          sigma_(sigma),
          value_(0.0),
          noise_(seed)
    {}

    double step(double dt) {
        value_ = noise_.decay(value_, tau_, dt);
        value_ += noise_.random_walk(sigma_, dt);
        return value_;
    }

    // Overwrite the state, e.g. after clipping the output
    void set(double value) { value_ = value; }

private:
    double tau_;
    double sigma_;
    double value_;
    NoiseGenerator noise_;
};

/**
 * Quantizer - Measurement resolution (e.g. 1 mHz frequency meters)
 */
class Quantizer {
public:
    explicit Quantizer(double resolution = 0.0)
        : resolution_(resolution)
    {}

    double quantize(double value) const {
        if (resolution_ <= 0.0) return value;
        return std::round(value / resolution_) * resolution_;
    }

private:
    double resolution_;
};

} // namespace utils
