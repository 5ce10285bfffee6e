#pragma once

#include <cmath>
#include <cstddef>
#include <numbers>
#include <utility>
#include <vector>

namespace sigsys {
constexpr std::vector<double> linspace(double start, double end, size_t num) {
    std::vector<double> result;
    result.reserve(num);
    if (num == 1) {
        result.push_back(start);
    } else {
        double step = (end - start) / static_cast<double>(num - 1);
        for (size_t i = 0; i < num; ++i) {
            result.push_back(start + i * step);
        }
    }
    return result;
}

constexpr std::vector<double> linspace(const std::pair<double, double>& span, size_t num) {
    return linspace(span.first, span.second, num);
}

// Sample instants i / fs for i in [0, num)
constexpr std::vector<double> sample_times(double fs, size_t num) {
    std::vector<double> result;
    result.reserve(num);
    for (size_t i = 0; i < num; ++i) {
        result.push_back(static_cast<double>(i) / fs);
    }
    return result;
}

constexpr double mag2db(double mag) {
    return 20.0 * std::log10(mag);
}
constexpr double db2mag(double db) {
    return std::pow(10.0, db / 20.0);
}

constexpr double rad2deg(double rad) {
    return rad * (180.0 / std::numbers::pi);
}

constexpr double deg2rad(double deg) {
    return deg * (std::numbers::pi / 180.0);
}

constexpr double wrap(double x, double min, double max) {
    return x - (max - min) * std::floor((x - min) / (max - min));
}

// Unwrap phase in degrees in place (remove 360 degree jumps)
void unwrap_phase_deg(std::vector<double>& phases);

/**
 * @brief  Check that a sampled signal is well formed.
 *
 * @return true if t and x have equal length, every sample is finite and t is strictly increasing
 */
bool validate_signal(const std::vector<double>& t, const std::vector<double>& x);

/**
 * @brief  Scale a signal into [-1, 1] by its largest absolute value.
 *
 * An all-zero (or empty) signal is returned unchanged.
 */
std::vector<double> normalize_signal(const std::vector<double>& x);

/**
 * @brief  Signal-to-noise ratio in dB from mean powers.
 *
 * @return +inf when the noise power is zero
 */
double calculate_snr(const std::vector<double>& signal, const std::vector<double>& noise);

}  // namespace sigsys
