#include "utility.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

namespace sigsys {

void unwrap_phase_deg(std::vector<double>& phases) {
    for (size_t i = 1; i < phases.size(); ++i) {
        double diff = phases[i] - phases[i - 1];
        while (diff > 180.0) {
            phases[i] -= 360.0;
            diff -= 360.0;
        }
        while (diff < -180.0) {
            phases[i] += 360.0;
            diff += 360.0;
        }
    }
}

bool validate_signal(const std::vector<double>& t, const std::vector<double>& x) {
    if (t.size() != x.size()) {
        return false;
    }
    if (!std::all_of(x.begin(), x.end(), [](double v) { return std::isfinite(v); })) {
        return false;
    }
    for (size_t i = 1; i < t.size(); ++i) {
        if (!(t[i] > t[i - 1])) {
            return false;
        }
    }
    return true;
}

std::vector<double> normalize_signal(const std::vector<double>& x) {
    double max_val = 0.0;
    for (double v : x) {
        max_val = std::max(max_val, std::abs(v));
    }
    if (max_val == 0.0) {
        return x;
    }

    std::vector<double> result;
    result.reserve(x.size());
    for (double v : x) {
        result.push_back(v / max_val);
    }
    return result;
}

static double meanPower(const std::vector<double>& x) {
    if (x.empty()) {
        return 0.0;
    }
    const double sum_sq = std::accumulate(x.begin(), x.end(), 0.0, [](double acc, double v) { return acc + v * v; });
    return sum_sq / static_cast<double>(x.size());
}

double calculate_snr(const std::vector<double>& signal, const std::vector<double>& noise) {
    const double signal_power = meanPower(signal);
    const double noise_power  = meanPower(noise);
    if (noise_power == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return 10.0 * std::log10(signal_power / noise_power);
}

}  // namespace sigsys
