#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace sigsys {

// Library defaults
inline constexpr double      kDefaultSamplingRate   = 1000.0;  // Hz
inline constexpr double      kDefaultDuration       = 2.0;     // s
inline constexpr double      kDefaultResponseWindow = 2.0;     // s, impulse/step response length
inline constexpr std::size_t kDefaultFrequencyPoints = 1024;
inline constexpr double      kCoefficientTolerance  = 1e-12;   // |c| <= tol counts as zero

/**
 * @brief Sampling rate and duration owned by a SignalGenerator.
 *
 * Mutated only through update(); a rejected update leaves the values untouched.
 */
struct SamplingConfig {
    double fs       = kDefaultSamplingRate;
    double duration = kDefaultDuration;

    /**
     * @brief  Replace fs and/or duration.
     *
     * @throws InvalidArgument  if fs <= 0 or duration < 0 (or either is not finite)
     */
    void update(std::optional<double> new_fs, std::optional<double> new_duration);

    // floor(fs * duration)
    std::size_t num_samples() const;

    // t[i] = i / fs for i in [0, num_samples())
    std::vector<double> time_vector() const;
};

void validate_sampling_rate(double fs);

}  // namespace sigsys
