#include "config.hpp"

#include <cmath>

#include <fmt/core.h>

#include "errors.hpp"
#include "utility.hpp"

namespace sigsys {

void validate_sampling_rate(double fs) {
    if (!std::isfinite(fs) || fs <= 0.0) {
        throw InvalidArgument(fmt::format("Sampling rate must be positive and finite, got {}", fs));
    }
}

static void validateDuration(double duration) {
    if (!std::isfinite(duration) || duration < 0.0) {
        throw InvalidArgument(fmt::format("Duration must be non-negative and finite, got {}", duration));
    }
}

void SamplingConfig::update(std::optional<double> new_fs, std::optional<double> new_duration) {
    // Validate both before touching either
    if (new_fs.has_value()) {
        validate_sampling_rate(*new_fs);
    }
    if (new_duration.has_value()) {
        validateDuration(*new_duration);
    }

    fs       = new_fs.value_or(fs);
    duration = new_duration.value_or(duration);
}

std::size_t SamplingConfig::num_samples() const {
    return static_cast<std::size_t>(std::floor(fs * duration));
}

std::vector<double> SamplingConfig::time_vector() const {
    return sample_times(fs, num_samples());
}

}  // namespace sigsys
