#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "LTI.hpp"
#include "config.hpp"
#include "tf.hpp"

namespace sigsys {

enum class SystemType {
    LowPass,
    HighPass,
    BandPass,
    MovingAverage,
    Differentiator,
    Integrator,
    Custom,
};

// Display name, e.g. "Low-pass Filter"
std::string_view to_string(SystemType type);

/**
 * @brief  Parse a display name back to its SystemType.
 *
 * @throws InvalidArgument  for an unrecognized name
 */
SystemType system_type_from_string(std::string_view name);

struct LowPass {
    double cutoff = 10.0;  // Hz
    int    order  = 4;
};

struct HighPass {
    double cutoff = 10.0;  // Hz
    int    order  = 4;
};

struct BandPass {
    double lowcut  = 5.0;   // Hz
    double highcut = 15.0;  // Hz
    int    order   = 4;
};

struct MovingAverage {
    int window_size = 5;
};

// Leaky differentiator (1 - z^-1) / (1 - alpha z^-1)
struct Differentiator {
    double alpha = 0.95;
};

// Leaky integrator 1 / (1 - beta z^-1)
struct Integrator {
    double beta = 0.99;
};

// Arbitrary rational system from coefficient list text, e.g. "[1, -0.5]"
struct CustomSystem {
    std::string numerator   = "[1]";
    std::string denominator = "[1]";
};

struct SystemSpec : public std::variant<LowPass, HighPass, BandPass, MovingAverage, Differentiator, Integrator, CustomSystem> {
    using variant::variant;

    SystemType type() const { return static_cast<SystemType>(index()); }
};

/**
 * @brief Flat parameter set covering every system type.
 *
 * Each type reads only its own fields; defaults match the per-type records.
 */
struct SystemParameters {
    double      cutoff      = 10.0;
    int         order       = 4;
    double      lowcut      = 5.0;
    double      highcut     = 15.0;
    int         window_size = 5;
    double      alpha       = 0.95;
    double      beta        = 0.99;
    std::string numerator   = "[1]";
    std::string denominator = "[1]";
};

// Select the fields of params relevant to type
SystemSpec make_system_spec(SystemType type, const SystemParameters& params = {});

/**
 * @brief  Design a discrete system at sampling rate fs.
 *
 * Out-of-range design values are clamped as documented per type rather than rejected.
 *
 * @throws InvalidCoefficients  for a custom system with unusable coefficients
 * @throws InvalidArgument      for a non-positive fs
 */
TransferFunction create_system(const SystemSpec& spec, double fs);

/**
 * @brief Designs LTI systems and evaluates their responses at a fixed sampling rate.
 */
class SystemAnalyzer {
   public:
    explicit SystemAnalyzer(double fs = kDefaultSamplingRate);

    double fs() const { return fs_; }

    /**
     * @throws InvalidArgument  if fs is not positive and finite; the previous rate is kept
     */
    void set_sampling_rate(double fs);

    TransferFunction create_system(const SystemSpec& spec) const;
    TransferFunction create_system(SystemType type, const SystemParameters& params = {}) const;
    // Display-name dispatch, e.g. create_system("Low-pass Filter", params)
    TransferFunction create_system(std::string_view name, const SystemParameters& params) const;

    ImpulseResponse     impulse_response(const Coefficients& b, const Coefficients& a, std::optional<std::vector<double>> t = std::nullopt) const;
    StepResponse        step_response(const Coefficients& b, const Coefficients& a, std::optional<std::vector<double>> t = std::nullopt) const;
    FrequencyResponse   frequency_response(const Coefficients& b, const Coefficients& a, size_t nPoints = kDefaultFrequencyPoints) const;
    std::vector<double> apply_system(const Coefficients& b, const Coefficients& a, const std::vector<double>& input) const;

   private:
    double fs_;
};

}  // namespace sigsys
