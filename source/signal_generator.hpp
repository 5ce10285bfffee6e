#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "config.hpp"

namespace sigsys {

// Sampled signal: time[i] = i / fs, samples[i] the value at that instant
struct Signal {
    std::vector<double> time;
    std::vector<double> samples;
};

enum class SignalType {
    Sine,
    Cosine,
    Square,
    Triangle,
    Sawtooth,
    ExponentialDecay,
    UnitStep,
    Impulse,
    GaussianPulse,
    CustomFunction,
};

// Display name, e.g. "Sine Wave"
std::string_view to_string(SignalType type);

/**
 * @brief  Parse a display name back to its SignalType.
 *
 * @throws InvalidArgument  for an unrecognized name
 */
SignalType signal_type_from_string(std::string_view name);

struct Sine {
    double amplitude = 1.0;
    double frequency = 1.0;  // Hz
    double phase     = 0.0;  // rad
    double dc_offset = 0.0;
};

struct Cosine {
    double amplitude = 1.0;
    double frequency = 1.0;
    double phase     = 0.0;
    double dc_offset = 0.0;
};

struct Square {
    double amplitude  = 1.0;
    double frequency  = 1.0;
    double phase      = 0.0;
    double dc_offset  = 0.0;
    double duty_cycle = 0.5;  // Fraction of the period at +amplitude, clamped to [0, 1]
};

struct Triangle {
    double amplitude = 1.0;
    double frequency = 1.0;
    double phase     = 0.0;
    double dc_offset = 0.0;
    double width     = 0.5;  // Fraction of the period spent rising, clamped to [0, 1]
};

struct Sawtooth {
    double amplitude = 1.0;
    double frequency = 1.0;
    double phase     = 0.0;
    double dc_offset = 0.0;
};

struct ExponentialDecay {
    double amplitude  = 1.0;
    double dc_offset  = 0.0;
    double decay_rate = 1.0;  // 1/s
};

struct UnitStep {
    double amplitude = 1.0;
    double dc_offset = 0.0;
    double step_time = 0.0;  // s
};

// Single nonzero sample; the DC offset does not apply
struct Impulse {
    double amplitude    = 1.0;
    double impulse_time = 0.0;  // s
};

struct GaussianPulse {
    double                amplitude = 1.0;
    double                dc_offset = 0.0;
    std::optional<double> center    = {};   // s; defaults to the middle of the duration
    double                std_dev   = 0.1;  // s
};

// Restricted expression in t, see Expression
struct CustomFunction {
    std::string function  = "sin(2*pi*t)";
    double      dc_offset = 0.0;
};

struct SignalSpec : public std::variant<Sine,
                                        Cosine,
                                        Square,
                                        Triangle,
                                        Sawtooth,
                                        ExponentialDecay,
                                        UnitStep,
                                        Impulse,
                                        GaussianPulse,
                                        CustomFunction> {
    using variant::variant;

    SignalType type() const { return static_cast<SignalType>(index()); }
};

/**
 * @brief Flat parameter set covering every signal type.
 *
 * Each type reads only its own fields; defaults match the per-type records.
 */
struct SignalParameters {
    double                amplitude    = 1.0;
    double                frequency    = 1.0;
    double                phase        = 0.0;
    double                dc_offset    = 0.0;
    double                duty_cycle   = 0.5;
    double                width        = 0.5;
    double                decay_rate   = 1.0;
    double                step_time    = 0.0;
    double                impulse_time = 0.0;
    std::optional<double> center       = {};
    double                std_dev      = 0.1;
    std::string           function     = "sin(2*pi*t)";
};

// Select the fields of params relevant to type
SignalSpec make_signal_spec(SignalType type, const SignalParameters& params = {});

/**
 * @brief Generates parametric test signals over a fixed sampling grid.
 *
 * Owns its SamplingConfig; the time vector is rebuilt only by set_parameters().
 */
class SignalGenerator {
   public:
    /**
     * @throws InvalidArgument  if fs <= 0 or duration < 0
     */
    explicit SignalGenerator(double fs = kDefaultSamplingRate, double duration = kDefaultDuration);

    /**
     * @brief  Sample a signal over the current time vector.
     *
     * @throws InvalidExpression  if a custom function fails to parse or evaluate
     * @throws InvalidArgument    if a Gaussian pulse has std_dev <= 0 or the samples are not finite
     */
    Signal generate(const SignalSpec& spec) const;
    Signal generate(SignalType type, const SignalParameters& params = {}) const;
    // Display-name dispatch, e.g. generate("Sine Wave", params)
    Signal generate(std::string_view name, const SignalParameters& params) const;

    /**
     * @brief  Update the sampling rate and/or duration and rebuild the time vector.
     *
     * @throws InvalidArgument  if fs <= 0 or duration < 0; nothing changes in that case
     */
    void set_parameters(std::optional<double> fs, std::optional<double> duration = std::nullopt);

    const std::vector<double>& time() const { return t_; }
    double                     fs() const { return config_.fs; }
    double                     duration() const { return config_.duration; }

   private:
    SamplingConfig      config_;
    std::vector<double> t_;
};

}  // namespace sigsys
