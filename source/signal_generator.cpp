#include "signal_generator.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <utility>

#include <fmt/core.h>

#include "errors.hpp"
#include "expression.hpp"
#include "log.hpp"
#include "utility.hpp"

namespace sigsys {

static constexpr std::array<std::pair<SignalType, std::string_view>, 10> kSignalNames = {{
    {SignalType::Sine, "Sine Wave"},
    {SignalType::Cosine, "Cosine Wave"},
    {SignalType::Square, "Square Wave"},
    {SignalType::Triangle, "Triangle Wave"},
    {SignalType::Sawtooth, "Sawtooth Wave"},
    {SignalType::ExponentialDecay, "Exponential Decay"},
    {SignalType::UnitStep, "Unit Step"},
    {SignalType::Impulse, "Impulse"},
    {SignalType::GaussianPulse, "Gaussian Pulse"},
    {SignalType::CustomFunction, "Custom Function"},
}};

std::string_view to_string(SignalType type) {
    for (const auto& [t, name] : kSignalNames) {
        if (t == type) {
            return name;
        }
    }
    return "Unknown Signal";
}

SignalType signal_type_from_string(std::string_view name) {
    for (const auto& [t, display] : kSignalNames) {
        if (display == name) {
            return t;
        }
    }
    throw InvalidArgument(fmt::format("Unknown signal type: {}", name));
}

SignalSpec make_signal_spec(SignalType type, const SignalParameters& p) {
    switch (type) {
        case SignalType::Sine:
            return Sine{.amplitude = p.amplitude, .frequency = p.frequency, .phase = p.phase, .dc_offset = p.dc_offset};
        case SignalType::Cosine:
            return Cosine{.amplitude = p.amplitude, .frequency = p.frequency, .phase = p.phase, .dc_offset = p.dc_offset};
        case SignalType::Square:
            return Square{.amplitude  = p.amplitude,
                          .frequency  = p.frequency,
                          .phase      = p.phase,
                          .dc_offset  = p.dc_offset,
                          .duty_cycle = p.duty_cycle};
        case SignalType::Triangle:
            return Triangle{.amplitude = p.amplitude,
                            .frequency = p.frequency,
                            .phase     = p.phase,
                            .dc_offset = p.dc_offset,
                            .width     = p.width};
        case SignalType::Sawtooth:
            return Sawtooth{.amplitude = p.amplitude, .frequency = p.frequency, .phase = p.phase, .dc_offset = p.dc_offset};
        case SignalType::ExponentialDecay:
            return ExponentialDecay{.amplitude = p.amplitude, .dc_offset = p.dc_offset, .decay_rate = p.decay_rate};
        case SignalType::UnitStep:
            return UnitStep{.amplitude = p.amplitude, .dc_offset = p.dc_offset, .step_time = p.step_time};
        case SignalType::Impulse:
            return Impulse{.amplitude = p.amplitude, .impulse_time = p.impulse_time};
        case SignalType::GaussianPulse:
            return GaussianPulse{.amplitude = p.amplitude, .dc_offset = p.dc_offset, .center = p.center, .std_dev = p.std_dev};
        case SignalType::CustomFunction:
            return CustomFunction{.function = p.function, .dc_offset = p.dc_offset};
    }
    throw InvalidArgument(fmt::format("Unknown signal type: {}", static_cast<int>(type)));
}

/* Waveforms on theta = 2*pi*f*t + phase, with position theta mod 2*pi */

static double squareWave(double theta, double duty) {
    const double tmod = wrap(theta, 0.0, 2.0 * std::numbers::pi);
    return (tmod < duty * 2.0 * std::numbers::pi) ? 1.0 : -1.0;
}

// Rises from -1 to 1 over the first fraction `width` of the period, falls back over the rest
static double sawtoothWave(double theta, double width) {
    constexpr double pi   = std::numbers::pi;
    const double     tmod = wrap(theta, 0.0, 2.0 * pi);
    if (width >= 1.0 || tmod < width * 2.0 * pi) {
        return tmod / (pi * width) - 1.0;
    }
    return (pi * (width + 1.0) - tmod) / (pi * (1.0 - width));
}

namespace {

struct Sampler {
    const std::vector<double>& t;
    double                     duration;

    template <typename F>
    std::vector<double> map(F&& f) const {
        std::vector<double> x;
        x.reserve(t.size());
        for (double ti : t) {
            x.push_back(f(ti));
        }
        return x;
    }

    static double theta(double f, double ti, double phase) { return 2.0 * std::numbers::pi * f * ti + phase; }

    std::vector<double> operator()(const Sine& s) const {
        return map([&](double ti) { return s.amplitude * std::sin(theta(s.frequency, ti, s.phase)) + s.dc_offset; });
    }

    std::vector<double> operator()(const Cosine& s) const {
        return map([&](double ti) { return s.amplitude * std::cos(theta(s.frequency, ti, s.phase)) + s.dc_offset; });
    }

    std::vector<double> operator()(const Square& s) const {
        const double duty = std::clamp(s.duty_cycle, 0.0, 1.0);
        return map([&](double ti) { return s.amplitude * squareWave(theta(s.frequency, ti, s.phase), duty) + s.dc_offset; });
    }

    std::vector<double> operator()(const Triangle& s) const {
        const double width = std::clamp(s.width, 0.0, 1.0);
        return map([&](double ti) { return s.amplitude * sawtoothWave(theta(s.frequency, ti, s.phase), width) + s.dc_offset; });
    }

    std::vector<double> operator()(const Sawtooth& s) const {
        return map([&](double ti) { return s.amplitude * sawtoothWave(theta(s.frequency, ti, s.phase), 1.0) + s.dc_offset; });
    }

    std::vector<double> operator()(const ExponentialDecay& s) const {
        return map([&](double ti) { return s.amplitude * std::exp(-s.decay_rate * ti) + s.dc_offset; });
    }

    std::vector<double> operator()(const UnitStep& s) const {
        return map([&](double ti) { return (ti >= s.step_time ? s.amplitude : 0.0) + s.dc_offset; });
    }

    std::vector<double> operator()(const Impulse& s) const {
        std::vector<double> x(t.size(), 0.0);
        if (t.empty()) {
            return x;
        }

        // Nearest sample to impulse_time, first one on ties
        size_t nearest = 0;
        for (size_t i = 1; i < t.size(); ++i) {
            if (std::abs(t[i] - s.impulse_time) < std::abs(t[nearest] - s.impulse_time)) {
                nearest = i;
            }
        }
        x[nearest] = s.amplitude;
        return x;
    }

    std::vector<double> operator()(const GaussianPulse& s) const {
        if (!(s.std_dev > 0.0)) {
            throw InvalidArgument(fmt::format("Gaussian pulse std_dev must be positive, got {}", s.std_dev));
        }
        const double center = s.center.value_or(duration / 2.0);
        return map([&](double ti) {
            const double u = (ti - center) / s.std_dev;
            return s.amplitude * std::exp(-0.5 * u * u) + s.dc_offset;
        });
    }

    std::vector<double> operator()(const CustomFunction& s) const {
        std::vector<double> x = Expression::parse(s.function).evaluate(t);
        for (auto& v : x) {
            v += s.dc_offset;
        }
        return x;
    }
};

}  // namespace

SignalGenerator::SignalGenerator(double fs, double duration) {
    config_.update(fs, duration);
    t_ = config_.time_vector();
}

Signal SignalGenerator::generate(const SignalSpec& spec) const {
    Signal signal{t_, std::visit(Sampler{t_, config_.duration}, spec)};

    if (!validate_signal(signal.time, signal.samples)) {
        throw InvalidArgument(fmt::format("{} produced non-finite samples", to_string(spec.type())));
    }
    logger()->debug("Generated {} with {} samples at {} Hz", to_string(spec.type()), signal.samples.size(), config_.fs);
    return signal;
}

Signal SignalGenerator::generate(SignalType type, const SignalParameters& params) const {
    return generate(make_signal_spec(type, params));
}

Signal SignalGenerator::generate(std::string_view name, const SignalParameters& params) const {
    return generate(signal_type_from_string(name), params);
}

void SignalGenerator::set_parameters(std::optional<double> fs, std::optional<double> duration) {
    config_.update(fs, duration);
    t_ = config_.time_vector();
}

}  // namespace sigsys
