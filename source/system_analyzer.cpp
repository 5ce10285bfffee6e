#include "system_analyzer.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "butter.hpp"
#include "errors.hpp"
#include "expression.hpp"
#include "log.hpp"
#include "response.hpp"

namespace sigsys {

static constexpr std::array<std::pair<SystemType, std::string_view>, 7> kSystemNames = {{
    {SystemType::LowPass, "Low-pass Filter"},
    {SystemType::HighPass, "High-pass Filter"},
    {SystemType::BandPass, "Band-pass Filter"},
    {SystemType::MovingAverage, "Moving Average"},
    {SystemType::Differentiator, "Differentiator"},
    {SystemType::Integrator, "Integrator"},
    {SystemType::Custom, "Custom System"},
}};

std::string_view to_string(SystemType type) {
    for (const auto& [t, name] : kSystemNames) {
        if (t == type) {
            return name;
        }
    }
    return "Unknown System";
}

SystemType system_type_from_string(std::string_view name) {
    for (const auto& [t, display] : kSystemNames) {
        if (display == name) {
            return t;
        }
    }
    throw InvalidArgument(fmt::format("Unknown system type: {}", name));
}

SystemSpec make_system_spec(SystemType type, const SystemParameters& p) {
    switch (type) {
        case SystemType::LowPass:
            return LowPass{.cutoff = p.cutoff, .order = p.order};
        case SystemType::HighPass:
            return HighPass{.cutoff = p.cutoff, .order = p.order};
        case SystemType::BandPass:
            return BandPass{.lowcut = p.lowcut, .highcut = p.highcut, .order = p.order};
        case SystemType::MovingAverage:
            return MovingAverage{.window_size = p.window_size};
        case SystemType::Differentiator:
            return Differentiator{.alpha = p.alpha};
        case SystemType::Integrator:
            return Integrator{.beta = p.beta};
        case SystemType::Custom:
            return CustomSystem{.numerator = p.numerator, .denominator = p.denominator};
    }
    throw InvalidArgument(fmt::format("Unknown system type: {}", static_cast<int>(type)));
}

/* Per-type designers */

static TransferFunction design(const LowPass& spec, double fs) {
    const double nyquist = fs / 2.0;
    double       cutoff  = spec.cutoff;
    if (cutoff >= nyquist) {
        logger()->debug("Low-pass cutoff {} Hz clamped below Nyquist", cutoff);
        cutoff = 0.99 * nyquist;
    }
    return butter(std::max(spec.order, 1), cutoff / nyquist, ButterKind::LowPass, fs);
}

static TransferFunction design(const HighPass& spec, double fs) {
    const double nyquist = fs / 2.0;
    double       cutoff  = spec.cutoff;
    if (cutoff <= 0.0) {
        logger()->debug("High-pass cutoff {} Hz replaced by 1 Hz", cutoff);
        cutoff = 1.0;
    }
    if (cutoff >= nyquist) {
        logger()->debug("High-pass cutoff {} Hz clamped below Nyquist", cutoff);
        cutoff = 0.99 * nyquist;
    }
    return butter(std::max(spec.order, 1), cutoff / nyquist, ButterKind::HighPass, fs);
}

static TransferFunction design(const BandPass& spec, double fs) {
    const double nyquist = fs / 2.0;
    double       lowcut  = std::max(spec.lowcut, 0.1);
    double       highcut = std::min(spec.highcut, 0.99 * nyquist);
    if (!(lowcut < highcut)) {
        logger()->warn("Band-pass edges [{}, {}] Hz are invalid; using [5, 15] Hz", spec.lowcut, spec.highcut);
        lowcut  = 5.0;
        highcut = 15.0;
    }
    return butter_bandpass(std::max(spec.order, 1), lowcut / nyquist, highcut / nyquist, fs);
}

static TransferFunction design(const MovingAverage& spec, double fs) {
    const int N = std::max(spec.window_size, 1);
    return TransferFunction(std::vector<double>(static_cast<size_t>(N), 1.0 / N), {1.0}, fs);
}

static TransferFunction design(const Differentiator& spec, double fs) {
    const double alpha = std::clamp(spec.alpha, 0.0, 0.999);
    return TransferFunction({1.0, -1.0}, {1.0, -alpha}, fs);
}

static TransferFunction design(const Integrator& spec, double fs) {
    const double beta = std::clamp(spec.beta, 0.0, 0.9999);
    return TransferFunction({1.0}, {1.0, -beta}, fs);
}

static TransferFunction design(const CustomSystem& spec, double fs) {
    return TransferFunction(parse_coefficients(spec.numerator), parse_coefficients(spec.denominator), fs);
}

TransferFunction create_system(const SystemSpec& spec, double fs) {
    validate_sampling_rate(fs);

    TransferFunction tf = std::visit([fs](const auto& s) { return design(s, fs); }, spec);

    logger()->debug("Created {} at {} Hz: b = [{}], a = [{}]",
                    to_string(spec.type()),
                    fs,
                    fmt::join(tf.num(), ", "),
                    fmt::join(tf.den(), ", "));
    return tf;
}

/* SystemAnalyzer */

SystemAnalyzer::SystemAnalyzer(double fs)
    : fs_(fs) {
    validate_sampling_rate(fs);
}

void SystemAnalyzer::set_sampling_rate(double fs) {
    validate_sampling_rate(fs);
    fs_ = fs;
}

TransferFunction SystemAnalyzer::create_system(const SystemSpec& spec) const {
    return sigsys::create_system(spec, fs_);
}

TransferFunction SystemAnalyzer::create_system(SystemType type, const SystemParameters& params) const {
    return create_system(make_system_spec(type, params));
}

TransferFunction SystemAnalyzer::create_system(std::string_view name, const SystemParameters& params) const {
    return create_system(system_type_from_string(name), params);
}

ImpulseResponse SystemAnalyzer::impulse_response(const Coefficients& b, const Coefficients& a, std::optional<std::vector<double>> t) const {
    return sigsys::impulse_response(b, a, fs_, std::move(t));
}

StepResponse SystemAnalyzer::step_response(const Coefficients& b, const Coefficients& a, std::optional<std::vector<double>> t) const {
    return sigsys::step_response(b, a, fs_, std::move(t));
}

FrequencyResponse SystemAnalyzer::frequency_response(const Coefficients& b, const Coefficients& a, size_t nPoints) const {
    return sigsys::frequency_response(b, a, fs_, nPoints);
}

std::vector<double> SystemAnalyzer::apply_system(const Coefficients& b, const Coefficients& a, const std::vector<double>& input) const {
    return sigsys::apply_system(b, a, input);
}

}  // namespace sigsys
