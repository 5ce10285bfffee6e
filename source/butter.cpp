#include "butter.hpp"

#include <cmath>
#include <numbers>

#include <fmt/core.h>

#include "config.hpp"
#include "errors.hpp"

namespace sigsys {

// Bilinear design rate; the prewarp and the transform must agree on it
static constexpr double kDesignRate = 2.0;

static void validateOrder(int order) {
    if (order < 1) {
        throw InvalidArgument(fmt::format("butter: order must be at least 1, got {}", order));
    }
}

static void validateNormalizedFrequency(double Wn) {
    if (!std::isfinite(Wn) || Wn <= 0.0 || Wn >= 1.0) {
        throw InvalidArgument(fmt::format("butter: normalized frequency must lie in (0, 1), got {}", Wn));
    }
}

// Analog frequency whose bilinear image lands on the digital edge Wn
static double prewarp(double Wn) {
    return 2.0 * kDesignRate * std::tan(std::numbers::pi * Wn / kDesignRate);
}

static Complex product(const std::vector<Complex>& values, Complex offset, double sign) {
    Complex acc = 1.0;
    for (const auto& v : values) {
        acc *= offset + sign * v;
    }
    return acc;
}

ZeroPoleGain butter_prototype(int order) {
    validateOrder(order);

    const double      N = static_cast<double>(order);
    std::vector<Pole> poles;
    poles.reserve(order);
    for (int k = 0; k < order; ++k) {
        const double angle = std::numbers::pi * (2.0 * k + N + 1.0) / (2.0 * N);
        poles.push_back(std::polar(1.0, angle));
    }
    return ZeroPoleGain({}, std::move(poles), 1.0);
}

ZeroPoleGain lp2lp_zpk(const ZeroPoleGain& proto, double wo) {
    std::vector<Zero> zeros = proto.zeros_;
    std::vector<Pole> poles = proto.poles_;
    for (auto& z : zeros) z *= wo;
    for (auto& p : poles) p *= wo;

    // Each surplus pole contributes a factor of wo to the high-frequency asymptote
    const double gain = proto.gain_ * std::pow(wo, proto.degree());
    return ZeroPoleGain(std::move(zeros), std::move(poles), gain);
}

ZeroPoleGain lp2hp_zpk(const ZeroPoleGain& proto, double wo) {
    std::vector<Zero> zeros;
    std::vector<Pole> poles;
    zeros.reserve(proto.poles_.size());
    poles.reserve(proto.poles_.size());

    for (const auto& z : proto.zeros_) zeros.push_back(wo / z);
    for (const auto& p : proto.poles_) poles.push_back(wo / p);

    // Zeros at infinity move to the origin
    zeros.insert(zeros.end(), static_cast<size_t>(proto.degree()), Complex(0.0, 0.0));

    const Complex ratio = product(proto.zeros_, 0.0, -1.0) / product(proto.poles_, 0.0, -1.0);
    const double  gain  = proto.gain_ * ratio.real();
    return ZeroPoleGain(std::move(zeros), std::move(poles), gain);
}

ZeroPoleGain lp2bp_zpk(const ZeroPoleGain& proto, double wo, double bw) {
    const auto split = [&](const std::vector<Complex>& roots) {
        std::vector<Complex> result;
        result.reserve(2 * roots.size());
        for (const auto& r : roots) {
            const Complex half = r * bw / 2.0;
            result.push_back(half + std::sqrt(half * half - wo * wo));
        }
        for (const auto& r : roots) {
            const Complex half = r * bw / 2.0;
            result.push_back(half - std::sqrt(half * half - wo * wo));
        }
        return result;
    };

    std::vector<Zero> zeros = split(proto.zeros_);
    std::vector<Pole> poles = split(proto.poles_);

    zeros.insert(zeros.end(), static_cast<size_t>(proto.degree()), Complex(0.0, 0.0));

    const double gain = proto.gain_ * std::pow(bw, proto.degree());
    return ZeroPoleGain(std::move(zeros), std::move(poles), gain);
}

ZeroPoleGain bilinear_zpk(const ZeroPoleGain& analog, double fs) {
    if (analog.isDiscrete()) {
        throw InvalidArgument("bilinear_zpk: system is already discrete");
    }
    validate_sampling_rate(fs);

    const double fs2 = 2.0 * fs;

    std::vector<Zero> zeros;
    std::vector<Pole> poles;
    zeros.reserve(analog.poles_.size());
    poles.reserve(analog.poles_.size());

    for (const auto& z : analog.zeros_) zeros.push_back((fs2 + z) / (fs2 - z));
    for (const auto& p : analog.poles_) poles.push_back((fs2 + p) / (fs2 - p));

    // Zeros at infinity map to Nyquist
    zeros.insert(zeros.end(), static_cast<size_t>(analog.degree()), Complex(-1.0, 0.0));

    const Complex ratio = product(analog.zeros_, fs2, -1.0) / product(analog.poles_, fs2, -1.0);
    const double  gain  = analog.gain_ * ratio.real();
    return ZeroPoleGain(std::move(zeros), std::move(poles), gain, fs);
}

// Expand a discrete zpk into coefficients tagged with the caller's sampling rate
static TransferFunction expand(const ZeroPoleGain& digital, double fs) {
    std::vector<double> num = poly(digital.zeros_);
    std::vector<double> den = poly(digital.poles_);
    for (auto& c : num) {
        c *= digital.gain_;
    }
    return TransferFunction(std::move(num), std::move(den), fs).normalized();
}

TransferFunction butter(int order, double Wn, ButterKind kind, double fs) {
    validateOrder(order);
    validateNormalizedFrequency(Wn);

    const ZeroPoleGain proto  = butter_prototype(order);
    const double       warped = prewarp(Wn);

    const ZeroPoleGain analog = (kind == ButterKind::LowPass) ? lp2lp_zpk(proto, warped) : lp2hp_zpk(proto, warped);
    return expand(bilinear_zpk(analog, kDesignRate), fs);
}

TransferFunction butter_bandpass(int order, double low, double high, double fs) {
    validateOrder(order);
    validateNormalizedFrequency(low);
    validateNormalizedFrequency(high);
    if (low >= high) {
        throw InvalidArgument(fmt::format("butter_bandpass: band edges must satisfy low < high, got [{}, {}]", low, high));
    }

    const double wl = prewarp(low);
    const double wh = prewarp(high);

    const ZeroPoleGain analog = lp2bp_zpk(butter_prototype(order), std::sqrt(wl * wh), wh - wl);
    return expand(bilinear_zpk(analog, kDesignRate), fs);
}

}  // namespace sigsys
