#include "tf.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "LTI.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "response.hpp"
#include "transform.hpp"
#include "zpk.hpp"

namespace sigsys {

// Drop leading coefficients with |c| <= kCoefficientTolerance * max|c|
static void trimLeadingZeros(std::vector<double>& coeffs) {
    double scale = 0.0;
    for (double c : coeffs) {
        scale = std::max(scale, std::abs(c));
    }

    size_t first = 0;
    while (first < coeffs.size() && std::abs(coeffs[first]) <= kCoefficientTolerance * scale) {
        ++first;
    }
    coeffs.erase(coeffs.begin(), coeffs.begin() + static_cast<std::ptrdiff_t>(first));
}

static void validateTransferFunctionVectors(const std::vector<double>& num, const std::vector<double>& den) {
    if (den.empty()) {
        throw InvalidCoefficients("TransferFunction: Denominator is empty after trimming leading zeros");
    }
    if (std::abs(den[0]) <= kCoefficientTolerance) {
        throw InvalidCoefficients("TransferFunction: Denominator must have nonzero leading coefficient");
    }
    if (num.empty()) {
        throw InvalidCoefficients("TransferFunction: Numerator is empty after trimming leading zeros");
    }
    for (const auto* coeffs : {&num, &den}) {
        for (double c : *coeffs) {
            if (!std::isfinite(c)) {
                throw InvalidCoefficients(fmt::format("TransferFunction: Coefficient {} is not finite", c));
            }
        }
    }
}

TransferFunction::TransferFunction(std::vector<double> num,
                                   std::vector<double> den,
                                   double              fs)
    : num_(std::move(num)), den_(std::move(den)) {
    validate_sampling_rate(fs);
    trimLeadingZeros(num_);
    trimLeadingZeros(den_);
    validateTransferFunctionVectors(num_, den_);
    this->fs = fs;
}

TransferFunction::TransferFunction(const ZeroPoleGain& zpk)
    : TransferFunction(zpk.toTransferFunction()) {}

std::vector<Pole> TransferFunction::poles() const {
    // Poles are the roots of the denominator polynomial
    return roots(den_);
}

std::vector<Zero> TransferFunction::zeros() const {
    // Zeros are the roots of the numerator polynomial
    return roots(num_);
}

ImpulseResponse TransferFunction::impulse(std::optional<std::vector<double>> t) const {
    return impulse_response(num_, den_, samplingRate(), std::move(t));
}

StepResponse TransferFunction::step(std::optional<std::vector<double>> t) const {
    return step_response(num_, den_, samplingRate(), std::move(t));
}

FrequencyResponse TransferFunction::freqresp(size_t nPoints) const {
    return frequency_response(num_, den_, samplingRate(), nPoints);
}

BodeResponse TransferFunction::bode(size_t nPoints) const {
    return sigsys::bode(num_, den_, samplingRate(), nPoints);
}

std::vector<double> TransferFunction::apply(const std::vector<double>& input) const {
    return apply_system(num_, den_, input);
}

Complex TransferFunction::evaluate(Complex z) const {
    return z_evaluate(z, num_, den_);
}

TransferFunction TransferFunction::normalized() const {
    const double den_lead = den_[0];

    std::vector<double> norm_num = num_;
    std::vector<double> norm_den = den_;
    for (auto& c : norm_num) c /= den_lead;
    for (auto& c : norm_den) c /= den_lead;
    norm_den[0] = 1.0;  // Ensure monic

    return TransferFunction(std::move(norm_num), std::move(norm_den), samplingRate());
}

StateSpace TransferFunction::toStateSpace() const {
    auto realization = realize(num_, den_, samplingRate());
    if (!realization) {
        throw std::runtime_error(fmt::format("TransferFunction: {}", realization.error().reason));
    }
    return std::move(*realization);
}

TransferFunction TransferFunction::toTransferFunction() const {
    return *this;
}

ZeroPoleGain TransferFunction::toZeroPoleGain() const {
    // Gain is the ratio of the leading coefficients
    const double gain = num_[0] / den_[0];
    return ZeroPoleGain(zeros(), poles(), gain, samplingRate());
}
}  // namespace sigsys
