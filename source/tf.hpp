#pragma once

#include "LTI.hpp"
#include "ss.hpp"
#include "types.hpp"

namespace sigsys {

/**
 * @brief Discrete transfer function H(z) = b(z^-1) / a(z^-1).
 *
 * num = b and den = a hold coefficients in ascending powers of z^-1. Construction trims
 * leading near-zero coefficients (|c| <= kCoefficientTolerance relative to the largest
 * magnitude in the array) from both arrays and guarantees a non-empty denominator with
 * |a[0]| > kCoefficientTolerance. Immutable once constructed.
 */
class TransferFunction : public LTI {
   public:
    /**
     * @throws InvalidCoefficients  if either array is empty after trimming, a[0] is near zero,
     *                              or any coefficient is not finite
     * @throws InvalidArgument      if fs is not a positive finite rate
     */
    TransferFunction(std::vector<double> num,
                     std::vector<double> den,
                     double              fs = kDefaultSamplingRate);

    TransferFunction(const ZeroPoleGain& zpk);

    const std::vector<double>& num() const { return num_; }
    const std::vector<double>& den() const { return den_; }
    double                     samplingRate() const { return *fs; }

    // len(a) == 1 && len(b) == 1
    bool isStaticGain() const { return num_.size() == 1 && den_.size() == 1; }
    // len(b) <= len(a)
    bool isProper() const { return num_.size() <= den_.size(); }

    std::vector<Pole> poles() const override;
    std::vector<Zero> zeros() const override;

    ImpulseResponse   impulse(std::optional<std::vector<double>> t = std::nullopt) const override;
    StepResponse      step(std::optional<std::vector<double>> t = std::nullopt) const override;
    FrequencyResponse freqresp(size_t nPoints = kDefaultFrequencyPoints) const override;
    BodeResponse      bode(size_t nPoints = kDefaultFrequencyPoints) const override;

    // Run the system over an input sequence (recursive filtering kernel)
    std::vector<double> apply(const std::vector<double>& input) const;

    // Evaluate H at a point of the z-plane
    Complex evaluate(Complex z) const;

    // Copy with both arrays divided by a[0]
    TransferFunction normalized() const;

    /**
     * @brief  Controllable canonical realization.
     *
     * @throws std::runtime_error  for an improper system or a non-finite realization
     */
    StateSpace       toStateSpace() const;
    TransferFunction toTransferFunction() const override;
    ZeroPoleGain     toZeroPoleGain() const;

    bool operator==(const TransferFunction& other) const {
        return num_ == other.num_ && den_ == other.den_ && fs == other.fs;
    }

   private:
    std::vector<double> num_, den_;
};
}  // namespace sigsys
