#pragma once

#include "LTI.hpp"
#include "tf.hpp"
#include "types.hpp"

namespace sigsys {

/**
 * @brief Zero-pole-gain form H(x) = gain * prod(x - zeros) / prod(x - poles).
 *
 * x is s for a continuous (analog) system and z for a discrete one. The Butterworth design
 * works in this form from the analog prototype through the bilinear transform.
 */
class ZeroPoleGain : public LTI {
   public:
    std::vector<Zero> zeros_;
    std::vector<Pole> poles_;
    double            gain_;

    std::vector<Pole> poles() const override { return poles_; };
    std::vector<Zero> zeros() const override { return zeros_; };
    double            gain() const { return gain_; }

    // Relative degree: number of poles minus number of zeros
    int degree() const { return static_cast<int>(poles_.size()) - static_cast<int>(zeros_.size()); }

    // Evaluate H at a point of the s-plane (continuous) or z-plane (discrete)
    Complex evaluate(Complex x) const;

    /**
     * @brief  Expand to polynomial coefficients.
     *
     * Numerator gain * poly(zeros) and denominator poly(poles) are read directly as ascending
     * powers of z^-1.
     *
     * @throws InvalidArgument  for a continuous system
     */
    TransferFunction toTransferFunction() const override;

    ZeroPoleGain(const TransferFunction& tf);

    ZeroPoleGain(std::vector<Zero>     zeros,
                 std::vector<Pole>     poles,
                 double                gain,
                 std::optional<double> fs = std::nullopt)
        : zeros_(std::move(zeros)), poles_(std::move(poles)), gain_(gain) {
        this->fs = fs;
    }
};

// Real polynomial coefficients (highest power first) with the given roots
std::vector<double> poly(const std::vector<Complex>& roots);

}  // namespace sigsys
