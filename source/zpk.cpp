#include "zpk.hpp"

#include "LTI.hpp"
#include "errors.hpp"
#include "transform.hpp"
#include "types.hpp"

namespace sigsys {

ZeroPoleGain::ZeroPoleGain(const TransferFunction& tf)
    : ZeroPoleGain(tf.toZeroPoleGain()) {}

Complex ZeroPoleGain::evaluate(Complex x) const {
    return laplace_evaluate(x, poles_, zeros_, gain_);
}

std::vector<double> poly(const std::vector<Complex>& roots) {
    if (roots.empty()) {
        return {1.0};
    }

    std::vector<Complex> coeffs = {1.0};

    for (const auto& root : roots) {
        std::vector<Complex> new_coeffs(coeffs.size() + 1, 0.0);
        for (size_t i = 0; i < coeffs.size(); ++i) {
            new_coeffs[i] += coeffs[i];
            new_coeffs[i + 1] -= coeffs[i] * root;
        }
        coeffs = std::move(new_coeffs);
    }

    // Convert to real coefficients (imaginary parts cancel for conjugate-paired roots)
    std::vector<double> real_coeffs;
    real_coeffs.reserve(coeffs.size());
    for (const auto& c : coeffs) {
        real_coeffs.push_back(c.real());
    }
    return real_coeffs;
}

TransferFunction ZeroPoleGain::toTransferFunction() const {
    if (!fs.has_value()) {
        throw InvalidArgument("ZeroPoleGain: only a discrete system converts to a TransferFunction");
    }

    std::vector<double> num_coeffs = poly(zeros_);
    std::vector<double> den_coeffs = poly(poles_);

    // Multiply numerator by gain
    for (auto& c : num_coeffs) {
        c *= gain_;
    }

    return TransferFunction(std::move(num_coeffs), std::move(den_coeffs), *fs);
}

}  // namespace sigsys
