#include "LTI.hpp"

#include <cmath>
#include <optional>

#include "tf.hpp"
#include "types.hpp"

namespace sigsys {

/* LTI Member Function Definitions - Default to TransferFunction dispatch */
std::vector<Pole> LTI::poles() const {
    return toTransferFunction().poles();
}
std::vector<Zero> LTI::zeros() const {
    return toTransferFunction().zeros();
}
bool LTI::is_stable() const {
    const auto p = poles();
    if (isDiscrete()) {
        // Discrete: unstable if any |pole| >= 1
        for (const auto& pole : p) {
            if (std::abs(pole) >= 1.0) {
                return false;
            }
        }
    } else {
        // Continuous: unstable if any Re(pole) >= 0
        for (const auto& pole : p) {
            if (pole.real() >= 0.0) {
                return false;
            }
        }
    }
    return true;
}
ImpulseResponse LTI::impulse(std::optional<std::vector<double>> t) const {
    return toTransferFunction().impulse(std::move(t));
}
StepResponse LTI::step(std::optional<std::vector<double>> t) const {
    return toTransferFunction().step(std::move(t));
}
FrequencyResponse LTI::freqresp(size_t nPoints) const {
    return toTransferFunction().freqresp(nPoints);
}
BodeResponse LTI::bode(size_t nPoints) const {
    return toTransferFunction().bode(nPoints);
}

}  // namespace sigsys
