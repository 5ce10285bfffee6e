#pragma once

#include "LTI.hpp"               // IWYU pragma: keep
#include "butter.hpp"            // IWYU pragma: keep
#include "config.hpp"            // IWYU pragma: keep
#include "errors.hpp"            // IWYU pragma: keep
#include "expression.hpp"        // IWYU pragma: keep
#include "format.hpp"            // IWYU pragma: keep
#include "log.hpp"               // IWYU pragma: keep
#include "response.hpp"          // IWYU pragma: keep
#include "signal_generator.hpp"  // IWYU pragma: keep
#include "ss.hpp"                // IWYU pragma: keep
#include "system_analyzer.hpp"   // IWYU pragma: keep
#include "tf.hpp"                // IWYU pragma: keep
#include "transform.hpp"         // IWYU pragma: keep
#include "types.hpp"             // IWYU pragma: keep
#include "utility.hpp"           // IWYU pragma: keep
#include "zpk.hpp"               // IWYU pragma: keep

// Free functions for creating LTI systems and converting between forms
namespace sigsys {

template <class T>
concept SSConvertible = requires(const T& t) { { t.toStateSpace() }; };

template <class T>
concept TFConvertible = requires(const T& t) { { t.toTransferFunction() }; };

template <class T>
concept ZPKConvertible = requires(const T& t) { { t.toZeroPoleGain() }; };

template <SSConvertible T>
StateSpace ss(const T& sys) {
    return sys.toStateSpace();
}

template <TFConvertible T>
TransferFunction tf(const T& sys) {
    return sys.toTransferFunction();
}

inline TransferFunction tf(std::vector<double> num, std::vector<double> den, double fs = kDefaultSamplingRate) {
    return TransferFunction{std::move(num), std::move(den), fs};
}

inline StateSpace tf2ss(std::vector<double> num, std::vector<double> den, double fs = kDefaultSamplingRate) {
    return TransferFunction{std::move(num), std::move(den), fs}.toStateSpace();
}

template <ZPKConvertible T>
ZeroPoleGain zpk(const T& sys) {
    return sys.toZeroPoleGain();
}

inline ZeroPoleGain zpk(const std::vector<Zero>& zeros,
                        const std::vector<Pole>& poles,
                        double                   gain,
                        std::optional<double>    fs = std::nullopt) {
    return ZeroPoleGain{zeros, poles, gain, fs};
}

}  // namespace sigsys
