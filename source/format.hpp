#pragma once

#include <algorithm>
#include <cmath>
#include <string>

#include "signal_generator.hpp"
#include "ss.hpp"
#include "system_analyzer.hpp"
#include "tf.hpp"
#include "zpk.hpp"

// ============================================================================
// fmt::format support for systems and type tags
#include "fmt/core.h"
#include "fmt/format.h"

namespace sigsys::detail {

inline std::string formatMatrix(const char* name, const Matrix& M) {
    std::string result = fmt::format("{} = \n", name);
    for (int i = 0; i < M.rows(); ++i) {
        for (int j = 0; j < M.cols(); ++j) {
            result += fmt::format("{:>10.4f}", M(i, j));
        }
        result += "\n";
    }
    return result;
}

// Polynomial in z^-1, e.g. "1 - 1.5 z^-1 + 0.5 z^-2"
inline std::string formatPolynomial(const std::vector<double>& coeffs) {
    std::string result;
    for (size_t k = 0; k < coeffs.size(); ++k) {
        const double c = coeffs[k];
        if (k == 0) {
            result += fmt::format("{:.6g}", c);
        } else {
            result += fmt::format(" {} {:.6g}", c < 0.0 ? '-' : '+', std::abs(c));
        }
        if (k == 1) {
            result += " z^-1";
        } else if (k > 1) {
            result += fmt::format(" z^-{}", k);
        }
    }
    return result;
}

inline std::string formatRoots(const std::vector<Complex>& roots) {
    std::string result = "[";
    for (size_t i = 0; i < roots.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += fmt::format("{:.4f}{:+.4f}j", roots[i].real(), roots[i].imag());
    }
    return result + "]";
}

}  // namespace sigsys::detail

template <>
struct fmt::formatter<sigsys::StateSpace> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const sigsys::StateSpace& sys, fmt::format_context& ctx) const {
        using sigsys::detail::formatMatrix;
        return fmt::format_to(ctx.out(),
                              "{}\n{}\n{}\n{}\nfs = {} Hz\n",
                              formatMatrix("A", sys.A),
                              formatMatrix("B", sys.B),
                              formatMatrix("C", sys.C),
                              formatMatrix("D", sys.D),
                              sys.fs);
    }
};

template <>
struct fmt::formatter<sigsys::TransferFunction> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const sigsys::TransferFunction& tf, fmt::format_context& ctx) const {
        const std::string num = sigsys::detail::formatPolynomial(tf.num());
        const std::string den = sigsys::detail::formatPolynomial(tf.den());
        const size_t      bar = std::max(num.size(), den.size());
        return fmt::format_to(ctx.out(), "  {}\n  {}\n  {}\nfs = {} Hz", num, std::string(bar, '-'), den, tf.samplingRate());
    }
};

template <>
struct fmt::formatter<sigsys::ZeroPoleGain> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const sigsys::ZeroPoleGain& zpk, fmt::format_context& ctx) const {
        using sigsys::detail::formatRoots;
        auto out = fmt::format_to(ctx.out(), "zeros = {}\npoles = {}\ngain = {:.6g}", formatRoots(zpk.zeros_), formatRoots(zpk.poles_), zpk.gain_);
        if (zpk.fs.has_value()) {
            return fmt::format_to(out, "\nfs = {} Hz", *zpk.fs);
        }
        return fmt::format_to(out, "\ncontinuous");
    }
};

template <>
struct fmt::formatter<sigsys::SignalType> : fmt::formatter<std::string_view> {
    auto format(sigsys::SignalType type, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(sigsys::to_string(type), ctx);
    }
};

template <>
struct fmt::formatter<sigsys::SystemType> : fmt::formatter<std::string_view> {
    auto format(sigsys::SystemType type, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(sigsys::to_string(type), ctx);
    }
};
