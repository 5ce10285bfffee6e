#include "response.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string_view>

#include <fmt/core.h>

#include "errors.hpp"
#include "log.hpp"
#include "ss.hpp"
#include "transform.hpp"
#include "utility.hpp"

namespace sigsys {

static void validateCoefficients(const Coefficients& b, const Coefficients& a) {
    if (b.empty()) {
        throw InvalidCoefficients("Numerator is empty");
    }
    if (a.empty()) {
        throw InvalidCoefficients("Denominator is empty");
    }
    if (std::abs(a[0]) <= kCoefficientTolerance) {
        throw InvalidCoefficients(fmt::format("Leading denominator coefficient must be nonzero, got {}", a[0]));
    }
}

std::vector<double> lfilter(const Coefficients& b, const Coefficients& a, const std::vector<double>& x) {
    validateCoefficients(b, a);

    const double        a0 = a[0];
    std::vector<double> y(x.size(), 0.0);

    for (size_t n = 0; n < x.size(); ++n) {
        double acc = 0.0;
        for (size_t k = 0; k < b.size() && k <= n; ++k) {
            acc += b[k] * x[n - k];
        }
        for (size_t k = 1; k < a.size() && k <= n; ++k) {
            acc -= a[k] * y[n - k];
        }
        y[n] = acc / a0;
    }
    return y;
}

std::vector<double> response_time(double fs) {
    validate_sampling_rate(fs);
    return sample_times(fs, static_cast<size_t>(std::floor(kDefaultResponseWindow * fs)));
}

// Primary path for proper systems: simulate the controllable canonical realization
static Result<std::vector<double>> simulateStateSpace(const Coefficients&        b,
                                                      const Coefficients&        a,
                                                      double                     fs,
                                                      const std::vector<double>& u) {
    auto sys = realize(b, a, fs);
    if (!sys) {
        return std::unexpected(sys.error());
    }

    std::vector<double> y = sys->simulate(u);
    for (size_t k = 0; k < y.size(); ++k) {
        if (!std::isfinite(y[k])) {
            return numeric_failure(fmt::format("state-space output is not finite at sample {}", k));
        }
    }
    return y;
}

// Drive the system with u: kernel for improper systems, state space (kernel fallback) otherwise
static std::vector<double> drive(const Coefficients&        b,
                                 const Coefficients&        a,
                                 double                     fs,
                                 const std::vector<double>& u,
                                 std::string_view           what) {
    if (b.size() > a.size()) {
        return lfilter(b, a, u);
    }
    return or_fallback(simulateStateSpace(b, a, fs, u), [&] { return lfilter(b, a, u); }, what);
}

ImpulseResponse impulse_response(const Coefficients&                b,
                                 const Coefficients&                a,
                                 double                             fs,
                                 std::optional<std::vector<double>> t) {
    validateCoefficients(b, a);

    ImpulseResponse response;
    response.time = t.has_value() ? std::move(*t) : response_time(fs);

    const size_t N = response.time.size();
    if (N == 0) {
        return response;
    }

    // Static gain: scaled unit impulse
    if (a.size() == 1 && b.size() == 1) {
        response.output.assign(N, 0.0);
        response.output[0] = b[0] / a[0];
        return response;
    }

    std::vector<double> impulse(N, 0.0);
    impulse[0]      = 1.0;
    response.output = drive(b, a, fs, impulse, "impulse_response");
    return response;
}

StepResponse step_response(const Coefficients&                b,
                           const Coefficients&                a,
                           double                             fs,
                           std::optional<std::vector<double>> t) {
    validateCoefficients(b, a);

    StepResponse response;
    response.time = t.has_value() ? std::move(*t) : response_time(fs);

    const size_t N = response.time.size();

    if (a.size() == 1 && b.size() == 1) {
        response.output.assign(N, b[0] / a[0]);
        return response;
    }

    response.output = drive(b, a, fs, std::vector<double>(N, 1.0), "step_response");
    return response;
}

static Result<std::vector<Complex>> evaluateOnUnitCircle(const Coefficients&        b,
                                                         const Coefficients&        a,
                                                         double                     fs,
                                                         const std::vector<double>& freq) {
    if (b.empty() || a.empty()) {
        return numeric_failure("empty coefficient array");
    }
    if (freq.empty()) {
        return numeric_failure("no frequency points requested");
    }
    if (!std::isfinite(fs) || fs <= 0.0) {
        return numeric_failure(fmt::format("invalid sampling rate {}", fs));
    }

    std::vector<Complex> H;
    H.reserve(freq.size());

    size_t sanitized = 0;
    for (double f : freq) {
        const double  w = 2.0 * std::numbers::pi * f / fs;
        const Complex z = std::polar(1.0, w);
        const Complex h = z_evaluate(z, b, a);
        if (std::isfinite(h.real()) && std::isfinite(h.imag())) {
            H.push_back(h);
        } else {
            H.emplace_back(0.0, 0.0);
            ++sanitized;
        }
    }

    if (sanitized > 0) {
        logger()->debug("frequency_response: replaced {} non-finite point(s) with 0", sanitized);
    }
    return H;
}

FrequencyResponse frequency_response(const Coefficients& b,
                                     const Coefficients& a,
                                     double              fs,
                                     size_t              nPoints) {
    FrequencyResponse result;

    // k * (fs/2) / nPoints; Nyquist itself is not included
    result.freq.reserve(nPoints);
    for (size_t k = 0; k < nPoints; ++k) {
        result.freq.push_back(static_cast<double>(k) * (fs / 2.0) / static_cast<double>(nPoints));
    }

    auto H = evaluateOnUnitCircle(b, a, fs, result.freq);
    if (!H) {
        logger()->warn("frequency_response: {}; returning a zero response", H.error().reason);
        result.response.assign(nPoints, Complex(0.0, 0.0));
        return result;
    }
    result.response = std::move(*H);
    return result;
}

BodeResponse bode(const Coefficients& b, const Coefficients& a, double fs, size_t nPoints) {
    FrequencyResponse fr = frequency_response(b, a, fs, nPoints);

    BodeResponse result;
    result.freq = std::move(fr.freq);
    result.magnitude.reserve(fr.response.size());
    result.phase.reserve(fr.response.size());

    for (const auto& H : fr.response) {
        result.magnitude.push_back(mag2db(std::max(std::abs(H), 1e-300)));
        result.phase.push_back(rad2deg(std::arg(H)));
    }
    unwrap_phase_deg(result.phase);
    return result;
}

std::vector<double> apply_system(const Coefficients& b, const Coefficients& a, const std::vector<double>& input) {
    if (input.empty()) {
        return {};
    }
    return lfilter(b, a, input);
}

bool is_stable(const Coefficients& a) {
    for (const auto& pole : roots(a)) {
        if (std::abs(pole) >= 1.0) {
            return false;
        }
    }
    return true;
}

}  // namespace sigsys
