#pragma once

#include <optional>
#include <vector>

#include "LTI.hpp"
#include "config.hpp"
#include "types.hpp"

namespace sigsys {

/**
 * @brief  Direct-form recursive filter, the single "apply a system" kernel.
 *
 *     y[n] = (sum_{k=0}^{M} b[k] x[n-k] - sum_{k=1}^{N} a[k] y[n-k]) / a[0]
 *
 * with x and y read as 0 at negative indices.
 *
 * @throws InvalidCoefficients  if b or a is empty or a[0] is zero
 */
std::vector<double> lfilter(const Coefficients& b, const Coefficients& a, const std::vector<double>& x);

// Default response instants: kDefaultResponseWindow seconds at fs
std::vector<double> response_time(double fs);

/**
 * @brief  Impulse response.
 *
 * Static gain gives b0/a0 at sample 0. An improper system is filtered directly. A proper
 * system is simulated in state space, falling back to the filtering kernel on numerical failure.
 *
 * @param t     Sample instants; defaults to response_time(fs)
 */
ImpulseResponse impulse_response(const Coefficients&                b,
                                 const Coefficients&                a,
                                 double                             fs,
                                 std::optional<std::vector<double>> t = std::nullopt);

/**
 * @brief  Unit step response; same structure as impulse_response. Static gain gives a constant b0/a0.
 */
StepResponse step_response(const Coefficients&                b,
                           const Coefficients&                a,
                           double                             fs,
                           std::optional<std::vector<double>> t = std::nullopt);

/**
 * @brief  H(e^{jw}) at nPoints frequencies k * (fs/2) / nPoints, k = 0..nPoints-1.
 *
 * Non-finite values are replaced by 0. Never fails: if the evaluation itself cannot be
 * carried out the response is all zeros over the same grid.
 */
FrequencyResponse frequency_response(const Coefficients& b,
                                     const Coefficients& a,
                                     double              fs,
                                     size_t              nPoints = kDefaultFrequencyPoints);

// Magnitude (dB) and unwrapped phase (degrees) of frequency_response
BodeResponse bode(const Coefficients& b,
                  const Coefficients& a,
                  double              fs,
                  size_t              nPoints = kDefaultFrequencyPoints);

// Run the filtering kernel over an input signal. Empty input gives empty output for any b, a.
std::vector<double> apply_system(const Coefficients& b, const Coefficients& a, const std::vector<double>& input);

// All roots of a strictly inside the unit circle
bool is_stable(const Coefficients& a);

}  // namespace sigsys
