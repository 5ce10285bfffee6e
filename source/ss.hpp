#pragma once

#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace sigsys {

/**
 * @brief Discrete-time single-input single-output state-space model.
 *
 *     x[k+1] = A*x[k] + B*u[k]
 *     y[k]   = C*x[k] + D*u[k]
 */
class StateSpace {
   public:
    Matrix A = {}, B = {}, C = {}, D = {};
    double fs = 1.0;

    StateSpace(const Matrix& A, const Matrix& B, const Matrix& C, const Matrix& D, double fs);
    StateSpace(Matrix&& A, Matrix&& B, Matrix&& C, Matrix&& D, double fs);

    size_t order() const { return static_cast<size_t>(A.rows()); }

    std::vector<Pole> poles() const;
    bool              is_stable() const;

    // State-space output equation: y = Cx + Du
    double output(const ColVec& x, double u) const { return (C * x)(0) + D(0, 0) * u; }

    // State update: x[k+1] = Ax + Bu
    ColVec next(const ColVec& x, double u) const { return A * x + B * u; }

    /**
     * @brief  Simulate from zero initial state.
     *
     * @param u     Input sequence
     * @return      Output sequence, same length as u
     */
    std::vector<double> simulate(const std::vector<double>& u) const;

    // True if every matrix entry is finite
    bool allFinite() const;
};

/**
 * @brief  Realize b(z^-1)/a(z^-1) in controllable canonical form.
 *
 * The numerator is zero-padded to the denominator length. Fails (without throwing) for an
 * improper system (len(b) > len(a)), an empty array, a near-zero a[0] or non-finite matrices.
 */
Result<StateSpace> realize(const Coefficients& b, const Coefficients& a, double fs);

}  // namespace sigsys
