#include "ss.hpp"

#include <cmath>

#include <fmt/core.h>

#include "config.hpp"
#include "errors.hpp"

namespace sigsys {

static void validateStateSpaceMatrices(const Matrix& A, const Matrix& B, const Matrix& C, const Matrix& D) {
    if (A.rows() != A.cols()) {
        throw std::invalid_argument("StateSpace: A must be square");
    }
    if (B.rows() != A.rows() || B.cols() != 1) {
        throw std::invalid_argument("StateSpace: B must be (A.rows(), 1)");
    }
    if (C.cols() != A.cols() || C.rows() != 1) {
        throw std::invalid_argument("StateSpace: C must be (1, A.cols())");
    }
    if (D.rows() != 1 || D.cols() != 1) {
        throw std::invalid_argument("StateSpace: D must be (1, 1)");
    }
}

StateSpace::StateSpace(const Matrix& A, const Matrix& B, const Matrix& C, const Matrix& D, double fs)
    : A(A), B(B), C(C), D(D), fs(fs) {
    validateStateSpaceMatrices(A, B, C, D);
}

StateSpace::StateSpace(Matrix&& A, Matrix&& B, Matrix&& C, Matrix&& D, double fs)
    : A(std::move(A)), B(std::move(B)), C(std::move(C)), D(std::move(D)), fs(fs) {
    validateStateSpaceMatrices(this->A, this->B, this->C, this->D);
}

std::vector<Pole> StateSpace::poles() const {
    if (A.rows() == 0) {
        return {};
    }
    const auto& eigenvalues = A.eigenvalues();
    return std::vector<Pole>(eigenvalues.data(), eigenvalues.data() + eigenvalues.size());
}

bool StateSpace::is_stable() const {
    // Discrete: unstable if any |eigenvalue| >= 1
    for (const auto& p : poles()) {
        if (std::abs(p) >= 1.0) {
            return false;
        }
    }
    return true;
}

std::vector<double> StateSpace::simulate(const std::vector<double>& u) const {
    std::vector<double> y;
    y.reserve(u.size());

    ColVec x = ColVec::Zero(A.rows());  // Start from zero initial conditions
    for (double uk : u) {
        y.push_back(output(x, uk));
        x = next(x, uk);
    }
    return y;
}

bool StateSpace::allFinite() const {
    return A.allFinite() && B.allFinite() && C.allFinite() && D.allFinite();
}

Result<StateSpace> realize(const Coefficients& b, const Coefficients& a, double fs) {
    if (b.empty() || a.empty()) {
        return numeric_failure("empty coefficient array");
    }
    if (b.size() > a.size()) {
        return numeric_failure("improper system has no state-space realization");
    }
    const double a0 = a[0];
    if (std::abs(a0) <= kCoefficientTolerance) {
        return numeric_failure(fmt::format("leading denominator coefficient {} is zero", a0));
    }

    const int n = static_cast<int>(a.size()) - 1;  // Order of the system

    // Normalize by a[0]; pad the numerator to the denominator length
    std::vector<double> norm_num(a.size(), 0.0);
    std::vector<double> norm_den(a.size());
    for (size_t i = 0; i < b.size(); ++i) {
        norm_num[i] = b[i] / a0;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        norm_den[i] = a[i] / a0;
    }

    Matrix A = Matrix::Zero(n, n);
    Matrix B = Matrix::Zero(n, 1);
    Matrix C = Matrix::Zero(1, n);
    Matrix D = Matrix::Constant(1, 1, norm_num[0]);  // Direct feedthrough

    // Companion form: state i carries z^i / a(z)
    for (int i = 0; i < n - 1; ++i) {
        A(i, i + 1) = 1.0;
    }
    for (int i = 0; i < n; ++i) {
        A(n - 1, i) = -norm_den[n - i];
        C(0, i)     = norm_num[n - i] - D(0, 0) * norm_den[n - i];
    }
    if (n > 0) {
        B(n - 1, 0) = 1.0;
    }

    StateSpace sys{std::move(A), std::move(B), std::move(C), std::move(D), fs};
    if (!sys.allFinite()) {
        return numeric_failure("state-space realization has non-finite entries");
    }
    return sys;
}

}  // namespace sigsys
