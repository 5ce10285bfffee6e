#pragma once

#include <complex>
#include <initializer_list>
#include <vector>

#include <Eigen/Dense>

namespace sigsys {

using Matrix  = Eigen::MatrixXd;
using Complex = std::complex<double>;

using Pole = Complex;
using Zero = Complex;

// Coefficients are stored in ascending powers of z^-1 (index 0 = z^0)
using Coefficients = std::vector<double>;

// Column vector that supports initializer list syntax
struct ColVec : public Eigen::VectorXd {
    using Eigen::VectorXd::VectorXd;  // Inherit constructors

    ColVec(std::initializer_list<double> list)
        : Eigen::VectorXd(list.size()) {
        Eigen::Index i = 0;
        for (double val : list) (*this)[i++] = val;
    }
};

}  // namespace sigsys

namespace Eigen {
namespace internal {
    template <>
    struct traits<sigsys::ColVec> : traits<Eigen::VectorXd> {};
}  // namespace internal

}  // namespace Eigen
