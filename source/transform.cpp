#include "transform.hpp"

#include <cmath>

#include <unsupported/Eigen/FFT>

namespace sigsys {

std::vector<double> fftfreq(size_t n, double d) {
    std::vector<double> freq;
    freq.reserve(n);

    const double scale = 1.0 / (static_cast<double>(n) * d);
    for (size_t k = 0; k < n; ++k) {
        // Bins at or past N/2 hold the negative frequencies
        const double index = (2 * k < n) ? static_cast<double>(k) : static_cast<double>(k) - static_cast<double>(n);
        freq.push_back(index * scale);
    }
    return freq;
}

Spectrum fft(const std::vector<double>& signal, double fs) {
    Spectrum spectrum;
    if (signal.empty()) {
        return spectrum;
    }

    // Full spectrum: Eigen reflects the real-input half spectrum by default
    Eigen::FFT<double> engine;
    engine.fwd(spectrum.bins, signal);
    spectrum.freq = fftfreq(signal.size(), 1.0 / fs);
    return spectrum;
}

std::vector<double> ifft(const std::vector<std::complex<double>>& bins) {
    if (bins.empty()) {
        return {};
    }

    // Complex inverse so arbitrary (non-Hermitian) input keeps the exact real part
    Eigen::FFT<double>                engine;
    std::vector<std::complex<double>> series;
    engine.inv(series, bins);

    std::vector<double> result;
    result.reserve(series.size());
    for (const auto& value : series) {
        result.push_back(value.real());
    }
    return result;
}

std::vector<double> magnitude(const Spectrum& spectrum) {
    std::vector<double> result;
    result.reserve(spectrum.bins.size());
    for (const auto& X : spectrum.bins) {
        result.push_back(std::abs(X));
    }
    return result;
}

std::vector<double> phase(const Spectrum& spectrum) {
    std::vector<double> result;
    result.reserve(spectrum.bins.size());
    for (const auto& X : spectrum.bins) {
        result.push_back(std::arg(X));
    }
    return result;
}

Complex laplace_evaluate(Complex s, const std::vector<Pole>& poles, const std::vector<Zero>& zeros, double gain) {
    Complex numerator   = gain;
    Complex denominator = 1.0;

    for (const auto& zero : zeros) {
        numerator *= (s - zero);
    }
    for (const auto& pole : poles) {
        denominator *= (s - pole);
    }
    return numerator / denominator;
}

// sum_k c[k] w^k by Horner's method, with w = z^-1
static Complex polyvalInverse(const Coefficients& c, Complex w) {
    Complex acc = 0.0;
    for (auto it = c.rbegin(); it != c.rend(); ++it) {
        acc = acc * w + *it;
    }
    return acc;
}

Complex z_evaluate(Complex z, const Coefficients& b, const Coefficients& a) {
    const Complex w = 1.0 / z;
    return polyvalInverse(b, w) / polyvalInverse(a, w);
}

std::vector<Complex> roots(const std::vector<double>& coeffs) {
    // Strip leading zeros
    size_t first = 0;
    while (first < coeffs.size() && coeffs[first] == 0.0) {
        ++first;
    }
    if (first == coeffs.size()) {
        return {};
    }

    // Trailing zeros are roots at the origin
    size_t last = coeffs.size() - 1;
    while (last > first && coeffs[last] == 0.0) {
        --last;
    }
    const size_t at_origin = coeffs.size() - 1 - last;

    const int n = static_cast<int>(last - first);  // Degree of the remaining polynomial

    std::vector<Complex> result;
    result.reserve(static_cast<size_t>(n) + at_origin);

    if (n > 0) {
        // Companion matrix for c_0*x^n + c_1*x^(n-1) + ... + c_n:
        // [  -c_1/c_0   -c_2/c_0  ...  -c_n/c_0 ]
        // [    1          0       ...     0     ]
        // [   ...                               ]
        // [    0          0       ...     1   0 ]
        Matrix companion = Matrix::Zero(n, n);

        // Fill first row with normalized coefficients
        for (int i = 0; i < n; ++i) {
            companion(0, i) = -coeffs[first + i + 1] / coeffs[first];
        }

        // Fill subdiagonal with 1s
        for (int i = 1; i < n; ++i) {
            companion(i, i - 1) = 1.0;
        }

        const Eigen::VectorXcd eigenvalues = companion.eigenvalues();
        result.assign(eigenvalues.data(), eigenvalues.data() + eigenvalues.size());
    }

    result.insert(result.end(), at_origin, Complex(0.0, 0.0));
    return result;
}

PoleZeroSet pole_zero(const Coefficients& b, const Coefficients& a) {
    return PoleZeroSet{roots(b), roots(a)};
}

}  // namespace sigsys
