#pragma once

#include <cstddef>
#include <vector>

#include "LTI.hpp"
#include "types.hpp"

namespace sigsys {

// DFT bins in standard FFT order together with their frequencies
struct Spectrum {
    std::vector<double>               freq;  // Hz, negative frequencies folded to the tail
    std::vector<std::complex<double>> bins;  // X[k] = sum_n x[n] e^{-2 pi i k n / N}
};

/**
 * @brief  Sample frequencies of an N-point DFT with sample spacing d.
 *
 * k / (N d) for k < ceil(N/2), (k - N) / (N d) otherwise.
 */
std::vector<double> fftfreq(size_t n, double d);

/**
 * @brief  Discrete Fourier transform of a real signal.
 *
 * @param signal    Real samples
 * @param fs        Sampling rate in Hz
 * @return Spectrum with N bins; empty for an empty signal
 */
Spectrum fft(const std::vector<double>& signal, double fs);

// Inverse DFT, keeping the real part
std::vector<double> ifft(const std::vector<std::complex<double>>& bins);

std::vector<double> magnitude(const Spectrum& spectrum);
std::vector<double> phase(const Spectrum& spectrum);

// H(s) = gain * prod(s - zeros) / prod(s - poles)
Complex laplace_evaluate(Complex s, const std::vector<Pole>& poles, const std::vector<Zero>& zeros, double gain = 1.0);

// H(z) = sum_k b[k] z^-k / sum_k a[k] z^-k
Complex z_evaluate(Complex z, const Coefficients& b, const Coefficients& a);

/**
 * @brief  Roots of a polynomial given highest power first.
 *
 * Leading zeros are ignored, trailing zeros give roots at the origin, and the remaining
 * roots are the eigenvalues of the companion matrix. A constant polynomial has no roots.
 */
std::vector<Complex> roots(const std::vector<double>& coeffs);

// zeros = roots(b), poles = roots(a)
PoleZeroSet pole_zero(const Coefficients& b, const Coefficients& a);

}  // namespace sigsys
