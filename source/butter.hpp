#pragma once

#include "tf.hpp"
#include "zpk.hpp"

namespace sigsys {

enum class ButterKind {
    LowPass,
    HighPass,
};

/**
 * @brief  Analog Butterworth prototype of the given order.
 *
 * Poles exp(j*pi*(2k + N + 1) / (2N)), k = 0..N-1, on the left half of the unit circle; no zeros, gain 1.
 */
ZeroPoleGain butter_prototype(int order);

// s -> s / wo
ZeroPoleGain lp2lp_zpk(const ZeroPoleGain& proto, double wo);

// s -> wo / s; adds zeros at the origin so the system stays proper
ZeroPoleGain lp2hp_zpk(const ZeroPoleGain& proto, double wo);

// s -> (s^2 + wo^2) / (s * bw); doubles the order
ZeroPoleGain lp2bp_zpk(const ZeroPoleGain& proto, double wo, double bw);

/**
 * @brief  Bilinear transform of an analog zpk to a discrete one.
 *
 * z = (2fs + s) / (2fs - s). Zeros at infinity map to z = -1.
 *
 * @param analog    Continuous system (fs empty)
 * @param fs        Design sampling rate of the transform
 */
ZeroPoleGain bilinear_zpk(const ZeroPoleGain& analog, double fs);

/**
 * @brief  Digital Butterworth low-pass or high-pass filter.
 *
 * @param order     Filter order, >= 1
 * @param Wn        Cutoff as a fraction of Nyquist, 0 < Wn < 1
 * @param kind      Low-pass or high-pass
 * @param fs        Sampling rate attached to the result
 * @return TransferFunction with order+1 coefficients each and a[0] == 1
 *
 * @throws InvalidArgument  for order < 1 or Wn outside (0, 1)
 */
TransferFunction butter(int order, double Wn, ButterKind kind = ButterKind::LowPass, double fs = kDefaultSamplingRate);

/**
 * @brief  Digital Butterworth band-pass filter between normalized edges low < high.
 *
 * @return TransferFunction with 2*order+1 coefficients each and a[0] == 1
 *
 * @throws InvalidArgument  for order < 1 or edges outside 0 < low < high < 1
 */
TransferFunction butter_bandpass(int order, double low, double high, double fs = kDefaultSamplingRate);

}  // namespace sigsys
