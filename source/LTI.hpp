#pragma once

#include <optional>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace sigsys {

// Forward declarations
class TransferFunction;
class ZeroPoleGain;

// Data structures for frequency and time responses
struct FrequencyResponse {
    std::vector<std::complex<double>> response;  // Complex frequency response
    std::vector<double>               freq;      // Frequency points in Hz, within [0, fs/2]
};

struct BodeResponse {
    std::vector<double> freq;       // Frequency in Hz
    std::vector<double> magnitude;  // Magnitude in dB
    std::vector<double> phase;      // Phase in degrees, unwrapped
};

struct TimeResponse {
    std::vector<double> time;
    std::vector<double> output;
};

using StepResponse    = TimeResponse;
using ImpulseResponse = TimeResponse;

// Roots of the numerator (zeros) and denominator (poles) polynomials
struct PoleZeroSet {
    std::vector<Zero> zeros;
    std::vector<Pole> poles;
};

/**
 * @brief Abstract base class for single-input single-output LTI system representations.
 *
 * Analysis defaults to the TransferFunction form; subclasses override where they have a
 * more direct route. Every response query requires a discrete-time system.
 */
class LTI {
   public:
    virtual ~LTI() = default;

    /**
     * @brief  Get the complex poles of the system.
     */
    virtual std::vector<Pole> poles() const;

    /**
     * @brief  Get the complex zeros of the system.
     */
    virtual std::vector<Zero> zeros() const;

    PoleZeroSet pzmap() const { return PoleZeroSet{zeros(), poles()}; }

    /**
     * @brief  Check if the system is stable.
     *
     * Discrete: all poles strictly inside the unit circle. Continuous: all poles in the open left half plane.
     */
    virtual bool is_stable() const;

    /**
     * @brief  Compute the impulse response of the system.
     *
     * @param t     Sample instants; defaults to kDefaultResponseWindow seconds at fs
     * @return ImpulseResponse
     */
    virtual ImpulseResponse impulse(std::optional<std::vector<double>> t = std::nullopt) const;

    /**
     * @brief  Compute the unit step response of the system.
     *
     * @param t     Sample instants; defaults to kDefaultResponseWindow seconds at fs
     * @return StepResponse
     */
    virtual StepResponse step(std::optional<std::vector<double>> t = std::nullopt) const;

    /**
     * @brief  Compute the frequency response on a linear grid over [0, fs/2).
     *
     * @param nPoints   Number of frequency points
     * @return FrequencyResponse
     */
    virtual FrequencyResponse freqresp(size_t nPoints = kDefaultFrequencyPoints) const;

    /**
     * @brief  Compute the Bode plot data (dB magnitude, unwrapped phase in degrees).
     */
    virtual BodeResponse bode(size_t nPoints = kDefaultFrequencyPoints) const;

    virtual TransferFunction toTransferFunction() const = 0;

    bool isDiscrete() const { return fs.has_value(); }
    bool isContinuous() const { return !fs.has_value(); }

    std::optional<double> fs = {};  // Sampling rate in Hz; nullopt for continuous
};

}  // namespace sigsys
