#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "sigsys.hpp"

using namespace sigsys;

int main() {
    fmt::print("=== Signal Generation Example ===\n\n");

    SignalGenerator gen(1000.0, 1.0);

    // Example 1: Every signal type with default parameters
    fmt::print("1. Default signals ({} samples at {} Hz):\n", gen.time().size(), gen.fs());
    for (int i = 0; i <= static_cast<int>(SignalType::CustomFunction); ++i) {
        const auto   type   = static_cast<SignalType>(i);
        const Signal signal = gen.generate(type);
        const auto [lo, hi] = std::minmax_element(signal.samples.begin(), signal.samples.end());
        fmt::print("   {:<18} min {:7.3f}, max {:7.3f}\n", type, *lo, *hi);
    }
    fmt::print("\n");

    // Example 2: Noisy tone cleaned by a low-pass filter
    fmt::print("2. 5 Hz tone with a 200 Hz interferer through a 30 Hz low-pass:\n");
    const Signal noisy = gen.generate(CustomFunction{.function = "sin(2*pi*5*t) + 0.5*sin(2*pi*200*t)"});
    const Signal clean = gen.generate(Sine{.frequency = 5.0});

    SystemAnalyzer analyzer(gen.fs());
    const auto     lp       = analyzer.create_system(LowPass{.cutoff = 30.0, .order = 4});
    const auto     filtered = lp.apply(noisy.samples);

    std::vector<double> before, after;
    for (size_t n = 0; n < clean.samples.size(); ++n) {
        before.push_back(noisy.samples[n] - clean.samples[n]);
        after.push_back(filtered[n] - clean.samples[n]);
    }
    fmt::print("   SNR before: {:.2f} dB\n", calculate_snr(clean.samples, before));
    fmt::print("   SNR after:  {:.2f} dB (includes filter delay)\n\n", calculate_snr(clean.samples, after));

    // Example 3: Spectrum of a square wave
    fmt::print("3. Spectrum of a 10 Hz square wave:\n");
    const Signal   square   = gen.generate(Square{.frequency = 10.0});
    const Spectrum spectrum = fft(square.samples, gen.fs());
    const auto     mag      = magnitude(spectrum);
    for (size_t k = 10; k <= 70; k += 10) {
        fmt::print("   f = {:5.1f} Hz: |X| = {:8.2f}\n", spectrum.freq[k], mag[k]);
    }
    fmt::print("\n");

    // Example 4: Invalid custom expression
    fmt::print("4. Rejected expression:\n");
    try {
        gen.generate(CustomFunction{.function = "sin(2*pi*t) + import(t)"});
    } catch (const InvalidExpression& e) {
        fmt::print("   {} (at offset {})\n", e.what(), e.position());
    }

    fmt::print("\n=== Signal Generation Example Complete ===\n");
    return 0;
}
