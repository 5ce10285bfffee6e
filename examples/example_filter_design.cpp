#include <cmath>
#include <complex>
#include <numbers>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "sigsys.hpp"

using namespace sigsys;

int main() {
    fmt::print("=== Filter Design Example ===\n\n");

    const double   fs = 1000.0;
    SystemAnalyzer analyzer(fs);

    // Example 1: Butterworth low-pass
    fmt::print("1. 4th order Butterworth low-pass, fc = 50 Hz:\n");
    const auto lp = analyzer.create_system(LowPass{.cutoff = 50.0, .order = 4});
    fmt::print("{}\n", lp);
    fmt::print("   b = [{:.6g}]\n", fmt::join(lp.num(), ", "));
    fmt::print("   a = [{:.6g}]\n", fmt::join(lp.den(), ", "));
    fmt::print("   Is stable: {}\n\n", lp.is_stable() ? "Yes" : "No");

    // Example 2: Same filter in zero-pole-gain form
    fmt::print("2. Zero-pole-gain form:\n");
    fmt::print("{}\n\n", zpk(lp));

    // Example 3: Every system type by display name
    fmt::print("3. Systems by name:\n");
    SystemParameters params;
    params.cutoff      = 100.0;
    params.lowcut      = 40.0;
    params.highcut     = 120.0;
    params.order       = 2;
    params.numerator   = "[0.2, 0.2]";
    params.denominator = "[1, -0.6]";
    for (int i = 0; i <= static_cast<int>(SystemType::Custom); ++i) {
        const auto type = static_cast<SystemType>(i);
        const auto sys  = analyzer.create_system(to_string(type), params);
        fmt::print("   {:<18} order {}, DC gain {:.4f}\n",
                   type,
                   sys.den().size() - 1,
                   std::abs(sys.evaluate(1.0)));
    }
    fmt::print("\n");

    // Example 4: Frequency response
    fmt::print("4. Bode data for the low-pass filter:\n");
    const auto bd = lp.bode(512);
    for (size_t k = 0; k < bd.freq.size(); k += 64) {
        fmt::print("   f = {:7.2f} Hz: {:8.2f} dB, {:8.2f} deg\n", bd.freq[k], bd.magnitude[k], bd.phase[k]);
    }
    fmt::print("\n");

    // Example 5: Band-pass edges outside the valid range fall back to 5-15 Hz
    fmt::print("5. Band-pass with invalid edges:\n");
    set_log_level(spdlog::level::warn);
    const auto bp = analyzer.create_system(BandPass{.lowcut = 600.0, .highcut = 700.0, .order = 2});
    fmt::print("   Peak gain near 8.7 Hz: {:.4f}\n", std::abs(bp.evaluate(std::polar(1.0, 2.0 * std::numbers::pi * 8.66 / fs))));

    fmt::print("\n=== Filter Design Example Complete ===\n");
    return 0;
}
