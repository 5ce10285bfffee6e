#include <algorithm>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "sigsys.hpp"

using namespace sigsys;

int main() {
    fmt::print("=== Impulse, Step and Pole-Zero Example ===\n\n");

    SystemAnalyzer analyzer(100.0);

    // H(z) = 1 / (1 - 0.9 z^-1)
    const auto leaky = analyzer.create_system(SystemType::Integrator, SystemParameters{.beta = 0.9});
    fmt::print("Leaky integrator:\n{}\n\n", leaky);

    // 1. Impulse response
    fmt::print("1. Impulse response:\n");
    const auto impulse = leaky.impulse();
    fmt::print("   {} samples over {:.2f} s\n", impulse.output.size(), impulse.time.back());
    fmt::print("   First outputs: [{:.4f}]\n\n", fmt::join(impulse.output.begin(), impulse.output.begin() + 5, ", "));

    // 2. Step response
    fmt::print("2. Step response:\n");
    const auto step = leaky.step();
    fmt::print("   Final value: {:.4f}\n\n", step.output.back());

    // 3. Custom system from coefficient text
    fmt::print("3. Custom resonator:\n");
    SystemParameters params;
    params.numerator   = "[1, 0, -1]";
    params.denominator = "[1, -1.8*cos(pi/5), 0.81]";
    const auto resonator = analyzer.create_system(SystemType::Custom, params);
    fmt::print("{}\n", resonator);

    const auto pz = resonator.pzmap();
    fmt::print("   Zeros:\n");
    for (size_t i = 0; i < pz.zeros.size(); ++i) {
        fmt::print("      z{} = {:.4f} + {:.4f}j\n", i + 1, pz.zeros[i].real(), pz.zeros[i].imag());
    }
    fmt::print("   Poles:\n");
    for (size_t i = 0; i < pz.poles.size(); ++i) {
        fmt::print("      p{} = {:.4f} + {:.4f}j (|p| = {:.3f})\n", i + 1, pz.poles[i].real(), pz.poles[i].imag(), std::abs(pz.poles[i]));
    }
    fmt::print("   Is stable: {}\n\n", resonator.is_stable() ? "Yes" : "No");

    // 4. Peak of the frequency response
    fmt::print("4. Resonance:\n");
    const auto fr   = resonator.freqresp();
    const auto peak = std::max_element(fr.response.begin(), fr.response.end(),
                                       [](const Complex& a, const Complex& b) { return std::abs(a) < std::abs(b); });
    const auto k    = static_cast<size_t>(peak - fr.response.begin());
    fmt::print("   Peak |H| = {:.3f} at {:.2f} Hz\n\n", std::abs(*peak), fr.freq[k]);

    // 5. Unstable denominator
    fmt::print("5. Stability check:\n");
    fmt::print("   a = [1, -1.1] stable: {}\n", is_stable({1.0, -1.1}) ? "Yes" : "No");

    fmt::print("\n=== Example Complete ===\n");
    return 0;
}
