#include <algorithm>
#include <cmath>
#include <numbers>

#include <doctest/doctest.h>

#include "sigsys.hpp"

using namespace sigsys;

TEST_CASE("FFT") {
    SUBCASE("Bin ordering of fftfreq") {
        const auto even = fftfreq(4, 0.25);
        CHECK(even == std::vector<double>{0.0, 1.0, -2.0, -1.0});

        const auto odd = fftfreq(5, 1.0);
        REQUIRE(odd.size() == 5);
        CHECK(odd[2] == doctest::Approx(0.4));
        CHECK(odd[3] == doctest::Approx(-0.4));
    }

    SUBCASE("Spectrum of a pure tone") {
        const double        fs = 64.0;
        std::vector<double> x;
        for (int n = 0; n < 64; ++n) {
            x.push_back(std::cos(2.0 * std::numbers::pi * 8.0 * n / fs));
        }

        const Spectrum spectrum = fft(x, fs);
        REQUIRE(spectrum.bins.size() == 64);
        REQUIRE(spectrum.freq.size() == 64);
        CHECK(spectrum.freq[8] == doctest::Approx(8.0));
        CHECK(spectrum.freq[56] == doctest::Approx(-8.0));

        const auto mag = magnitude(spectrum);
        CHECK(mag[8] == doctest::Approx(32.0));
        CHECK(mag[56] == doctest::Approx(32.0));
        CHECK(mag[0] == doctest::Approx(0.0).epsilon(1e-9));
        CHECK(mag[9] == doctest::Approx(0.0).epsilon(1e-9));
    }

    SUBCASE("Direct DFT definition") {
        const std::vector<double> x = {1.0, 2.0, 0.0, -1.0, 3.0};
        const Spectrum            spectrum = fft(x, 5.0);
        for (size_t k = 0; k < x.size(); ++k) {
            Complex expected = 0.0;
            for (size_t n = 0; n < x.size(); ++n) {
                expected += x[n] * std::polar(1.0, -2.0 * std::numbers::pi * k * n / x.size());
            }
            CHECK(spectrum.bins[k].real() == doctest::Approx(expected.real()));
            CHECK(spectrum.bins[k].imag() == doctest::Approx(expected.imag()));
        }
        CHECK(phase(spectrum)[0] == doctest::Approx(0.0));
    }

    SUBCASE("ifft reconstructs the signal") {
        const std::vector<double> x = {0.3, -1.2, 4.0, 2.5, 0.0, -0.7, 1.1};
        const auto                y = ifft(fft(x, 100.0).bins);
        REQUIRE(y.size() == x.size());
        for (size_t n = 0; n < x.size(); ++n) {
            CHECK(y[n] == doctest::Approx(x[n]));
        }
    }

    SUBCASE("Generated signal round trip") {
        SignalGenerator gen(200.0, 0.5);
        const Signal    signal = gen.generate(Triangle{.amplitude = 2.0, .frequency = 3.0, .width = 0.3});
        const auto      y      = ifft(fft(signal.samples, gen.fs()).bins);
        for (size_t n = 0; n < y.size(); n += 9) {
            CHECK(y[n] == doctest::Approx(signal.samples[n]));
        }
    }

    SUBCASE("Empty input") {
        const Spectrum spectrum = fft({}, 100.0);
        CHECK(spectrum.bins.empty());
        CHECK(spectrum.freq.empty());
        CHECK(ifft({}).empty());
    }
}

TEST_CASE("Laplace and Z evaluators") {
    SUBCASE("Laplace") {
        // H(s) = 2 (s + 1) / ((s + 2)(s + 3))
        const std::vector<Pole> poles = {Pole(-2.0), Pole(-3.0)};
        const std::vector<Zero> zeros = {Zero(-1.0)};
        CHECK(laplace_evaluate(0.0, poles, zeros, 2.0).real() == doctest::Approx(2.0 / 6.0));

        const Complex H = laplace_evaluate(Complex(0.0, 1.0), poles, zeros, 2.0);
        const Complex s(0.0, 1.0);
        const Complex expected = 2.0 * (s + 1.0) / ((s + 2.0) * (s + 3.0));
        CHECK(H.real() == doctest::Approx(expected.real()));
        CHECK(H.imag() == doctest::Approx(expected.imag()));
    }

    SUBCASE("Z transform") {
        // H(z) = (1 + z^-1) / (1 - 0.5 z^-1)
        CHECK(z_evaluate(1.0, {1.0, 1.0}, {1.0, -0.5}).real() == doctest::Approx(4.0));
        CHECK(std::abs(z_evaluate(-1.0, {1.0, 1.0}, {1.0, -0.5})) == doctest::Approx(0.0));

        const Complex z = std::polar(1.0, 0.7);
        const Complex H = z_evaluate(z, {1.0, 1.0}, {1.0, -0.5});
        const Complex expected = (1.0 + 1.0 / z) / (1.0 - 0.5 / z);
        CHECK(H.real() == doctest::Approx(expected.real()));
        CHECK(H.imag() == doctest::Approx(expected.imag()));
    }
}

TEST_CASE("Polynomial roots") {
    SUBCASE("Real roots") {
        auto r = roots({1.0, -3.0, 2.0});
        REQUIRE(r.size() == 2);
        std::sort(r.begin(), r.end(), [](const Complex& a, const Complex& b) { return a.real() < b.real(); });
        CHECK(r[0].real() == doctest::Approx(1.0));
        CHECK(r[1].real() == doctest::Approx(2.0));
    }

    SUBCASE("Complex pair") {
        const auto r = roots({1.0, 0.0, 1.0});
        REQUIRE(r.size() == 2);
        for (const auto& root : r) {
            CHECK(std::abs(root) == doctest::Approx(1.0));
            CHECK(root.real() == doctest::Approx(0.0));
        }
    }

    SUBCASE("Leading and trailing zeros") {
        const auto r = roots({0.0, 2.0, -1.0, 0.0});
        REQUIRE(r.size() == 2);
        CHECK(r.back() == Complex(0.0, 0.0));
        CHECK(r.front().real() == doctest::Approx(0.5));
    }

    SUBCASE("Constant polynomial has no roots") {
        CHECK(roots({3.0}).empty());
        CHECK(roots({}).empty());
        CHECK(roots({0.0, 0.0}).empty());
    }

    SUBCASE("Pole-zero extraction of a designed filter") {
        const TransferFunction lp = butter(3, 0.2);
        const PoleZeroSet      pz = pole_zero(lp.num(), lp.den());
        CHECK(pz.zeros.size() == 3);
        CHECK(pz.poles.size() == 3);
        for (const auto& z : pz.zeros) {
            CHECK(z.real() == doctest::Approx(-1.0).epsilon(1e-4));
        }
        for (const auto& p : pz.poles) {
            CHECK(std::abs(p) < 1.0);
        }

        const PoleZeroSet members = lp.pzmap();
        CHECK(members.poles.size() == pz.poles.size());
    }
}
