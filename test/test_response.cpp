#include <cmath>
#include <numbers>

#include <doctest/doctest.h>

#include "sigsys.hpp"

using namespace sigsys;

TEST_CASE("Filtering kernel") {
    SUBCASE("Recurrence with a[0] normalization") {
        const auto y = lfilter({2.0}, {2.0, -1.0}, {1.0, 0.0, 0.0, 0.0});
        REQUIRE(y.size() == 4);
        CHECK(y[0] == doctest::Approx(1.0));
        CHECK(y[1] == doctest::Approx(0.5));
        CHECK(y[2] == doctest::Approx(0.25));
        CHECK(y[3] == doctest::Approx(0.125));
    }

    SUBCASE("FIR taps appear in the impulse response") {
        const auto y = lfilter({1.0, 2.0, 3.0}, {1.0}, {1.0, 0.0, 0.0, 0.0, 0.0});
        CHECK(y == std::vector<double>{1.0, 2.0, 3.0, 0.0, 0.0});
    }

    SUBCASE("Moving average passes a constant after the transient") {
        SystemAnalyzer analyzer;
        const auto     ma = analyzer.create_system(MovingAverage{.window_size = 5});

        const std::vector<double> constant(200, 3.0);
        const auto                y = ma.apply(constant);
        REQUIRE(y.size() == constant.size());
        for (size_t n = 4; n < y.size(); ++n) {
            CHECK(y[n] == doctest::Approx(3.0));
        }
        CHECK(y[0] == doctest::Approx(0.6));
    }

    SUBCASE("Empty input gives empty output for any coefficients") {
        CHECK(apply_system({1.0}, {1.0}, {}).empty());
        CHECK(apply_system({}, {}, {}).empty());
        CHECK(apply_system({1.0}, {0.0}, {}).empty());
    }

    SUBCASE("Unusable coefficients throw") {
        CHECK_THROWS_AS(lfilter({}, {1.0}, {1.0}), InvalidCoefficients);
        CHECK_THROWS_AS(lfilter({1.0}, {}, {1.0}), InvalidCoefficients);
        CHECK_THROWS_AS(apply_system({1.0}, {0.0, 1.0}, {1.0, 2.0}), InvalidCoefficients);
    }
}

TEST_CASE("Impulse response") {
    SUBCASE("Static gain is a scaled unit impulse") {
        const auto response = impulse_response({5.0}, {2.0}, 1000.0);
        REQUIRE(response.time.size() == 2000);
        REQUIRE(response.output.size() == 2000);
        CHECK(response.output[0] == doctest::Approx(2.5));
        for (size_t n = 1; n < response.output.size(); ++n) {
            CHECK(response.output[n] == 0.0);
        }
        CHECK(response.time[1] == doctest::Approx(0.001));
    }

    SUBCASE("Improper system uses the kernel directly") {
        const auto response = impulse_response({1.0, 1.0, 1.0}, {1.0, -0.5}, 10.0);
        REQUIRE(response.output.size() == 20);
        CHECK(response.output[0] == doctest::Approx(1.0));
        CHECK(response.output[1] == doctest::Approx(1.5));
        CHECK(response.output[2] == doctest::Approx(1.75));
        CHECK(response.output[3] == doctest::Approx(0.875));
    }

    SUBCASE("State-space and kernel responses agree for proper systems") {
        const TransferFunction systems[] = {
            butter(4, 0.1),
            butter(3, 0.4, ButterKind::HighPass),
            butter_bandpass(2, 0.05, 0.2),
            TransferFunction({1.0, -1.0}, {1.0, -0.95}),
            TransferFunction({0.5}, {1.0, -0.2, 0.1}),
        };

        for (const auto& sys : systems) {
            const auto response = sys.impulse();
            REQUIRE(response.output.size() == 2000);

            std::vector<double> unit(2000, 0.0);
            unit[0]              = 1.0;
            const auto reference = lfilter(sys.num(), sys.den(), unit);
            for (size_t n = 0; n < reference.size(); n += 7) {
                CHECK(response.output[n] == doctest::Approx(reference[n]).epsilon(1e-9));
            }
        }
    }

    SUBCASE("Explicit time vector sets the length") {
        const auto response = impulse_response({1.0}, {1.0, -0.5}, 100.0, std::vector<double>{0.0, 0.01, 0.02});
        REQUIRE(response.output.size() == 3);
        CHECK(response.output[2] == doctest::Approx(0.25));

        const auto empty = impulse_response({1.0}, {1.0, -0.5}, 100.0, std::vector<double>{});
        CHECK(empty.output.empty());
    }

    SUBCASE("Unusable coefficients throw") {
        CHECK_THROWS_AS(impulse_response({1.0}, {0.0, 1.0}, 100.0), InvalidCoefficients);
        CHECK_THROWS_AS(impulse_response({}, {1.0}, 100.0), InvalidCoefficients);
        CHECK_THROWS_AS(impulse_response({1.0}, {1.0, 0.5}, 0.0), InvalidArgument);
    }
}

TEST_CASE("Step response") {
    SUBCASE("Static gain is constant") {
        const auto response = step_response({3.0}, {1.0}, 50.0);
        REQUIRE(response.output.size() == 100);
        for (double v : response.output) {
            CHECK(v == doctest::Approx(3.0));
        }
    }

    SUBCASE("Leaky integrator") {
        const auto response = step_response({1.0}, {1.0, -0.5}, 100.0);
        for (size_t n = 0; n < 10; ++n) {
            CHECK(response.output[n] == doctest::Approx(2.0 * (1.0 - std::pow(0.5, static_cast<double>(n + 1)))));
        }
    }

    SUBCASE("Leaky differentiator decays geometrically") {
        SystemAnalyzer analyzer(100.0);
        const auto     tf       = analyzer.create_system(Differentiator{.alpha = 0.9});
        const auto     response = tf.step();
        for (size_t n = 0; n < 10; ++n) {
            CHECK(response.output[n] == doctest::Approx(std::pow(0.9, static_cast<double>(n))));
        }
    }

    SUBCASE("Butterworth low-pass settles at unity") {
        const auto response = butter(4, 0.1).step();
        CHECK(response.output.back() == doctest::Approx(1.0));
    }

    SUBCASE("Improper system uses the kernel directly") {
        const auto response = step_response({1.0, 2.0}, {1.0}, 10.0);
        CHECK(response.output[0] == doctest::Approx(1.0));
        CHECK(response.output[5] == doctest::Approx(3.0));
    }
}

TEST_CASE("Frequency response") {
    SUBCASE("Grid length and spacing") {
        const auto fr = frequency_response({1.0}, {1.0, -0.5}, 1000.0, 256);
        REQUIRE(fr.freq.size() == 256);
        REQUIRE(fr.response.size() == 256);
        CHECK(fr.freq[0] == 0.0);
        CHECK(fr.freq[1] == doctest::Approx(500.0 / 256.0));
        CHECK(fr.freq.back() < 500.0);
        for (size_t k = 1; k < fr.freq.size(); ++k) {
            CHECK(fr.freq[k] >= fr.freq[k - 1]);
        }
        CHECK(fr.response[0].real() == doctest::Approx(2.0));
    }

    SUBCASE("Default point count") {
        const auto fr = butter(2, 0.2).freqresp();
        CHECK(fr.response.size() == 1024);
        CHECK(std::abs(fr.response[0]) == doctest::Approx(1.0));
    }

    SUBCASE("Matches direct evaluation on the unit circle") {
        const TransferFunction tf = butter(3, 0.25);
        const auto             fr = tf.freqresp(64);
        for (size_t k = 0; k < fr.freq.size(); k += 5) {
            const double  w        = 2.0 * std::numbers::pi * fr.freq[k] / tf.samplingRate();
            const Complex expected = tf.evaluate(std::polar(1.0, w));
            CHECK(fr.response[k].real() == doctest::Approx(expected.real()));
            CHECK(fr.response[k].imag() == doctest::Approx(expected.imag()));
        }
    }

    SUBCASE("Non-finite points are replaced by zero") {
        const auto fr = frequency_response({1.0}, {1.0, -1.0}, 100.0, 16);
        CHECK(fr.response[0] == Complex(0.0, 0.0));
        CHECK(std::isfinite(std::abs(fr.response[1])));
        CHECK(std::abs(fr.response[1]) > 0.0);
    }

    SUBCASE("Evaluation failure yields an all-zero response") {
        const auto fr = frequency_response({}, {1.0}, 100.0, 32);
        REQUIRE(fr.freq.size() == 32);
        REQUIRE(fr.response.size() == 32);
        for (const auto& H : fr.response) {
            CHECK(H == Complex(0.0, 0.0));
        }

        CHECK(frequency_response({1.0}, {1.0}, 100.0, 0).response.empty());
        CHECK(frequency_response({1.0}, {1.0}, -5.0, 8).response.size() == 8);
    }

    SUBCASE("Bode magnitude and phase") {
        const auto bd = butter(2, 0.1).bode(512);
        REQUIRE(bd.magnitude.size() == 512);
        CHECK(bd.magnitude[0] == doctest::Approx(0.0).epsilon(1e-9));
        CHECK(bd.magnitude.back() < -60.0);
        for (size_t k = 1; k < bd.phase.size(); ++k) {
            CHECK(std::abs(bd.phase[k] - bd.phase[k - 1]) < 180.0);
        }
        CHECK(bd.phase.back() == doctest::Approx(-180.0).epsilon(0.02));

        const auto silent = bode({}, {1.0}, 100.0, 4);
        CHECK(silent.magnitude[0] == doctest::Approx(-6000.0));
    }
}

TEST_CASE("Stability and state-space realization") {
    SUBCASE("Denominator roots against the unit circle") {
        CHECK(is_stable({1.0, -0.5}));
        CHECK_FALSE(is_stable({1.0, -1.5}));
        CHECK_FALSE(is_stable({1.0, -1.0}));
        CHECK(is_stable({1.0}));
    }

    SUBCASE("Realization of a proper system") {
        const auto sys = realize({1.0, 0.5}, {2.0, -1.0, 0.25}, 100.0);
        REQUIRE(sys.has_value());
        CHECK(sys->order() == 2);
        CHECK(sys->is_stable());

        const std::vector<double> u = {1.0, -2.0, 0.5, 3.0, 0.0, 0.0, 1.0};
        const auto                y = sys->simulate(u);
        const auto                r = lfilter({1.0, 0.5}, {2.0, -1.0, 0.25}, u);
        for (size_t n = 0; n < u.size(); ++n) {
            CHECK(y[n] == doctest::Approx(r[n]));
        }
    }

    SUBCASE("Realization reports failures instead of throwing") {
        CHECK_FALSE(realize({1.0, 2.0, 3.0}, {1.0}, 100.0).has_value());
        CHECK_FALSE(realize({1.0}, {0.0, 1.0}, 100.0).has_value());
        CHECK_FALSE(realize({}, {1.0}, 100.0).has_value());
        CHECK_FALSE(realize({1.0}, {1.0, NAN}, 100.0).has_value());
    }

    SUBCASE("or_fallback substitutes on failure only") {
        Result<int> ok     = 3;
        Result<int> failed = numeric_failure("boom");
        CHECK(or_fallback(std::move(ok), [] { return 7; }, "test") == 3);
        CHECK(or_fallback(std::move(failed), [] { return 7; }, "test") == 7);
    }

    SUBCASE("Default response window") {
        CHECK(response_time(1000.0).size() == 2000);
        CHECK(response_time(7.5).size() == 15);
        CHECK_THROWS_AS(response_time(0.0), InvalidArgument);
    }
}
