#include <cmath>
#include <numbers>

#include <doctest/doctest.h>

#include "sigsys.hpp"

using namespace sigsys;

TEST_CASE("Wrap test") {
    SUBCASE("Phase wrapping into one period") {
        CHECK(wrap(7.0, 0.0, 5.0) == doctest::Approx(2.0));
        CHECK(wrap(-3.0, 0.0, 5.0) == doctest::Approx(2.0));
        CHECK(wrap(3.0 * std::numbers::pi, 0.0, 2.0 * std::numbers::pi) == doctest::Approx(std::numbers::pi));
    }

    SUBCASE("Upper bound maps to the lower bound") {
        CHECK(wrap(0.0, 0.0, 5.0) == doctest::Approx(0.0));
        CHECK(wrap(5.0, 0.0, 5.0) == doctest::Approx(0.0));
    }

    SUBCASE("Symmetric range") {
        CHECK(wrap(23.5, -10.0, 10.0) == doctest::Approx(3.5));
        CHECK(wrap(-27.3, -10.0, 10.0) == doctest::Approx(-7.3));
    }
}

TEST_CASE("Sample grids") {
    SUBCASE("linspace includes both ends") {
        auto v = linspace(0.0, 1.0, 5);
        REQUIRE(v.size() == 5);
        CHECK(v[1] == doctest::Approx(0.25));
        CHECK(v[4] == doctest::Approx(1.0));
        CHECK(linspace(3.0, 2.0, 1) == std::vector<double>{3.0});
        CHECK(linspace(std::pair<double, double>{-1.0, 1.0}, 3)[1] == doctest::Approx(0.0));
    }

    SUBCASE("sample_times excludes the end point") {
        auto t = sample_times(4.0, 4);
        REQUIRE(t.size() == 4);
        CHECK(t[0] == 0.0);
        CHECK(t[3] == doctest::Approx(0.75));
        CHECK(sample_times(100.0, 0).empty());
    }
}

TEST_CASE("Magnitude/decibel and angle conversions") {
    CHECK(mag2db(0.5) == doctest::Approx(-6.0206).epsilon(1e-4));
    CHECK(db2mag(mag2db(0.5)) == doctest::Approx(0.5));
    CHECK(mag2db(1e-300) == doctest::Approx(-6000.0));
    CHECK(rad2deg(deg2rad(123.456)) == doctest::Approx(123.456));
}

TEST_CASE("Phase unwrapping") {
    std::vector<double> phases = {170.0, -170.0, -150.0, 175.0};
    unwrap_phase_deg(phases);
    CHECK(phases[0] == doctest::Approx(170.0));
    CHECK(phases[1] == doctest::Approx(190.0));
    CHECK(phases[2] == doctest::Approx(210.0));
    CHECK(phases[3] == doctest::Approx(175.0));

    std::vector<double> empty;
    unwrap_phase_deg(empty);
    CHECK(empty.empty());
}

TEST_CASE("Signal validation") {
    CHECK(validate_signal({0.0, 0.1, 0.2}, {1.0, -1.0, 0.0}));
    CHECK(validate_signal({}, {}));
    CHECK_FALSE(validate_signal({0.0, 0.1}, {1.0}));
    CHECK_FALSE(validate_signal({0.0, 0.1}, {1.0, NAN}));
    CHECK_FALSE(validate_signal({0.0, 0.1}, {INFINITY, 1.0}));
    CHECK_FALSE(validate_signal({0.0, 0.0}, {1.0, 1.0}));
}

TEST_CASE("Signal normalization") {
    SUBCASE("Scaled by the largest magnitude") {
        auto y = normalize_signal({2.0, -4.0, 1.0});
        REQUIRE(y.size() == 3);
        CHECK(y[0] == doctest::Approx(0.5));
        CHECK(y[1] == doctest::Approx(-1.0));
        CHECK(y[2] == doctest::Approx(0.25));
    }

    SUBCASE("Zero signal is returned unchanged") {
        CHECK(normalize_signal({0.0, 0.0}) == std::vector<double>{0.0, 0.0});
        CHECK(normalize_signal({}).empty());
    }
}

TEST_CASE("Signal-to-noise ratio") {
    CHECK(calculate_snr({1.0, -1.0, 1.0, -1.0}, {0.1, -0.1, 0.1, -0.1}) == doctest::Approx(20.0));
    CHECK(calculate_snr({2.0, 2.0}, {1.0, 1.0}) == doctest::Approx(10.0 * std::log10(4.0)));
    CHECK(std::isinf(calculate_snr({1.0}, {0.0})));
    CHECK(calculate_snr({1.0}, {0.0}) > 0.0);
}
