#include <memory>
#include <sstream>

#include <doctest/doctest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "sigsys.hpp"

using namespace sigsys;

TEST_CASE("SamplingConfig") {
    SUBCASE("Defaults") {
        SamplingConfig config;
        CHECK(config.fs == doctest::Approx(kDefaultSamplingRate));
        CHECK(config.duration == doctest::Approx(kDefaultDuration));
        CHECK(config.num_samples() == 2000);
        CHECK(config.time_vector().size() == 2000);
    }

    SUBCASE("Sample count is floored") {
        SamplingConfig config{.fs = 10.0, .duration = 0.35};
        CHECK(config.num_samples() == 3);

        config.update(std::nullopt, 0.0);
        CHECK(config.num_samples() == 0);
        CHECK(config.time_vector().empty());
    }

    SUBCASE("Partial update") {
        SamplingConfig config;
        config.update(44100.0, std::nullopt);
        CHECK(config.fs == doctest::Approx(44100.0));
        CHECK(config.duration == doctest::Approx(kDefaultDuration));
    }

    SUBCASE("Rejected update is atomic") {
        SamplingConfig config;
        CHECK_THROWS_AS(config.update(500.0, -1.0), InvalidArgument);
        CHECK_THROWS_AS(config.update(NAN, 1.0), InvalidArgument);
        CHECK_THROWS_AS(config.update(std::nullopt, INFINITY), InvalidArgument);
        CHECK(config.fs == doctest::Approx(kDefaultSamplingRate));
        CHECK(config.duration == doctest::Approx(kDefaultDuration));
    }

    SUBCASE("Sampling rate validation") {
        CHECK_NOTHROW(validate_sampling_rate(1.0));
        CHECK_THROWS_AS(validate_sampling_rate(0.0), InvalidArgument);
        CHECK_THROWS_AS(validate_sampling_rate(-8000.0), InvalidArgument);
    }
}

TEST_CASE("Library logger") {
    auto log = logger();
    REQUIRE(log != nullptr);
    CHECK(log->name() == "sigsys");
    CHECK(logger() == log);

    const auto previous = log->level();

    SUBCASE("Writes to a colored stderr sink") {
        REQUIRE_FALSE(log->sinks().empty());
        CHECK(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(log->sinks().front()) != nullptr);
    }

    SUBCASE("Level is adjustable") {
        set_log_level(spdlog::level::debug);
        CHECK(log->should_log(spdlog::level::debug));
        set_log_level(spdlog::level::err);
        CHECK_FALSE(log->should_log(spdlog::level::warn));
    }

    SUBCASE("Band-pass fallback is reported as a warning") {
        std::ostringstream stream;
        auto               sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
        log->sinks().push_back(sink);
        set_log_level(spdlog::level::warn);

        SystemAnalyzer analyzer(100.0);
        analyzer.create_system(BandPass{.lowcut = 60.0, .highcut = 70.0, .order = 2});
        log->flush();
        CHECK(stream.str().find("Band-pass") != std::string::npos);

        log->sinks().pop_back();
    }

    set_log_level(previous);
}
