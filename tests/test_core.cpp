#include <catch2/catch.hpp>

#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "test_fixtures.hpp"
#include "utils.hpp"

#include <cstdio>
#include <fstream>

using core::config::ConfigLoader;
using core::config::json;

TEST_CASE("Timestamps round-trip through ISO 8601", "[core][utils]") {
    const auto ts = fixtures::baseTime();
    REQUIRE(core::utils::timestampToString(ts) == "2024-01-02T14:30:00Z");
    REQUIRE(core::utils::stringToTimestamp("2024-01-02T14:30:00Z") == ts);

    SECTION("offsets are converted to UTC") {
        REQUIRE(core::utils::stringToTimestamp("2024-01-02T16:30:00+02:00") == ts);
    }

    SECTION("garbage is rejected") {
        REQUIRE_THROWS_AS(core::utils::stringToTimestamp("yesterday"), core::ValidationException);
    }
}

TEST_CASE("Standard deviations", "[core][utils]") {
    const std::vector<double> values {2, 4, 4, 4, 5, 5, 7, 9};
    REQUIRE(core::utils::mean(values) == Approx(5.0));
    REQUIRE(core::utils::populationStdDev(values) == Approx(2.0));
    REQUIRE(core::utils::sampleStdDev(values) == Approx(2.13809).epsilon(1e-4));

    REQUIRE(core::utils::populationStdDev({3.0}) == 0.0);
    REQUIRE(core::utils::sampleStdDev({}) == 0.0);
}

TEST_CASE("Candle validation", "[core][utils]") {
    auto candles = fixtures::candlesFromCloses({10, 11, 12});
    REQUIRE_NOTHROW(core::utils::validateCandles(candles));

    SECTION("high below low") {
        candles[1].high = candles[1].low - 1.0;
        REQUIRE_THROWS_AS(core::utils::validateCandles(candles), core::ValidationException);
    }
    SECTION("timestamps must increase") {
        candles[2].timestamp = candles[1].timestamp;
        REQUIRE_THROWS_AS(core::utils::validateCandles(candles), core::ValidationException);
    }
    SECTION("negative volume") {
        candles[0].volume = -1;
        REQUIRE_THROWS_AS(core::utils::validateCandles(candles), core::ValidationException);
    }
}

TEST_CASE("Case-insensitive containment", "[core][utils]") {
    REQUIRE(core::utils::containsIgnoreCase("Biotechnology", "technology"));
    REQUIRE(core::utils::containsIgnoreCase("ABCD_Bullish_forming", "abcd_bullish"));
    REQUIRE_FALSE(core::utils::containsIgnoreCase("Energy", "tech"));
}

TEST_CASE("Config defaults", "[core][config]") {
    const auto config = ConfigLoader::fromJson(json::object());

    REQUIRE(config.swing_points.min_distance == 3);
    REQUIRE(config.swing_points.prominence_factor == Approx(0.5));
    REQUIRE(config.abcd.max_pattern_bars == 50);
    REQUIRE(config.abcd.lookahead == 8);
    REQUIRE(config.indicators.ema_periods == std::vector<int>{9, 20, 50, 200});
    REQUIRE(config.support_resistance.prominence_factor == Approx(0.3));
    REQUIRE(config.weights.technical == Approx(0.30));
    REQUIRE(config.ross.min_pillars == 4);
    REQUIRE(config.signals.max_position_fraction == Approx(0.10));
    REQUIRE(config.signals.alert_rules.is_null());
}

TEST_CASE("Config overrides", "[core][config]") {
    const json document = {
        {"abcd", {{"max_pattern_bars", 40}, {"fib_tolerance", 0.08}}},
        {"weights", {{"fundamental", 0.4}, {"technical", 0.2}, {"news_sentiment", 0.2}, {"volume_momentum", 0.2}}},
        {"batch", {{"worker_threads", 2}}},
        {"logging", {{"console_level", "debug"}, {"file_enabled", false}}}
    };
    const auto config = ConfigLoader::fromJson(document);

    REQUIRE(config.abcd.max_pattern_bars == 40);
    REQUIRE(config.abcd.fib_tolerance == Approx(0.08));
    REQUIRE(config.abcd.lookahead == 8);
    REQUIRE(config.weights.fundamental == Approx(0.4));
    REQUIRE(config.batch.worker_threads == 2);
    REQUIRE(config.logging.console_level == "debug");
    REQUIRE_FALSE(config.logging.file_enabled);
}

TEST_CASE("Invalid config is rejected", "[core][config]") {
    SECTION("weights must sum to one") {
        const json document = {{"weights", {{"fundamental", 0.5}}}};
        REQUIRE_THROWS_AS(ConfigLoader::fromJson(document), core::ConfigException);
    }
    SECTION("wrong value type") {
        const json document = {{"abcd", {{"lookahead", "eight"}}}};
        REQUIRE_THROWS_AS(ConfigLoader::fromJson(document), core::ConfigException);
    }
    SECTION("section must be an object") {
        const json document = {{"ross", 3}};
        REQUIRE_THROWS_AS(ConfigLoader::fromJson(document), core::ConfigException);
    }
    SECTION("EMA periods must ascend") {
        const json document = {{"indicators", {{"ema_periods", {9, 50, 20, 200}}}}};
        REQUIRE_THROWS_AS(ConfigLoader::fromJson(document), core::ConfigException);
    }
    SECTION("MACD fast below slow") {
        const json document = {{"indicators", {{"macd_fast", 30}}}};
        REQUIRE_THROWS_AS(ConfigLoader::fromJson(document), core::ConfigException);
    }
    SECTION("pillar count") {
        const json document = {{"ross", {{"min_pillars", 6}}}};
        REQUIRE_THROWS_AS(ConfigLoader::fromJson(document), core::ConfigException);
    }
    SECTION("document must be an object") {
        REQUIRE_THROWS_AS(ConfigLoader::fromJson(json::array()), core::ConfigException);
    }
}

TEST_CASE("Config file loading", "[core][config]") {
    REQUIRE_THROWS_AS(ConfigLoader::fromFile("does/not/exist.json"), core::ConfigException);

    const std::string path = "screener_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"support_resistance": {"window": 60, "max_levels": 3}})";
    }
    const auto config = ConfigLoader::fromFile(path);
    REQUIRE(config.support_resistance.window == 60);
    REQUIRE(config.support_resistance.max_levels == 3);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    REQUIRE_THROWS_AS(ConfigLoader::fromFile(path), core::ConfigException);
    std::remove(path.c_str());
}

TEST_CASE("Log level names", "[core][logging]") {
    REQUIRE(core::logging::level_from_string("DEBUG") == spdlog::level::debug);
    REQUIRE(core::logging::level_from_string("warn") == spdlog::level::warn);
    REQUIRE(core::logging::level_from_string("nonsense") == spdlog::level::info);
    REQUIRE(core::logging::getLogger() != nullptr);
}

TEST_CASE("Console-only logging from config", "[core][logging]") {
    core::config::LoggingConfig logging_config;
    logging_config.console_level = "error";
    logging_config.file_enabled = false;
    core::logging::initialize(logging_config);

    auto logger = core::logging::getLogger();
    REQUIRE(logger->name() == "ScreenerLogger");
    REQUIRE(logger->level() == spdlog::level::err);
    REQUIRE(logger->sinks().size() == 1);
}
