#include <catch2/catch.hpp>

#include "exceptions.hpp"
#include "support_resistance_calculator.hpp"
#include "technical_analyzer.hpp"
#include "test_fixtures.hpp"

using namespace analysis;

namespace {

    // Ten-bar oscillation between 91 and 109 around 100
    core::TimeSeries<core::Candle> rangeBound(size_t count) {
        const std::vector<double> cycle {-9, -5, -1, 3, 7, 9, 7, 3, -1, -5};
        return fixtures::candlesFromCloses(fixtures::generate(count, [&cycle](size_t i) { return 100.0 + cycle[i % 10]; }), 1.0);
    }

    patterns::SwingPoint point(size_t index, double price, patterns::SwingType type) {
        return {index, price, fixtures::baseTime() + std::chrono::hours(24 * static_cast<int>(index)), type};
    }

} // namespace

TEST_CASE("Support and resistance from a range-bound series", "[analysis][levels]") {
    SupportResistanceCalculator calculator;
    const auto candles = rangeBound(50);

    const auto result = calculator.calculate(candles, 100.0);

    REQUIRE(result.resistances.size() == 5);
    for (const auto& level : result.resistances) {
        CHECK(level.type == LevelType::Resistance);
        CHECK(level.price == Approx(110.0));
        CHECK(level.touches == 5);
        CHECK(level.strength == Approx(100.0));
        CHECK_FALSE(level.is_current);
    }

    REQUIRE(result.supports.size() == 4); // the bar-0 low is an edge, not a pivot
    for (const auto& level : result.supports) {
        CHECK(level.price == Approx(90.0));
        CHECK(level.touches == 5);
    }

    REQUIRE(result.nearest_support == Approx(90.0));
    REQUIRE(result.nearest_resistance == Approx(110.0));

    SECTION("touch counting reports the latest touching bar") {
        core::Timestamp last_touch;
        REQUIRE(calculator.countTouches(candles, 110.0, LevelType::Resistance, &last_touch) == 5);
        REQUIRE(last_touch == candles[45].timestamp);
        REQUIRE(calculator.countTouches(candles, 90.0, LevelType::Support) == 5);
        REQUIRE(calculator.countTouches(candles, 150.0, LevelType::Resistance) == 0);
    }

    SECTION("levels at the price itself are not nearest levels") {
        const auto at_top = calculator.calculate(candles, 110.0);
        REQUIRE_FALSE(at_top.nearest_resistance.has_value());
        REQUIRE(at_top.nearest_support == Approx(90.0));
        REQUIRE(at_top.resistances.front().is_current);
    }

    SECTION("unusable input yields no levels") {
        REQUIRE(calculator.calculate(rangeBound(2), 100.0).supports.empty());
        const auto no_price = calculator.calculate(candles, 0.0);
        REQUIRE(no_price.supports.empty());
        REQUIRE(no_price.resistances.empty());
    }
}

TEST_CASE("Support and resistance configuration is validated", "[analysis][levels]") {
    core::config::SupportResistanceConfig config;
    config.window = 0;
    REQUIRE_THROWS_AS(SupportResistanceCalculator(config), std::invalid_argument);

    config = {};
    config.touch_tolerance = -0.1;
    REQUIRE_THROWS_AS(SupportResistanceCalculator(config), std::invalid_argument);
}

TEST_CASE("Technical assessments", "[analysis][analyzer]") {
    using indicators::TechnicalIndicatorEngine;
    const auto neutral = TechnicalIndicatorEngine::defaultSignals();

    SECTION("volatility bands") {
        REQUIRE(TechnicalAnalyzer::volatilityLevel(0.6) == VolatilityLevel::High);
        REQUIRE(TechnicalAnalyzer::volatilityLevel(0.4) == VolatilityLevel::Medium);
        REQUIRE(TechnicalAnalyzer::volatilityLevel(0.3) == VolatilityLevel::Low);
        REQUIRE(TechnicalAnalyzer::volatilityLevel(0.0) == VolatilityLevel::Low);
    }

    SECTION("technical score blends strength, pattern, levels and volume") {
        REQUIRE(TechnicalAnalyzer::technicalScore(neutral, {}, {}) == Approx(20.0));

        auto breakout = neutral;
        breakout.volume.breakout = true;
        SupportResistanceResult levels;
        SupportResistanceLevel level;
        level.strength = 50.0;
        levels.supports.push_back(level);
        REQUIRE(TechnicalAnalyzer::technicalScore(breakout, {}, levels) == Approx(40.0));
    }

    SECTION("momentum") {
        REQUIRE(TechnicalAnalyzer::momentumStrength(neutral) == MomentumStrength::Weak);

        auto hot = neutral;
        hot.volume.relative_volume = 5.0;
        hot.macd.histogram = -0.2;
        REQUIRE(TechnicalAnalyzer::momentumStrength(hot) == MomentumStrength::Strong);

        hot.macd.histogram = 0.0;
        REQUIRE(TechnicalAnalyzer::momentumStrength(hot) == MomentumStrength::Moderate);
    }

    SECTION("trend votes") {
        REQUIRE(TechnicalAnalyzer::trendDirection(neutral, {}) == indicators::Direction::Sideways);

        auto bearish = neutral;
        bearish.ema.trend = indicators::Direction::Bearish;
        bearish.macd.is_bullish = true;
        REQUIRE(TechnicalAnalyzer::trendDirection(bearish, {}) == indicators::Direction::Bearish);
    }

    SECTION("entry recommendation") {
        const auto idle = TechnicalAnalyzer::entryRecommendation(neutral, {}, 10.0);
        REQUIRE(idle.action == EntryAction::Hold);
        REQUIRE(idle.timing == EntryTiming::Wait);
        REQUIRE(idle.reasons.empty());

        auto firing = neutral;
        firing.entry_signal = true;
        firing.macd.crossover = indicators::Crossover::Bullish;
        firing.volume.breakout = true;
        const auto strong = TechnicalAnalyzer::entryRecommendation(firing, {}, 10.0);
        REQUIRE(strong.confidence == Approx(75.0));
        REQUIRE(strong.action == EntryAction::StrongBuy);
        REQUIRE(strong.timing == EntryTiming::Immediate);
        REQUIRE(strong.reasons.size() == 3);
        REQUIRE(strong.entry_price == 10.0);
    }

    SECTION("exit recommendation") {
        const auto idle = TechnicalAnalyzer::exitRecommendation(neutral, {}, 100.0, std::nullopt);
        REQUIRE(idle.action == ExitAction::Hold);
        REQUIRE(idle.confidence == Approx(20.0)); // price below the (unknown) 9 EMA

        auto exiting = neutral;
        exiting.exit_signal = true;
        const auto sell = TechnicalAnalyzer::exitRecommendation(exiting, {}, 100.0, 101.0);
        REQUIRE(sell.confidence == Approx(65.0));
        REQUIRE(sell.action == ExitAction::Sell);
        REQUIRE(sell.urgency == scoring::Urgency::Medium);
        REQUIRE(sell.reasons.back() == "Approaching resistance level");
    }
}

TEST_CASE("Snapshot names detected patterns", "[analysis][analyzer]") {
    using patterns::SwingType;
    patterns::ABCDPatternMatcher matcher;

    const std::vector<patterns::SwingPoint> swings {
        point(0, 10.0, SwingType::Trough), point(5, 20.0, SwingType::Peak),
        point(10, 13.82, SwingType::Trough), point(15, 23.82, SwingType::Peak)};

    patterns::ABCDAnalysis abcd;
    abcd.complete_patterns = matcher.findCompletePatterns(swings);
    const std::vector<patterns::SwingPoint> abc(swings.begin(), swings.begin() + 3);
    abcd.forming_patterns = matcher.findFormingPatterns(abc, 23.82, 15);
    REQUIRE(abcd.complete_patterns.size() == 1);
    REQUIRE(abcd.forming_patterns.size() == 1);

    auto signals = indicators::TechnicalIndicatorEngine::defaultSignals();
    signals.ema.ema_9 = 22.0;
    signals.rsi.value = 61.0;
    signals.volatility = 0.35;
    signals.volume.relative_volume = 3.0;

    SupportResistanceResult levels;
    SupportResistanceLevel support;
    support.price = 13.5;
    levels.supports.push_back(support);

    const auto snapshot = TechnicalAnalyzer::buildSnapshot(signals, abcd, levels);
    REQUIRE(snapshot.patterns_detected == std::vector<std::string>{"abcd_bullish", "abcd_bullish_forming"});
    REQUIRE(snapshot.ema_9 == Approx(22.0));
    REQUIRE(snapshot.ema_20 == 0.0);
    REQUIRE(snapshot.rsi == Approx(61.0));
    REQUIRE(snapshot.volatility == Approx(0.35));
    REQUIRE(snapshot.relative_volume == Approx(3.0));
    REQUIRE(snapshot.support_levels == std::vector<double>{13.5});
    REQUIRE(snapshot.resistance_levels.empty());
}

TEST_CASE("Full technical analysis", "[analysis][analyzer]") {
    TechnicalAnalyzer analyzer{core::config::ScreenerConfig{}};

    SECTION("short series degrade without throwing") {
        const auto candles = fixtures::candlesFromCloses(fixtures::risingLine(30));
        const auto result = analyzer.analyze("SHRT", candles, 129.0, 1000);

        REQUIRE(result.symbol == "SHRT");
        REQUIRE(result.signals.is_default);
        REQUIRE(result.signals.volatility > 0.0);
        REQUIRE(result.levels.supports.empty());
        // No levels: 5% stop, 2R target
        REQUIRE(result.stop_loss == Approx(129.0 * 0.95));
        REQUIRE(result.take_profit == Approx(129.0 + 2.0 * 129.0 * 0.05));
        REQUIRE(result.risk_reward_ratio == Approx(2.0));
        REQUIRE(result.snapshot.rsi == 50.0);
    }

    SECTION("levels drive stop and target") {
        const auto candles = rangeBound(50);
        const auto result = analyzer.analyze("RNG", candles, 100.0, 1000, 10'000'000.0);

        REQUIRE_FALSE(result.signals.is_default);
        REQUIRE(result.stop_loss == Approx(90.0 * 0.98));
        REQUIRE(result.take_profit == Approx(110.0 * 0.98));
        REQUIRE(result.risk_reward_ratio == Approx((107.8 - 100.0) / (100.0 - 88.2)));
        REQUIRE(result.snapshot.support_levels.front() == Approx(90.0));
        REQUIRE(result.snapshot.resistance_levels.front() == Approx(110.0));
    }

    SECTION("malformed candles are rejected") {
        auto candles = rangeBound(50);
        candles[10].timestamp = candles[9].timestamp;
        REQUIRE_THROWS_AS(analyzer.analyze("BAD", candles, 100.0, 1000), core::ValidationException);
    }
}
