#include <catch2/catch.hpp>

#include "ema_indicator.hpp"
#include "macd_indicator.hpp"
#include "rsi_indicator.hpp"
#include "sma_indicator.hpp"
#include "technical_indicator_engine.hpp"
#include "test_fixtures.hpp"
#include <cmath>

using namespace indicators;

TEST_CASE("Single indicators line up with their lookback", "[indicators]") {
    const auto candles = fixtures::candlesFromCloses(fixtures::risingLine(10, 1.0, 1.0)); // 1..10

    SECTION("SMA") {
        SmaIndicator sma(3);
        REQUIRE(sma.getName() == "SMA(3)");
        sma.calculate(candles);
        REQUIRE(sma.getResult().size() == candles.size() - sma.getLookback());
        REQUIRE(sma.getResult().front() == Approx(2.0));
        REQUIRE(sma.getResult().back() == Approx(9.0));
    }

    SECTION("SMA over volume") {
        SmaIndicator volume_sma(5, core::PriceField::Volume);
        volume_sma.calculate(candles);
        REQUIRE(volume_sma.getResult().back() == Approx(1000.0));
    }

    SECTION("EMA seeded with the SMA tracks a straight line with constant lag") {
        EmaIndicator ema(3);
        ema.calculate(candles);
        REQUIRE(ema.getLookback() == 2);
        REQUIRE(ema.getResult().back() == Approx(9.0));
    }

    SECTION("RSI of a steady climb saturates") {
        RsiIndicator rsi(5);
        rsi.calculate(candles);
        REQUIRE_FALSE(rsi.getResult().empty());
        REQUIRE(rsi.getResult().back() == Approx(100.0));
    }

    SECTION("too little input leaves an empty result") {
        MacdIndicator macd(12, 26, 9);
        macd.calculate(candles);
        REQUIRE(macd.getResult().empty());
        REQUIRE(macd.getSignalLine().empty());
        REQUIRE(macd.getHistogram().empty());
    }

    SECTION("invalid periods are rejected") {
        REQUIRE_THROWS_AS(SmaIndicator(0), std::invalid_argument);
        REQUIRE_THROWS_AS(MacdIndicator(26, 12, 9), std::invalid_argument);
    }
}

TEST_CASE("Short series fall back to neutral signals", "[indicators][engine]") {
    TechnicalIndicatorEngine engine;
    const auto candles = fixtures::candlesFromCloses(fixtures::risingLine(49));

    const auto set = engine.calculate(candles);
    REQUIRE(set.is_default);
    REQUIRE(set.signal_strength == 50.0);
    REQUIRE(set.overall_signal == OverallSignal::Hold);
    REQUIRE(set.rsi.value == 50.0);
    REQUIRE(set.volume.relative_volume == 1.0);
    REQUIRE_FALSE(set.entry_signal);
    REQUIRE_FALSE(set.exit_signal);

    REQUIRE(engine.calculate({}).is_default);
}

TEST_CASE("Signal strength rubric", "[indicators][engine]") {
    SECTION("neutral inputs with price below both EMAs") {
        REQUIRE(TechnicalIndicatorEngine::signalStrength({}, {}, {}, {}) == Approx(42.5));
    }

    SECTION("every component bullish") {
        MacdResult macd;
        macd.crossover = Crossover::Bullish;
        EmaResult ema;
        ema.trend = Direction::Bullish;
        ema.price_above_ema9 = true;
        ema.price_above_ema20 = true;
        RsiResult rsi;
        rsi.value = 65.0;
        rsi.momentum = Momentum::Bullish;
        VolumeResult volume;
        volume.breakout = true;
        REQUIRE(TechnicalIndicatorEngine::signalStrength(macd, ema, rsi, volume) == Approx(100.0));
    }

    SECTION("every component bearish") {
        MacdResult macd;
        macd.crossover = Crossover::Bearish;
        EmaResult ema;
        ema.trend = Direction::Bearish;
        RsiResult rsi;
        rsi.momentum = Momentum::Bearish;
        VolumeResult volume;
        volume.trend = VolumeTrend::Decreasing;
        // -25 -25 -15 -15 -10 = -90
        REQUIRE(TechnicalIndicatorEngine::signalStrength(macd, ema, rsi, volume) == Approx(5.0));
    }

    SECTION("oversold counts as a potential reversal") {
        RsiResult rsi;
        rsi.value = 20.0;
        rsi.oversold = true;
        rsi.momentum = Momentum::Bearish;
        REQUIRE(TechnicalIndicatorEngine::signalStrength({}, {}, rsi, {}) == Approx(47.5));
    }
}

TEST_CASE("Composite label boundaries", "[indicators][engine]") {
    REQUIRE(TechnicalIndicatorEngine::labelFor(80.0) == OverallSignal::StrongBuy);
    REQUIRE(TechnicalIndicatorEngine::labelFor(79.9) == OverallSignal::Buy);
    REQUIRE(TechnicalIndicatorEngine::labelFor(65.0) == OverallSignal::Buy);
    REQUIRE(TechnicalIndicatorEngine::labelFor(64.9) == OverallSignal::Hold);
    REQUIRE(TechnicalIndicatorEngine::labelFor(35.0) == OverallSignal::Hold);
    REQUIRE(TechnicalIndicatorEngine::labelFor(34.9) == OverallSignal::Sell);
    REQUIRE(TechnicalIndicatorEngine::labelFor(20.0) == OverallSignal::Sell);
    REQUIRE(TechnicalIndicatorEngine::labelFor(19.9) == OverallSignal::StrongSell);
}

TEST_CASE("Fibonacci retracement levels", "[indicators][engine]") {
    const auto levels = TechnicalIndicatorEngine::fibonacciLevels(110.0, 10.0);
    REQUIRE(levels.size() == 7);
    REQUIRE(levels.at("0%") == Approx(110.0));
    REQUIRE(levels.at("23.6%") == Approx(86.4));
    REQUIRE(levels.at("50%") == Approx(60.0));
    REQUIRE(levels.at("61.8%") == Approx(48.2));
    REQUIRE(levels.at("100%") == Approx(10.0));
}

TEST_CASE("Full calculation on trending series", "[indicators][engine]") {
    TechnicalIndicatorEngine engine;

    SECTION("steady uptrend") {
        const auto candles = fixtures::candlesFromCloses(fixtures::risingLine(260));
        const auto set = engine.calculate(candles);

        REQUIRE_FALSE(set.is_default);
        REQUIRE(set.ema.ema_200.has_value());
        REQUIRE(set.ema.trend == Direction::Bullish);
        REQUIRE(set.ema.price_above_ema9);
        REQUIRE(set.ema.golden_cross);
        REQUIRE(set.macd.line > 0.0);
        REQUIRE(set.rsi.value > 70.0);
        REQUIRE(set.rsi.overbought);
        REQUIRE(set.volume.relative_volume == Approx(1.0));
        REQUIRE_FALSE(set.volume.breakout);
        REQUIRE(set.volatility > 0.0);
        REQUIRE(set.fibonacci_levels.at("0%") == Approx(359.5));
        REQUIRE(set.fibonacci_levels.at("100%") == Approx(99.5));
    }

    SECTION("steady downtrend triggers the exit set") {
        const auto candles = fixtures::candlesFromCloses(fixtures::risingLine(260, 400.0, -1.0));
        const auto set = engine.calculate(candles);

        REQUIRE(set.ema.trend == Direction::Bearish);
        REQUIRE(set.ema.death_cross);
        REQUIRE(set.rsi.oversold);
        REQUIRE(set.exit_signal);
        REQUIRE_FALSE(set.entry_signal);
        REQUIRE(set.signal_strength < 50.0);
    }

    SECTION("live volume drives relative volume and breakout") {
        const auto candles = fixtures::candlesFromCloses(fixtures::risingLine(60));
        const auto set = engine.calculate(candles, candles.back().close, 5000);
        REQUIRE(set.volume.sma_20 == Approx(1000.0));
        REQUIRE(set.volume.relative_volume == Approx(5.0));
        REQUIRE(set.volume.breakout);
        REQUIRE_FALSE(set.ema.ema_200.has_value());
        REQUIRE(set.ema.trend == Direction::Sideways);
    }

    SECTION("constant growth rate has no volatility") {
        const auto closes = fixtures::generate(60, [](size_t i) { return 10.0 * std::pow(1.01, static_cast<double>(i)); });
        REQUIRE(engine.calculateVolatility(fixtures::candlesFromCloses(closes, 0.01)) == Approx(0.0).margin(1e-9));
    }

    SECTION("malformed candles degrade to neutral signals") {
        auto candles = fixtures::candlesFromCloses(fixtures::risingLine(60));
        candles[30].high = candles[30].low - 1.0;
        REQUIRE(engine.calculate(candles).is_default);
    }
}

TEST_CASE("Monotonic series show no divergence", "[indicators][engine]") {
    TechnicalIndicatorEngine engine;

    // RSI pins at 100 (or 0) and neither series has an interior extreme
    REQUIRE(engine.detectDivergence(fixtures::candlesFromCloses(fixtures::risingLine(60))) == Divergence::None);
    REQUIRE(engine.detectDivergence(fixtures::candlesFromCloses(fixtures::risingLine(60, 200.0, -1.0))) == Divergence::None);
    REQUIRE(engine.detectDivergence(fixtures::candlesFromCloses({100.0, 101.0})) == Divergence::None);
    REQUIRE(toString(Divergence::Bullish) == "bullish");
}

TEST_CASE("Engine configuration is validated", "[indicators][engine]") {
    core::config::IndicatorConfig config;
    config.ema_periods = {9, 20};
    REQUIRE_THROWS_AS(TechnicalIndicatorEngine(config), std::invalid_argument);

    config = {};
    config.min_bars = 0;
    REQUIRE_THROWS_AS(TechnicalIndicatorEngine(config), std::invalid_argument);
}
