#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include "at_least_condition.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace indicators {

    enum class Crossover { None, Bullish, Bearish };
    enum class Direction { Sideways, Bullish, Bearish };
    enum class Momentum { Neutral, Bullish, Bearish };
    enum class VolumeTrend { Stable, Increasing, Decreasing };
    enum class OverallSignal { StrongBuy, Buy, Hold, Sell, StrongSell };
    enum class Divergence { None, Bullish, Bearish };

    std::string toString(Crossover crossover);
    std::string toString(Direction direction);
    std::string toString(Momentum momentum);
    std::string toString(VolumeTrend trend);
    std::string toString(OverallSignal signal);
    std::string toString(Divergence divergence);

    struct MacdResult {
        double line = 0.0;
        double signal = 0.0;
        double histogram = 0.0;
        bool is_bullish = false; // line above signal with a positive histogram
        bool is_bearish = false;
        Crossover crossover = Crossover::None;
    };

    // EMA values in configured period order (defaults 9/20/50/200).
    // A value is absent when the series is shorter than the period's lookback.
    struct EmaResult {
        std::optional<double> ema_9;
        std::optional<double> ema_20;
        std::optional<double> ema_50;
        std::optional<double> ema_200;
        Direction trend = Direction::Sideways;
        bool price_above_ema9 = false;
        bool price_above_ema20 = false;
        bool golden_cross = false; // ema_50 above ema_200
        bool death_cross = false;
    };

    struct RsiResult {
        double value = 50.0;
        bool overbought = false;
        bool oversold = false;
        Momentum momentum = Momentum::Neutral;
    };

    struct VolumeResult {
        double sma_20 = 0.0;
        double relative_volume = 1.0;
        VolumeTrend trend = VolumeTrend::Stable;
        bool breakout = false;
    };

    struct TechnicalSignalSet {
        MacdResult macd;
        EmaResult ema;
        RsiResult rsi;
        VolumeResult volume;
        OverallSignal overall_signal = OverallSignal::Hold;
        double signal_strength = 50.0; // 0-100
        bool entry_signal = false;
        bool exit_signal = false;

        double volatility = 0.0; // annualized
        std::map<std::string, double> fibonacci_levels; // "0%" ... "100%"
        Divergence divergence = Divergence::None;

        bool is_default = false; // true when the neutral fallback was returned
    };

    // --- TechnicalIndicatorEngine ---
    // Computes the MACD / EMA stack / RSI / volume set for one candle series and derives the
    // aggregate strength, the composite label and the entry/exit confirmation sets.
    // Never throws from calculate(): short series and TA-Lib failures produce the neutral set.
    class TechnicalIndicatorEngine {
    public:
        explicit TechnicalIndicatorEngine(core::config::IndicatorConfig config = {});

        // Uses the last candle's close and volume as the live values
        TechnicalSignalSet calculate(const core::TimeSeries<core::Candle>& candles) const;

        TechnicalSignalSet calculate(const core::TimeSeries<core::Candle>& candles,
                                     double current_price,
                                     long long current_volume) const;

        MacdResult calculateMacd(const core::TimeSeries<core::Candle>& candles) const;
        EmaResult calculateEmas(const core::TimeSeries<core::Candle>& candles, double current_price) const;
        RsiResult calculateRsi(const core::TimeSeries<core::Candle>& candles) const;
        VolumeResult calculateVolume(const core::TimeSeries<core::Candle>& candles, long long current_volume) const;

        // Annualized standard deviation of the close-to-close returns in the last window bars
        double calculateVolatility(const core::TimeSeries<core::Candle>& candles) const;

        Divergence detectDivergence(const core::TimeSeries<core::Candle>& candles) const;

        // Point rubric (MACD 25, EMA trend 25, price vs EMA 15, RSI 15, volume 20) normalized to 0-100
        static double signalStrength(const MacdResult& macd, const EmaResult& ema,
                                     const RsiResult& rsi, const VolumeResult& volume);
        static OverallSignal labelFor(double strength);

        static std::map<std::string, double> fibonacciLevels(double high, double low);

        static TechnicalSignalSet defaultSignals();

        const core::config::IndicatorConfig& getConfig() const { return config_; }

    private:
        rule_engine::FactSnapshot conditionFacts(const TechnicalSignalSet& set) const;

        core::config::IndicatorConfig config_;
        std::unique_ptr<rule_engine::AtLeastCondition> entry_conditions_;
        std::unique_ptr<rule_engine::AtLeastCondition> exit_conditions_;
    };

} // namespace indicators
