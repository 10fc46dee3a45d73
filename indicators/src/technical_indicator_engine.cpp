#include "technical_indicator_engine.hpp"
#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "fact_condition.hpp"
#include "label_condition.hpp"
#include "logging.hpp"
#include "macd_indicator.hpp"
#include "peak_finder.hpp"
#include "rsi_indicator.hpp"
#include "sma_indicator.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace indicators {

    namespace {

        const double kTradingDaysPerYear = 252.0;

        std::unique_ptr<rule_engine::ICondition> flagIs(const std::string& fact, bool expected) {
            return std::make_unique<rule_engine::FactCondition>(fact, rule_engine::ComparisonOp::EQ, expected ? 1.0 : 0.0);
        }

        // Checks whether a recent pair of price extremes diverges from the matching RSI extremes.
        // `lower_is_divergent` selects the bullish test (price lower low, RSI higher low).
        bool extremesDiverge(const std::vector<double>& prices, const std::vector<double>& rsi,
                             const std::vector<size_t>& price_points, const std::vector<size_t>& rsi_points,
                             int match_window, bool lower_is_divergent)
        {
            if (price_points.size() < 2 || rsi_points.size() < 2) {
                return false;
            }
            const size_t recent_price = price_points[price_points.size() - 1];
            const size_t prev_price = price_points[price_points.size() - 2];
            const auto near = [match_window](size_t a, size_t b) {
                return std::abs(static_cast<long>(a) - static_cast<long>(b)) <= match_window;
            };

            const size_t n = rsi_points.size();
            for (size_t r = n - 2; r < n; ++r) {
                if (!near(rsi_points[r], recent_price)) {
                    continue;
                }
                // Candidates for the earlier RSI extreme: the two before the last one
                const size_t first = n >= 3 ? n - 3 : 0;
                for (size_t p = first; p < n - 1; ++p) {
                    if (!near(rsi_points[p], prev_price)) {
                        continue;
                    }
                    const bool price_diverges = lower_is_divergent
                        ? prices[recent_price] < prices[prev_price]
                        : prices[recent_price] > prices[prev_price];
                    const bool rsi_diverges = lower_is_divergent
                        ? rsi[rsi_points[r]] > rsi[rsi_points[p]]
                        : rsi[rsi_points[r]] < rsi[rsi_points[p]];
                    if (price_diverges && rsi_diverges) {
                        return true;
                    }
                }
            }
            return false;
        }

        std::vector<double> negated(const std::vector<double>& values) {
            std::vector<double> out(values.size());
            std::transform(values.begin(), values.end(), out.begin(), [](double v) { return -v; });
            return out;
        }

    } // end anonymous namespace

    // --- String conversions ---

    std::string toString(Crossover crossover) {
        switch (crossover) {
            case Crossover::Bullish: return "bullish";
            case Crossover::Bearish: return "bearish";
            case Crossover::None:    return "none";
        }
        return "none";
    }

    std::string toString(Direction direction) {
        switch (direction) {
            case Direction::Bullish:  return "bullish";
            case Direction::Bearish:  return "bearish";
            case Direction::Sideways: return "sideways";
        }
        return "sideways";
    }

    std::string toString(Momentum momentum) {
        switch (momentum) {
            case Momentum::Bullish: return "bullish";
            case Momentum::Bearish: return "bearish";
            case Momentum::Neutral: return "neutral";
        }
        return "neutral";
    }

    std::string toString(VolumeTrend trend) {
        switch (trend) {
            case VolumeTrend::Increasing: return "increasing";
            case VolumeTrend::Decreasing: return "decreasing";
            case VolumeTrend::Stable:     return "stable";
        }
        return "stable";
    }

    std::string toString(OverallSignal signal) {
        switch (signal) {
            case OverallSignal::StrongBuy:  return "strong_buy";
            case OverallSignal::Buy:        return "buy";
            case OverallSignal::Hold:       return "hold";
            case OverallSignal::Sell:       return "sell";
            case OverallSignal::StrongSell: return "strong_sell";
        }
        return "hold";
    }

    std::string toString(Divergence divergence) {
        switch (divergence) {
            case Divergence::Bullish: return "bullish";
            case Divergence::Bearish: return "bearish";
            case Divergence::None:    return "none";
        }
        return "none";
    }

    // --- TechnicalIndicatorEngine ---

    TechnicalIndicatorEngine::TechnicalIndicatorEngine(core::config::IndicatorConfig config)
        : config_(std::move(config))
    {
        if (config_.min_bars <= 0) {
            throw std::invalid_argument("IndicatorConfig.min_bars must be positive.");
        }
        if (config_.ema_periods.size() != 4) {
            throw std::invalid_argument(fmt::format("IndicatorConfig.ema_periods needs 4 periods, got {}.",
                                                    config_.ema_periods.size()));
        }

        // Entry: at least 3 of 5
        std::vector<std::unique_ptr<rule_engine::ICondition>> entry;
        entry.push_back(flagIs("macd_bullish_crossover", true));
        entry.push_back(flagIs("price_above_ema9", true));
        entry.push_back(flagIs("rsi_overbought", false));
        entry.push_back(flagIs("volume_breakout", true));
        entry.push_back(std::make_unique<rule_engine::LabelCondition>(
            "ema_trend", std::vector<std::string>{"bullish", "sideways"}));
        entry_conditions_ = std::make_unique<rule_engine::AtLeastCondition>(config_.entry_min_conditions, std::move(entry));

        // Exit: at least 2 of 4
        std::vector<std::unique_ptr<rule_engine::ICondition>> exit;
        exit.push_back(flagIs("macd_bearish_crossover", true));
        exit.push_back(flagIs("price_above_ema9", false));
        exit.push_back(flagIs("rsi_overbought", true));
        exit.push_back(std::make_unique<rule_engine::LabelCondition>(
            "ema_trend", std::vector<std::string>{"bearish"}));
        exit_conditions_ = std::make_unique<rule_engine::AtLeastCondition>(config_.exit_min_conditions, std::move(exit));

        core::logging::getLogger()->trace("TechnicalIndicatorEngine created. Entry: {} | Exit: {}",
                                          entry_conditions_->describe(), exit_conditions_->describe());
    }

    TechnicalSignalSet TechnicalIndicatorEngine::calculate(const core::TimeSeries<core::Candle>& candles) const {
        if (candles.empty()) {
            core::logging::getLogger()->warn("Empty candle series. Returning neutral technical signals.");
            return defaultSignals();
        }
        return calculate(candles, candles.back().close, candles.back().volume);
    }

    TechnicalSignalSet TechnicalIndicatorEngine::calculate(const core::TimeSeries<core::Candle>& candles,
                                                           double current_price,
                                                           long long current_volume) const
    {
        auto logger = core::logging::getLogger();
        if (candles.size() < static_cast<size_t>(config_.min_bars)) {
            logger->warn("Insufficient data for technical analysis ({} bars, need {}). Returning neutral signals.",
                         candles.size(), config_.min_bars);
            return defaultSignals();
        }

        try {
            core::utils::validateCandles(candles);

            TechnicalSignalSet set;
            set.macd = calculateMacd(candles);
            set.ema = calculateEmas(candles, current_price);
            set.rsi = calculateRsi(candles);
            set.volume = calculateVolume(candles, current_volume);

            set.signal_strength = signalStrength(set.macd, set.ema, set.rsi, set.volume);
            set.overall_signal = labelFor(set.signal_strength);

            const auto facts = conditionFacts(set);
            set.entry_signal = entry_conditions_->evaluate(facts);
            set.exit_signal = exit_conditions_->evaluate(facts);

            set.volatility = calculateVolatility(candles);
            const auto high_it = std::max_element(candles.begin(), candles.end(),
                [](const core::Candle& a, const core::Candle& b) { return a.high < b.high; });
            const auto low_it = std::min_element(candles.begin(), candles.end(),
                [](const core::Candle& a, const core::Candle& b) { return a.low < b.low; });
            set.fibonacci_levels = fibonacciLevels(high_it->high, low_it->low);
            set.divergence = detectDivergence(candles);

            logger->debug("Technical signals: strength {:.1f} ({}), entry {}, exit {}, RSI {:.1f}, MACD {}, trend {}",
                          set.signal_strength, toString(set.overall_signal), set.entry_signal, set.exit_signal,
                          set.rsi.value, toString(set.macd.crossover), toString(set.ema.trend));
            return set;
        } catch (const core::IndicatorCalculationException& e) {
            logger->error("Indicator calculation failed: {}. Returning neutral signals.", e.what());
        } catch (const std::exception& e) {
            logger->error("Error calculating technical indicators: {}. Returning neutral signals.", e.what());
        }
        return defaultSignals();
    }

    MacdResult TechnicalIndicatorEngine::calculateMacd(const core::TimeSeries<core::Candle>& candles) const {
        MacdIndicator macd(config_.macd_fast, config_.macd_slow, config_.macd_signal);
        macd.calculate(candles);

        MacdResult result;
        const auto& line = macd.getResult();
        const auto& signal = macd.getSignalLine();
        if (line.empty()) {
            return result;
        }

        result.line = line.back();
        result.signal = signal.back();
        result.histogram = macd.getHistogram().back();
        result.is_bullish = result.line > result.signal && result.histogram > 0.0;
        result.is_bearish = result.line < result.signal && result.histogram < 0.0;

        if (line.size() >= 2) {
            const double prev_line = line[line.size() - 2];
            const double prev_signal = signal[signal.size() - 2];
            if (prev_line <= prev_signal && result.line > result.signal) {
                result.crossover = Crossover::Bullish;
            } else if (prev_line >= prev_signal && result.line < result.signal) {
                result.crossover = Crossover::Bearish;
            }
        }
        return result;
    }

    EmaResult TechnicalIndicatorEngine::calculateEmas(const core::TimeSeries<core::Candle>& candles,
                                                      double current_price) const
    {
        std::vector<std::optional<double>> values;
        for (int period : config_.ema_periods) {
            EmaIndicator ema(period);
            ema.calculate(candles);
            const auto& series = ema.getResult();
            values.push_back(series.empty() ? std::nullopt : std::optional<double>(series.back()));
        }

        EmaResult result;
        result.ema_9 = values[0];
        result.ema_20 = values[1];
        result.ema_50 = values[2];
        result.ema_200 = values[3];

        const bool all_known = std::all_of(values.begin(), values.end(),
            [](const std::optional<double>& v) { return v.has_value(); });
        if (all_known) {
            const double e9 = *result.ema_9, e20 = *result.ema_20, e50 = *result.ema_50, e200 = *result.ema_200;
            if (current_price > e9 && e9 > e20 && e20 > e50 && e50 > e200) {
                result.trend = Direction::Bullish;
            } else if (current_price < e9 && e9 < e20 && e20 < e50 && e50 < e200) {
                result.trend = Direction::Bearish;
            }
        }

        result.price_above_ema9 = result.ema_9 && current_price > *result.ema_9;
        result.price_above_ema20 = result.ema_20 && current_price > *result.ema_20;
        if (result.ema_50 && result.ema_200) {
            result.golden_cross = *result.ema_50 > *result.ema_200;
            result.death_cross = *result.ema_50 < *result.ema_200;
        }
        return result;
    }

    RsiResult TechnicalIndicatorEngine::calculateRsi(const core::TimeSeries<core::Candle>& candles) const {
        RsiIndicator rsi(config_.rsi_period);
        rsi.calculate(candles);

        RsiResult result;
        if (rsi.getResult().empty()) {
            return result;
        }
        result.value = rsi.getResult().back();
        result.overbought = result.value > config_.rsi_overbought;
        result.oversold = result.value < config_.rsi_oversold;
        if (result.value > config_.rsi_bullish_momentum) {
            result.momentum = Momentum::Bullish;
        } else if (result.value < config_.rsi_bearish_momentum) {
            result.momentum = Momentum::Bearish;
        }
        return result;
    }

    VolumeResult TechnicalIndicatorEngine::calculateVolume(const core::TimeSeries<core::Candle>& candles,
                                                           long long current_volume) const
    {
        VolumeResult result;
        const auto volumes = core::utils::extractField(candles, core::PriceField::Volume);
        if (volumes.empty()) {
            return result;
        }

        SmaIndicator volume_sma(config_.volume_sma_period, core::PriceField::Volume);
        volume_sma.calculate(candles);
        if (!volume_sma.getResult().empty()) {
            result.sma_20 = volume_sma.getResult().back();
        } else {
            result.sma_20 = core::utils::mean(volumes);
        }

        result.relative_volume = result.sma_20 > 0.0 ? static_cast<double>(current_volume) / result.sma_20 : 1.0;

        const size_t window = static_cast<size_t>(config_.volume_trend_window);
        if (volumes.size() >= window) {
            const double recent = core::utils::mean(std::vector<double>(volumes.end() - window, volumes.end()));
            double previous = result.sma_20;
            if (volumes.size() >= 2 * window) {
                previous = core::utils::mean(std::vector<double>(volumes.end() - 2 * window, volumes.end() - window));
            }
            if (recent > previous * (1.0 + config_.volume_trend_threshold)) {
                result.trend = VolumeTrend::Increasing;
            } else if (recent < previous * (1.0 - config_.volume_trend_threshold)) {
                result.trend = VolumeTrend::Decreasing;
            }
        }

        result.breakout = result.relative_volume >= config_.volume_breakout_ratio;
        return result;
    }

    double TechnicalIndicatorEngine::calculateVolatility(const core::TimeSeries<core::Candle>& candles) const {
        const size_t window = std::min(candles.size(), static_cast<size_t>(config_.volatility_window));
        if (window < 3) {
            return 0.0;
        }
        std::vector<double> returns;
        returns.reserve(window - 1);
        for (size_t i = candles.size() - window + 1; i < candles.size(); ++i) {
            const double prev = candles[i - 1].close;
            if (prev != 0.0) {
                returns.push_back(candles[i].close / prev - 1.0);
            }
        }
        return core::utils::sampleStdDev(returns) * std::sqrt(kTradingDaysPerYear);
    }

    Divergence TechnicalIndicatorEngine::detectDivergence(const core::TimeSeries<core::Candle>& candles) const {
        RsiIndicator rsi(config_.rsi_period);
        rsi.calculate(candles);
        const auto& rsi_values = rsi.getResult();
        if (rsi_values.size() < 2) {
            return Divergence::None;
        }

        // Align closes with the RSI output
        const auto closes = core::utils::extractField(candles, core::PriceField::Close);
        const std::vector<double> prices(closes.end() - static_cast<long>(rsi_values.size()), closes.end());

        const int distance = config_.divergence_peak_distance;
        const auto price_peaks = patterns::findPeaks(prices, distance, 0.0);
        const auto price_troughs = patterns::findPeaks(negated(prices), distance, 0.0);
        const auto rsi_peaks = patterns::findPeaks(rsi_values, distance, 0.0);
        const auto rsi_troughs = patterns::findPeaks(negated(rsi_values), distance, 0.0);

        const int window = config_.divergence_match_window;
        if (extremesDiverge(prices, rsi_values, price_troughs, rsi_troughs, window, true)) {
            return Divergence::Bullish;
        }
        if (extremesDiverge(prices, rsi_values, price_peaks, rsi_peaks, window, false)) {
            return Divergence::Bearish;
        }
        return Divergence::None;
    }

    double TechnicalIndicatorEngine::signalStrength(const MacdResult& macd, const EmaResult& ema,
                                                    const RsiResult& rsi, const VolumeResult& volume)
    {
        double score = 0.0;

        // MACD (25)
        if (macd.crossover == Crossover::Bullish) {
            score += 25;
        } else if (macd.crossover == Crossover::Bearish) {
            score -= 25;
        } else if (macd.is_bullish) {
            score += 15;
        } else if (macd.is_bearish) {
            score -= 15;
        }

        // EMA trend (25)
        if (ema.trend == Direction::Bullish) {
            score += 25;
        } else if (ema.trend == Direction::Bearish) {
            score -= 25;
        }

        // Price vs EMAs (15)
        if (ema.price_above_ema9 && ema.price_above_ema20) {
            score += 15;
        } else if (!ema.price_above_ema9 && !ema.price_above_ema20) {
            score -= 15;
        }

        // RSI (15); extremes count as potential reversals
        if (rsi.momentum == Momentum::Bullish && !rsi.overbought) {
            score += 15;
        } else if (rsi.momentum == Momentum::Bearish && !rsi.oversold) {
            score -= 15;
        } else if (rsi.oversold) {
            score += 10;
        } else if (rsi.overbought) {
            score -= 10;
        }

        // Volume (20)
        if (volume.breakout) {
            score += 20;
        } else if (volume.trend == VolumeTrend::Increasing) {
            score += 10;
        } else if (volume.trend == VolumeTrend::Decreasing) {
            score -= 10;
        }

        return core::utils::clamp((score + 100.0) / 2.0, 0.0, 100.0);
    }

    OverallSignal TechnicalIndicatorEngine::labelFor(double strength) {
        if (strength >= 80.0) return OverallSignal::StrongBuy;
        if (strength >= 65.0) return OverallSignal::Buy;
        if (strength >= 35.0) return OverallSignal::Hold;
        if (strength >= 20.0) return OverallSignal::Sell;
        return OverallSignal::StrongSell;
    }

    std::map<std::string, double> TechnicalIndicatorEngine::fibonacciLevels(double high, double low) {
        const double diff = high - low;
        return {
            {"0%", high},
            {"23.6%", high - diff * 0.236},
            {"38.2%", high - diff * 0.382},
            {"50%", high - diff * 0.5},
            {"61.8%", high - diff * 0.618},
            {"78.6%", high - diff * 0.786},
            {"100%", low},
        };
    }

    TechnicalSignalSet TechnicalIndicatorEngine::defaultSignals() {
        TechnicalSignalSet set;
        set.is_default = true;
        return set;
    }

    rule_engine::FactSnapshot TechnicalIndicatorEngine::conditionFacts(const TechnicalSignalSet& set) const {
        rule_engine::FactSnapshot facts;
        facts.setFlag("macd_bullish_crossover", set.macd.crossover == Crossover::Bullish);
        facts.setFlag("macd_bearish_crossover", set.macd.crossover == Crossover::Bearish);
        facts.setFlag("price_above_ema9", set.ema.price_above_ema9);
        facts.setFlag("rsi_overbought", set.rsi.overbought);
        facts.setFlag("volume_breakout", set.volume.breakout);
        facts.setLabel("ema_trend", toString(set.ema.trend));
        return facts;
    }

} // namespace indicators
