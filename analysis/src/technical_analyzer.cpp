#include "technical_analyzer.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace analysis {

    namespace {

        // Preferred small-cap price band for momentum setups
        const double kPreferredMinPrice = 2.0;
        const double kPreferredMaxPrice = 20.0;

        double meanLevelStrength(const SupportResistanceResult& levels) {
            std::vector<double> strengths;
            for (const auto& level : levels.supports) {
                strengths.push_back(level.strength);
            }
            for (const auto& level : levels.resistances) {
                strengths.push_back(level.strength);
            }
            return core::utils::mean(strengths);
        }

    } // end anonymous namespace

    // --- String conversions ---

    std::string toString(MomentumStrength strength) {
        switch (strength) {
            case MomentumStrength::Strong:   return "strong";
            case MomentumStrength::Moderate: return "moderate";
            case MomentumStrength::Weak:     return "weak";
        }
        return "weak";
    }

    std::string toString(VolatilityLevel level) {
        switch (level) {
            case VolatilityLevel::High:   return "high";
            case VolatilityLevel::Medium: return "medium";
            case VolatilityLevel::Low:    return "low";
        }
        return "medium";
    }

    std::string toString(SetupQuality quality) {
        switch (quality) {
            case SetupQuality::Excellent: return "excellent";
            case SetupQuality::Good:      return "good";
            case SetupQuality::Fair:      return "fair";
            case SetupQuality::Poor:      return "poor";
        }
        return "poor";
    }

    std::string toString(EntryTiming timing) {
        switch (timing) {
            case EntryTiming::Immediate:           return "immediate";
            case EntryTiming::WaitForConfirmation: return "wait_for_confirmation";
            case EntryTiming::Wait:                return "wait";
            case EntryTiming::Avoid:               return "avoid";
        }
        return "wait";
    }

    std::string toString(EntryAction action) {
        switch (action) {
            case EntryAction::StrongBuy: return "strong_buy";
            case EntryAction::Buy:       return "buy";
            case EntryAction::WeakBuy:   return "weak_buy";
            case EntryAction::Hold:      return "hold";
        }
        return "hold";
    }

    std::string toString(ExitAction action) {
        switch (action) {
            case ExitAction::Sell:        return "sell";
            case ExitAction::PartialSell: return "partial_sell";
            case ExitAction::Hold:        return "hold";
        }
        return "hold";
    }

    // --- TechnicalAnalyzer ---

    TechnicalAnalyzer::TechnicalAnalyzer(const core::config::ScreenerConfig& config)
        : matcher_(config.abcd, config.swing_points),
          engine_(config.indicators),
          levels_(config.support_resistance)
    {
    }

    TechnicalAnalysisResult TechnicalAnalyzer::analyze(const std::string& symbol,
                                                       const core::TimeSeries<core::Candle>& candles,
                                                       double current_price,
                                                       long long current_volume,
                                                       std::optional<double> float_shares) const
    {
        auto logger = core::logging::getLogger();
        logger->debug("Performing technical analysis for {} ({} bars, price {:.2f})", symbol, candles.size(), current_price);

        core::utils::validateCandles(candles);

        TechnicalAnalysisResult result;
        result.symbol = symbol;
        result.current_price = current_price;

        result.signals = engine_.calculate(candles, current_price, current_volume);
        result.abcd = matcher_.analyze(candles);
        result.levels = levels_.calculate(candles, current_price);

        // Volatility is meaningful on short series too, even when the indicator set fell back
        const double volatility = engine_.calculateVolatility(candles);
        result.signals.volatility = volatility;

        result.entry = entryRecommendation(result.signals, result.abcd, current_price);
        result.exit = exitRecommendation(result.signals, result.abcd, current_price, result.levels.nearest_resistance);
        assessRisk(result);

        result.technical_score = technicalScore(result.signals, result.abcd, result.levels);
        result.trend = trendDirection(result.signals, result.abcd);
        result.momentum = momentumStrength(result.signals);
        result.volatility = volatilityLevel(volatility);
        assessSetup(result, float_shares);

        result.snapshot = buildSnapshot(result.signals, result.abcd, result.levels);

        logger->debug("{}: technical score {:.1f}, trend {}, momentum {}, setup {} ({})",
                      symbol, result.technical_score, indicators::toString(result.trend),
                      toString(result.momentum), toString(result.setup_quality), toString(result.entry_timing));
        return result;
    }

    double TechnicalAnalyzer::technicalScore(const indicators::TechnicalSignalSet& signals,
                                             const patterns::ABCDAnalysis& abcd,
                                             const SupportResistanceResult& levels)
    {
        double score = signals.signal_strength * 0.4;
        if (abcd.active_pattern) {
            score += abcd.active_pattern->getConfidence() * 0.3;
        }
        if (!levels.supports.empty() || !levels.resistances.empty()) {
            score += meanLevelStrength(levels) * 0.2;
        }
        if (signals.volume.breakout) {
            score += 10.0;
        } else if (signals.volume.trend == indicators::VolumeTrend::Increasing) {
            score += 5.0;
        }
        return std::min(100.0, score);
    }

    indicators::Direction TechnicalAnalyzer::trendDirection(const indicators::TechnicalSignalSet& signals,
                                                            const patterns::ABCDAnalysis& abcd)
    {
        int bullish = 0;
        int bearish = 0;

        if (signals.ema.trend == indicators::Direction::Bullish) {
            bullish += 2;
        } else if (signals.ema.trend == indicators::Direction::Bearish) {
            bearish += 2;
        }

        if (signals.macd.is_bullish) {
            ++bullish;
        } else if (signals.macd.is_bearish) {
            ++bearish;
        }

        if (abcd.active_pattern) {
            if (abcd.active_pattern->getType() == patterns::PatternType::Bullish) {
                ++bullish;
            } else {
                ++bearish;
            }
        }

        if (bullish > bearish) return indicators::Direction::Bullish;
        if (bearish > bullish) return indicators::Direction::Bearish;
        return indicators::Direction::Sideways;
    }

    MomentumStrength TechnicalAnalyzer::momentumStrength(const indicators::TechnicalSignalSet& signals) {
        int points = 0;

        const double relative_volume = signals.volume.relative_volume;
        if (relative_volume >= 5.0) {
            points += 3;
        } else if (relative_volume >= 2.0) {
            points += 2;
        } else if (relative_volume >= 1.5) {
            points += 1;
        }

        const double histogram = std::abs(signals.macd.histogram);
        if (histogram > 0.1) {
            points += 2;
        } else if (histogram > 0.05) {
            points += 1;
        }

        if (signals.rsi.momentum != indicators::Momentum::Neutral) {
            points += 1;
        }

        if (points >= 5) return MomentumStrength::Strong;
        if (points >= 3) return MomentumStrength::Moderate;
        return MomentumStrength::Weak;
    }

    VolatilityLevel TechnicalAnalyzer::volatilityLevel(double annualized_volatility) {
        if (annualized_volatility > 0.5) return VolatilityLevel::High;
        if (annualized_volatility > 0.3) return VolatilityLevel::Medium;
        return VolatilityLevel::Low;
    }

    EntryRecommendation TechnicalAnalyzer::entryRecommendation(const indicators::TechnicalSignalSet& signals,
                                                               const patterns::ABCDAnalysis& abcd,
                                                               double current_price)
    {
        EntryRecommendation rec;
        rec.entry_price = current_price;

        if (signals.entry_signal) {
            rec.reasons.push_back("Technical entry signal triggered");
            rec.confidence += 30;
        }
        if (signals.macd.crossover == indicators::Crossover::Bullish) {
            rec.reasons.push_back("MACD bullish crossover");
            rec.confidence += 25;
        }
        if (signals.ema.price_above_ema9 && signals.ema.trend == indicators::Direction::Bullish) {
            rec.reasons.push_back("Price above 9 EMA with bullish trend");
            rec.confidence += 20;
        }
        if (signals.volume.breakout) {
            rec.reasons.push_back("Volume breakout confirmed");
            rec.confidence += 20;
        }
        for (const auto& signal : abcd.entry_signals) {
            if (signal.signal_strength != patterns::PatternStrength::Weak) {
                rec.reasons.push_back(fmt::format("ABCD {} entry signal", patterns::toString(signal.pattern_type)));
                rec.confidence += 15;
            }
        }
        if (!signals.rsi.overbought && signals.rsi.momentum == indicators::Momentum::Bullish) {
            rec.reasons.push_back("RSI shows bullish momentum without overbought");
            rec.confidence += 10;
        }

        if (rec.confidence >= 70) {
            rec.action = EntryAction::StrongBuy;
            rec.timing = EntryTiming::Immediate;
        } else if (rec.confidence >= 50) {
            rec.action = EntryAction::Buy;
            rec.timing = EntryTiming::Immediate;
        } else if (rec.confidence >= 30) {
            rec.action = EntryAction::WeakBuy;
            rec.timing = EntryTiming::WaitForConfirmation;
        }
        return rec;
    }

    ExitRecommendation TechnicalAnalyzer::exitRecommendation(const indicators::TechnicalSignalSet& signals,
                                                             const patterns::ABCDAnalysis& abcd,
                                                             double current_price,
                                                             std::optional<double> nearest_resistance)
    {
        ExitRecommendation rec;
        rec.exit_price = current_price;

        if (signals.exit_signal) {
            rec.reasons.push_back("Technical exit signal triggered");
            rec.confidence += 30;
        }
        if (signals.macd.crossover == indicators::Crossover::Bearish) {
            rec.reasons.push_back("MACD bearish crossover");
            rec.confidence += 25;
        }
        if (!signals.ema.price_above_ema9) {
            rec.reasons.push_back("Price below 9 EMA");
            rec.confidence += 20;
        }
        if (signals.rsi.overbought) {
            rec.reasons.push_back("RSI overbought");
            rec.confidence += 15;
        }
        for (const auto& signal : abcd.exit_signals) {
            if (signal.kind == patterns::PatternSignalKind::TakeProfit) {
                rec.reasons.push_back("ABCD pattern target reached");
                rec.confidence += 20;
            } else if (signal.kind == patterns::PatternSignalKind::StopLoss) {
                rec.reasons.push_back("ABCD pattern stop loss hit");
                rec.confidence += 30;
                rec.urgency = scoring::Urgency::High;
            }
        }
        if (nearest_resistance && current_price >= *nearest_resistance * 0.98) {
            rec.reasons.push_back("Approaching resistance level");
            rec.confidence += 15;
        }

        if (rec.confidence >= 60) {
            rec.action = ExitAction::Sell;
            rec.urgency = rec.confidence >= 80 ? scoring::Urgency::High : scoring::Urgency::Medium;
        } else if (rec.confidence >= 40) {
            rec.action = ExitAction::PartialSell;
            rec.urgency = scoring::Urgency::Medium;
        }
        return rec;
    }

    scoring::TechnicalSnapshot TechnicalAnalyzer::buildSnapshot(const indicators::TechnicalSignalSet& signals,
                                                                const patterns::ABCDAnalysis& abcd,
                                                                const SupportResistanceResult& levels)
    {
        scoring::TechnicalSnapshot snapshot;
        snapshot.macd_line = signals.macd.line;
        snapshot.macd_signal = signals.macd.signal;
        snapshot.macd_histogram = signals.macd.histogram;
        snapshot.ema_9 = signals.ema.ema_9.value_or(0.0);
        snapshot.ema_20 = signals.ema.ema_20.value_or(0.0);
        snapshot.rsi = signals.rsi.value;
        snapshot.volatility = signals.volatility;
        snapshot.relative_volume = signals.volume.relative_volume;

        for (const auto& level : levels.supports) {
            snapshot.support_levels.push_back(level.price);
        }
        for (const auto& level : levels.resistances) {
            snapshot.resistance_levels.push_back(level.price);
        }

        for (const auto& pattern : abcd.complete_patterns) {
            snapshot.patterns_detected.push_back("abcd_" + patterns::toString(pattern.getType()));
        }
        for (const auto& pattern : abcd.forming_patterns) {
            if (pattern.isValid()) {
                snapshot.patterns_detected.push_back("abcd_" + patterns::toString(pattern.getType()) + "_forming");
            }
        }
        return snapshot;
    }

    void TechnicalAnalyzer::assessRisk(TechnicalAnalysisResult& result) const {
        const double price = result.current_price;
        if (price <= 0.0) {
            return;
        }

        const double stop = result.levels.nearest_support ? *result.levels.nearest_support * 0.98 : price * 0.95;
        const double risk = price - stop;
        const double target = result.levels.nearest_resistance ? *result.levels.nearest_resistance * 0.98
                                                               : price + risk * 2.0;
        result.stop_loss = stop;
        result.take_profit = target;
        if (risk > 0.0) {
            result.risk_reward_ratio = (target - price) / risk;
        }
    }

    void TechnicalAnalyzer::assessSetup(TechnicalAnalysisResult& result, std::optional<double> float_shares) const {
        const auto& signals = result.signals;
        double points = 0.0;

        // Price range (20)
        if (result.current_price >= kPreferredMinPrice && result.current_price <= kPreferredMaxPrice) {
            points += 20;
        } else {
            points += 10;
        }

        // Volume (25)
        const double relative_volume = signals.volume.relative_volume;
        if (relative_volume >= 5.0) {
            points += 25;
        } else if (relative_volume >= 3.0) {
            points += 20;
        } else if (relative_volume >= 2.0) {
            points += 15;
        }

        // Float (15)
        if (float_shares && *float_shares > 0.0) {
            if (*float_shares <= 20'000'000) {
                points += 15;
            } else if (*float_shares <= 50'000'000) {
                points += 10;
            }
        }

        // Technical confirmation (25)
        if (signals.entry_signal) {
            points += 15;
        }
        if (signals.macd.crossover == indicators::Crossover::Bullish) {
            points += 10;
        }

        // Pattern (15)
        if (result.abcd.active_pattern && result.abcd.active_pattern->getConfidence() >= 70) {
            points += 15;
        } else if (!result.abcd.entry_signals.empty()) {
            points += 10;
        }

        if (points >= 80) {
            result.setup_quality = SetupQuality::Excellent;
            result.entry_timing = EntryTiming::Immediate;
        } else if (points >= 65) {
            result.setup_quality = SetupQuality::Good;
            result.entry_timing = EntryTiming::Immediate;
        } else if (points >= 50) {
            result.setup_quality = SetupQuality::Fair;
            result.entry_timing = EntryTiming::Wait;
        } else {
            result.setup_quality = SetupQuality::Poor;
            result.entry_timing = EntryTiming::Avoid;
        }
        result.ross_setup = points >= 50;
    }

} // namespace analysis
