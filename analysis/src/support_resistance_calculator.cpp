#include "support_resistance_calculator.hpp"
#include "logging.hpp"
#include "peak_finder.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace analysis {

    std::string toString(LevelType type) {
        return type == LevelType::Support ? "support" : "resistance";
    }

    SupportResistanceCalculator::SupportResistanceCalculator(core::config::SupportResistanceConfig config)
        : config_(config)
    {
        if (config_.window <= 0 || config_.min_distance <= 0 || config_.max_levels <= 0) {
            throw std::invalid_argument(fmt::format(
                "SupportResistanceConfig window ({}), min_distance ({}) and max_levels ({}) must be positive.",
                config_.window, config_.min_distance, config_.max_levels));
        }
        if (config_.touch_tolerance < 0.0 || config_.prominence_factor < 0.0) {
            throw std::invalid_argument("SupportResistanceConfig tolerances cannot be negative.");
        }
    }

    SupportResistanceResult SupportResistanceCalculator::calculate(const core::TimeSeries<core::Candle>& candles,
                                                                   double current_price) const
    {
        auto logger = core::logging::getLogger();
        SupportResistanceResult result;
        if (candles.size() < 3 || current_price <= 0.0) {
            logger->debug("Support/resistance skipped ({} bars, price {}).", candles.size(), current_price);
            return result;
        }

        const size_t window = std::min(candles.size(), static_cast<size_t>(config_.window));
        const size_t window_start = candles.size() - window;
        const core::TimeSeries<core::Candle> recent(candles.begin() + static_cast<long>(window_start), candles.end());

        // Peaks of the highs are resistance, troughs of the lows support
        const auto highs = core::utils::extractField(recent, core::PriceField::High);
        std::vector<double> negated_lows = core::utils::extractField(recent, core::PriceField::Low);
        std::transform(negated_lows.begin(), negated_lows.end(), negated_lows.begin(), [](double v) { return -v; });

        result.resistances = levelsFrom(candles, highs, window_start, LevelType::Resistance, current_price);
        result.supports = levelsFrom(candles, negated_lows, window_start, LevelType::Support, current_price);

        for (const auto& level : result.supports) {
            if (level.price < current_price && (!result.nearest_support || level.price > *result.nearest_support)) {
                result.nearest_support = level.price;
            }
        }
        for (const auto& level : result.resistances) {
            if (level.price > current_price && (!result.nearest_resistance || level.price < *result.nearest_resistance)) {
                result.nearest_resistance = level.price;
            }
        }

        logger->debug("Support/resistance: {} support(s), {} resistance(s), nearest {} / {}",
                      result.supports.size(), result.resistances.size(),
                      result.nearest_support ? fmt::format("{:.2f}", *result.nearest_support) : "none",
                      result.nearest_resistance ? fmt::format("{:.2f}", *result.nearest_resistance) : "none");
        return result;
    }

    std::vector<SupportResistanceLevel> SupportResistanceCalculator::levelsFrom(
        const core::TimeSeries<core::Candle>& candles,
        const std::vector<double>& window_values,
        size_t window_start,
        LevelType type,
        double current_price) const
    {
        // Prominence threshold scales with the spread of the window (sign does not matter)
        const double prominence = core::utils::populationStdDev(window_values) * config_.prominence_factor;
        const auto pivots = patterns::findPeaks(window_values, config_.min_distance, prominence);

        std::vector<SupportResistanceLevel> levels;
        for (size_t pivot : pivots) {
            const auto& candle = candles[window_start + pivot];
            const double price = type == LevelType::Resistance ? candle.high : candle.low;

            core::Timestamp last_touch = candle.timestamp;
            const int touches = countTouches(candles, price, type, &last_touch);
            if (touches < config_.min_touches) {
                continue;
            }

            const double distance_pct = std::abs(current_price - price) / current_price;
            SupportResistanceLevel level;
            level.price = price;
            level.type = type;
            level.touches = touches;
            level.last_touch = last_touch;
            level.strength = core::utils::clamp(touches * 20.0 + (100.0 - distance_pct * 100.0), 0.0, 100.0);
            level.is_current = distance_pct < config_.current_band;
            levels.push_back(level);
        }

        std::stable_sort(levels.begin(), levels.end(),
            [](const SupportResistanceLevel& a, const SupportResistanceLevel& b) { return a.strength > b.strength; });
        if (levels.size() > static_cast<size_t>(config_.max_levels)) {
            levels.resize(static_cast<size_t>(config_.max_levels));
        }
        return levels;
    }

    int SupportResistanceCalculator::countTouches(const core::TimeSeries<core::Candle>& candles, double level,
                                                  LevelType type, core::Timestamp* last_touch) const
    {
        const double tolerance = std::abs(level) * config_.touch_tolerance;
        int touches = 0;
        for (const auto& candle : candles) {
            const double touch_price = type == LevelType::Resistance ? candle.high : candle.low;
            if (std::abs(touch_price - level) <= tolerance) {
                ++touches;
                if (last_touch) {
                    *last_touch = candle.timestamp;
                }
            }
        }
        return touches;
    }

} // namespace analysis
