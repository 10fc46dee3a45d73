#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <cmath>
#include <string>
#include <vector>

namespace core {
namespace config {

    namespace { // file-local helpers

        // Reads config[key] into target if present. Type mismatches surface as ConfigException.
        template<typename T>
        void readValue(const json& section, const char* section_name, const char* key, T& target) {
            if (!section.contains(key)) {
                return;
            }
            try {
                target = section.at(key).get<T>();
            } catch (const json::exception& e) {
                throw ConfigException(fmt::format("Invalid value for '{}.{}': {}", section_name, key, e.what()));
            }
        }

        const json* findSection(const json& document, const char* name) {
            if (!document.contains(name)) {
                return nullptr;
            }
            const json& section = document.at(name);
            if (!section.is_object()) {
                throw ConfigException(fmt::format("Config section '{}' must be an object.", name));
            }
            return &section;
        }

        void requirePositive(int value, const char* name) {
            if (value <= 0) {
                throw ConfigException(fmt::format("'{}' must be positive (got {}).", name, value));
            }
        }

        void requireUnitInterval(double value, const char* name) {
            if (value < 0.0 || value > 1.0) {
                throw ConfigException(fmt::format("'{}' must lie in [0, 1] (got {}).", name, value));
            }
        }

        void requireWeightSum(double sum, const char* what) {
            if (std::fabs(sum - 1.0) > 1e-6) {
                throw ConfigException(fmt::format("{} weights must sum to 1.0 (got {}).", what, sum));
            }
        }

    } // end anonymous namespace

    void ConfigLoader::validate(const ScoringWeights& weights) {
        requireUnitInterval(weights.fundamental, "weights.fundamental");
        requireUnitInterval(weights.technical, "weights.technical");
        requireUnitInterval(weights.news_sentiment, "weights.news_sentiment");
        requireUnitInterval(weights.volume_momentum, "weights.volume_momentum");
        requireWeightSum(weights.fundamental + weights.technical + weights.news_sentiment + weights.volume_momentum,
                         "Composite component");
    }

    void ConfigLoader::validate(const RossConfig& ross) {
        requireUnitInterval(ross.volume_weight, "ross.volume_weight");
        requireUnitInterval(ross.price_change_weight, "ross.price_change_weight");
        requireUnitInterval(ross.float_weight, "ross.float_weight");
        requireUnitInterval(ross.catalyst_weight, "ross.catalyst_weight");
        requireUnitInterval(ross.price_range_weight, "ross.price_range_weight");
        requireWeightSum(ross.volume_weight + ross.price_change_weight + ross.float_weight +
                         ross.catalyst_weight + ross.price_range_weight,
                         "Ross pillar");
        if (ross.min_pillars < 1 || ross.min_pillars > 5) {
            throw ConfigException(fmt::format("'ross.min_pillars' must be between 1 and 5 (got {}).", ross.min_pillars));
        }
        if (ross.high_impact_boost < 1.0) {
            throw ConfigException("'ross.high_impact_boost' must be >= 1.0.");
        }
    }

    void ConfigLoader::validate(const ScreenerConfig& config) {
        // Swing points
        requirePositive(config.swing_points.min_bars, "swing_points.min_bars");
        requirePositive(config.swing_points.min_distance, "swing_points.min_distance");
        if (config.swing_points.prominence_factor < 0.0) {
            throw ConfigException("'swing_points.prominence_factor' must be non-negative.");
        }

        // ABCD
        const auto& abcd = config.abcd;
        requirePositive(abcd.max_pattern_bars, "abcd.max_pattern_bars");
        requirePositive(abcd.lookahead, "abcd.lookahead");
        requirePositive(abcd.forming_lookahead, "abcd.forming_lookahead");
        requirePositive(abcd.stale_bars, "abcd.stale_bars");
        requirePositive(abcd.max_forming_patterns, "abcd.max_forming_patterns");
        if (abcd.min_retracement <= 0.0 || abcd.min_retracement >= abcd.max_retracement) {
            throw ConfigException(fmt::format("ABCD retracement range [{}, {}] is invalid.",
                                              abcd.min_retracement, abcd.max_retracement));
        }
        requireUnitInterval(abcd.fib_tolerance, "abcd.fib_tolerance");
        requireUnitInterval(abcd.actionable_completion, "abcd.actionable_completion");
        requireUnitInterval(abcd.stop_buffer, "abcd.stop_buffer");

        // Indicators
        const auto& ind = config.indicators;
        requirePositive(ind.macd_fast, "indicators.macd_fast");
        requirePositive(ind.macd_slow, "indicators.macd_slow");
        requirePositive(ind.macd_signal, "indicators.macd_signal");
        if (ind.macd_fast >= ind.macd_slow) {
            throw ConfigException("'indicators.macd_fast' must be smaller than 'indicators.macd_slow'.");
        }
        if (ind.ema_periods.size() != 4) {
            throw ConfigException(fmt::format("'indicators.ema_periods' needs exactly 4 periods (got {}).",
                                              ind.ema_periods.size()));
        }
        for (size_t i = 0; i < ind.ema_periods.size(); ++i) {
            requirePositive(ind.ema_periods[i], "indicators.ema_periods[]");
            if (i > 0 && ind.ema_periods[i] <= ind.ema_periods[i - 1]) {
                throw ConfigException("'indicators.ema_periods' must be strictly ascending.");
            }
        }
        requirePositive(ind.rsi_period, "indicators.rsi_period");
        requirePositive(ind.volume_sma_period, "indicators.volume_sma_period");
        requirePositive(ind.volume_trend_window, "indicators.volume_trend_window");
        requirePositive(ind.volatility_window, "indicators.volatility_window");
        if (ind.rsi_oversold >= ind.rsi_overbought) {
            throw ConfigException("'indicators.rsi_oversold' must be below 'indicators.rsi_overbought'.");
        }

        // Support / resistance
        requirePositive(config.support_resistance.window, "support_resistance.window");
        requirePositive(config.support_resistance.min_distance, "support_resistance.min_distance");
        requirePositive(config.support_resistance.max_levels, "support_resistance.max_levels");
        requireUnitInterval(config.support_resistance.touch_tolerance, "support_resistance.touch_tolerance");
        requireUnitInterval(config.support_resistance.current_band, "support_resistance.current_band");

        validate(config.weights);
        validate(config.ross);

        // Signals
        requireUnitInterval(config.signals.base_risk_per_trade, "signals.base_risk_per_trade");
        requireUnitInterval(config.signals.max_position_fraction, "signals.max_position_fraction");
        if (config.batch.worker_threads < 0) {
            throw ConfigException("'batch.worker_threads' cannot be negative.");
        }
    }

    ScreenerConfig ConfigLoader::fromJson(const json& document) {
        if (!document.is_object()) {
            throw ConfigException("Screener config must be a JSON object.");
        }

        ScreenerConfig config;

        if (const json* s = findSection(document, "swing_points")) {
            readValue(*s, "swing_points", "min_bars", config.swing_points.min_bars);
            readValue(*s, "swing_points", "min_distance", config.swing_points.min_distance);
            readValue(*s, "swing_points", "prominence_factor", config.swing_points.prominence_factor);
        }

        if (const json* s = findSection(document, "abcd")) {
            auto& c = config.abcd;
            readValue(*s, "abcd", "max_pattern_bars", c.max_pattern_bars);
            readValue(*s, "abcd", "lookahead", c.lookahead);
            readValue(*s, "abcd", "forming_lookahead", c.forming_lookahead);
            readValue(*s, "abcd", "stale_bars", c.stale_bars);
            readValue(*s, "abcd", "max_forming_patterns", c.max_forming_patterns);
            readValue(*s, "abcd", "fib_tolerance", c.fib_tolerance);
            readValue(*s, "abcd", "min_retracement", c.min_retracement);
            readValue(*s, "abcd", "max_retracement", c.max_retracement);
            readValue(*s, "abcd", "ideal_ab_cd", c.ideal_ab_cd);
            readValue(*s, "abcd", "ideal_bc_cd", c.ideal_bc_cd);
            readValue(*s, "abcd", "target_extension", c.target_extension);
            readValue(*s, "abcd", "stop_buffer", c.stop_buffer);
            readValue(*s, "abcd", "actionable_completion", c.actionable_completion);
            readValue(*s, "abcd", "entry_proximity", c.entry_proximity);
            readValue(*s, "abcd", "min_entry_confidence", c.min_entry_confidence);
        }

        if (const json* s = findSection(document, "indicators")) {
            auto& c = config.indicators;
            readValue(*s, "indicators", "min_bars", c.min_bars);
            readValue(*s, "indicators", "macd_fast", c.macd_fast);
            readValue(*s, "indicators", "macd_slow", c.macd_slow);
            readValue(*s, "indicators", "macd_signal", c.macd_signal);
            readValue(*s, "indicators", "ema_periods", c.ema_periods);
            readValue(*s, "indicators", "rsi_period", c.rsi_period);
            readValue(*s, "indicators", "rsi_overbought", c.rsi_overbought);
            readValue(*s, "indicators", "rsi_oversold", c.rsi_oversold);
            readValue(*s, "indicators", "rsi_bullish_momentum", c.rsi_bullish_momentum);
            readValue(*s, "indicators", "rsi_bearish_momentum", c.rsi_bearish_momentum);
            readValue(*s, "indicators", "volume_sma_period", c.volume_sma_period);
            readValue(*s, "indicators", "volume_breakout_ratio", c.volume_breakout_ratio);
            readValue(*s, "indicators", "volume_trend_window", c.volume_trend_window);
            readValue(*s, "indicators", "volume_trend_threshold", c.volume_trend_threshold);
            readValue(*s, "indicators", "volatility_window", c.volatility_window);
        }

        if (const json* s = findSection(document, "support_resistance")) {
            auto& c = config.support_resistance;
            readValue(*s, "support_resistance", "window", c.window);
            readValue(*s, "support_resistance", "min_distance", c.min_distance);
            readValue(*s, "support_resistance", "prominence_factor", c.prominence_factor);
            readValue(*s, "support_resistance", "touch_tolerance", c.touch_tolerance);
            readValue(*s, "support_resistance", "min_touches", c.min_touches);
            readValue(*s, "support_resistance", "current_band", c.current_band);
            readValue(*s, "support_resistance", "max_levels", c.max_levels);
        }

        if (const json* s = findSection(document, "weights")) {
            readValue(*s, "weights", "fundamental", config.weights.fundamental);
            readValue(*s, "weights", "technical", config.weights.technical);
            readValue(*s, "weights", "news_sentiment", config.weights.news_sentiment);
            readValue(*s, "weights", "volume_momentum", config.weights.volume_momentum);
        }

        if (const json* s = findSection(document, "ross")) {
            auto& c = config.ross;
            readValue(*s, "ross", "volume_weight", c.volume_weight);
            readValue(*s, "ross", "price_change_weight", c.price_change_weight);
            readValue(*s, "ross", "float_weight", c.float_weight);
            readValue(*s, "ross", "catalyst_weight", c.catalyst_weight);
            readValue(*s, "ross", "price_range_weight", c.price_range_weight);
            readValue(*s, "ross", "high_impact_boost", c.high_impact_boost);
            readValue(*s, "ross", "high_impact_catalysts", c.high_impact_catalysts);
            readValue(*s, "ross", "volume_bar", c.volume_bar);
            readValue(*s, "ross", "price_change_bar", c.price_change_bar);
            readValue(*s, "ross", "float_bar", c.float_bar);
            readValue(*s, "ross", "catalyst_bar", c.catalyst_bar);
            readValue(*s, "ross", "price_range_bar", c.price_range_bar);
            readValue(*s, "ross", "min_pillars", c.min_pillars);
            readValue(*s, "ross", "min_ross_score", c.min_ross_score);
        }

        if (const json* s = findSection(document, "signals")) {
            readValue(*s, "signals", "base_risk_per_trade", config.signals.base_risk_per_trade);
            readValue(*s, "signals", "max_position_fraction", config.signals.max_position_fraction);
            if (s->contains("alert_rules")) {
                config.signals.alert_rules = s->at("alert_rules");
            }
            if (s->contains("warning_rules")) {
                config.signals.warning_rules = s->at("warning_rules");
            }
        }

        if (const json* s = findSection(document, "batch")) {
            readValue(*s, "batch", "worker_threads", config.batch.worker_threads);
        }

        if (const json* s = findSection(document, "logging")) {
            readValue(*s, "logging", "base_file_name", config.logging.base_file_name);
            readValue(*s, "logging", "console_level", config.logging.console_level);
            readValue(*s, "logging", "file_level", config.logging.file_level);
            readValue(*s, "logging", "file_enabled", config.logging.file_enabled);
        }

        validate(config);
        return config;
    }

    ScreenerConfig ConfigLoader::fromFile(const std::string& path) {
        std::ifstream input(path);
        if (!input.is_open()) {
            throw ConfigException(fmt::format("Could not open config file '{}'.", path));
        }

        json document;
        try {
            input >> document;
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }

        core::logging::getLogger()->info("Loaded screener config from '{}'", path);
        return fromJson(document);
    }

} // namespace config
} // namespace core
