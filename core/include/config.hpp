#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace core {
namespace config {

    using json = nlohmann::json;

    // --- Per-component settings ---
    // Each component receives its struct by value at construction and never mutates it.

    struct SwingPointConfig {
        int min_bars = 10;                 // Fewer bars -> no swing points
        int min_distance = 3;              // Minimum bars between two peaks (or two troughs)
        double prominence_factor = 0.5;    // Prominence threshold in units of population std-dev
    };

    struct ABCDConfig {
        int min_swing_points_complete = 4;
        int min_swing_points_forming = 3;
        int max_pattern_bars = 50;         // D.index - A.index upper bound
        int lookahead = 8;                 // Swing points searched after each vertex
        int forming_lookahead = 6;
        int stale_bars = 20;               // Forming patterns older than this (since C) are dropped
        int max_forming_patterns = 5;
        double fib_tolerance = 0.1;
        double min_retracement = 0.382;
        double max_retracement = 0.786;
        double ideal_ab_cd = 1.0;
        double ideal_bc_cd = 0.618;
        double target_extension = 0.618;   // Target = D +/- extension * CD
        double stop_buffer = 0.02;         // Stop = C -/+ buffer
        double actionable_completion = 0.75;
        double entry_proximity = 0.1;      // Fraction of CD distance around D that counts as "at D"
        double min_entry_confidence = 60.0;
    };

    struct IndicatorConfig {
        int min_bars = 50;
        int macd_fast = 12;
        int macd_slow = 26;
        int macd_signal = 9;
        std::vector<int> ema_periods {9, 20, 50, 200};
        int rsi_period = 14;
        double rsi_overbought = 70.0;
        double rsi_oversold = 30.0;
        double rsi_bullish_momentum = 60.0;
        double rsi_bearish_momentum = 40.0;
        int volume_sma_period = 20;
        double volume_breakout_ratio = 2.0;
        int volume_trend_window = 5;
        double volume_trend_threshold = 0.2;
        int volatility_window = 20;
        int divergence_peak_distance = 5;
        int divergence_match_window = 3;
        int entry_min_conditions = 3;
        int exit_min_conditions = 2;
    };

    struct SupportResistanceConfig {
        int window = 50;
        int min_distance = 3;
        double prominence_factor = 0.3;
        double touch_tolerance = 0.01;
        int min_touches = 2;
        double current_band = 0.02;
        int max_levels = 5;
    };

    struct ScoringWeights {
        double fundamental = 0.25;
        double technical = 0.30;
        double news_sentiment = 0.25;
        double volume_momentum = 0.20;
    };

    struct RossConfig {
        double volume_weight = 0.25;
        double price_change_weight = 0.20;
        double float_weight = 0.25;
        double catalyst_weight = 0.20;
        double price_range_weight = 0.10;
        double high_impact_boost = 1.2;
        std::vector<std::string> high_impact_catalysts {"fda_approval", "merger_acquisition", "earnings_beat"};
        // Individual pillar bars for the 4-of-5 acceptance rule
        double volume_bar = 80.0;
        double price_change_bar = 70.0;
        double float_bar = 80.0;
        double catalyst_bar = 70.0;
        double price_range_bar = 80.0;
        int min_pillars = 4;
        double min_ross_score = 80.0;
    };

    struct SignalConfig {
        double base_risk_per_trade = 0.02;
        double max_position_fraction = 0.10;
        // Optional rule-list overrides (same format as the embedded defaults)
        json alert_rules;
        json warning_rules;
    };

    struct BatchConfig {
        int worker_threads = 0; // 0 -> std::thread::hardware_concurrency()
    };

    struct LoggingConfig {
        std::string base_file_name = "momentum_screener";
        std::string console_level = "info";
        std::string file_level = "debug";
        bool file_enabled = true;
    };

    struct ScreenerConfig {
        SwingPointConfig swing_points;
        ABCDConfig abcd;
        IndicatorConfig indicators;
        SupportResistanceConfig support_resistance;
        ScoringWeights weights;
        RossConfig ross;
        SignalConfig signals;
        BatchConfig batch;
        LoggingConfig logging;
    };

    // --- Loader ---
    class ConfigLoader {
    public:
        // Missing sections/keys keep their defaults. Throws core::ConfigException on
        // malformed structure or out-of-range values.
        static ScreenerConfig fromJson(const json& document);
        static ScreenerConfig fromFile(const std::string& path);

        // Range checks shared by the loader and by component constructors
        static void validate(const ScreenerConfig& config);
        static void validate(const ScoringWeights& weights);
        static void validate(const RossConfig& ross);
    };

} // namespace config
} // namespace core
