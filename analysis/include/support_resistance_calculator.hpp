#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace analysis {

    enum class LevelType { Support, Resistance };

    std::string toString(LevelType type);

    struct SupportResistanceLevel {
        double price = 0.0;
        double strength = 0.0;     // 0-100
        LevelType type = LevelType::Support;
        int touches = 0;
        core::Timestamp last_touch;
        bool is_current = false;   // within the current band of the live price
    };

    struct SupportResistanceResult {
        std::vector<SupportResistanceLevel> supports;    // strongest first
        std::vector<SupportResistanceLevel> resistances; // strongest first
        std::optional<double> nearest_support;           // highest support below the price
        std::optional<double> nearest_resistance;        // lowest resistance above the price
    };

    // Pivot highs/lows of the recent window, kept when price has touched them repeatedly.
    class SupportResistanceCalculator {
    public:
        explicit SupportResistanceCalculator(core::config::SupportResistanceConfig config = {});

        SupportResistanceResult calculate(const core::TimeSeries<core::Candle>& candles, double current_price) const;

        // Bars of the whole series whose high (resistance) or low (support) lies within the
        // touch tolerance of `level`. `last_touch` receives the latest touching bar's timestamp.
        int countTouches(const core::TimeSeries<core::Candle>& candles, double level, LevelType type,
                         core::Timestamp* last_touch = nullptr) const;

        const core::config::SupportResistanceConfig& getConfig() const { return config_; }

    private:
        std::vector<SupportResistanceLevel> levelsFrom(const core::TimeSeries<core::Candle>& candles,
                                                       const std::vector<double>& window_values,
                                                       size_t window_start,
                                                       LevelType type,
                                                       double current_price) const;

        core::config::SupportResistanceConfig config_;
    };

} // namespace analysis
