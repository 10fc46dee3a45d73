#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include <string>
#include <vector>

namespace patterns {

    enum class SwingType {
        Peak,
        Trough
    };

    std::string toString(SwingType type);

    // A local extremum of the candle series. Peaks carry the bar's high, troughs its low.
    struct SwingPoint {
        size_t index = 0;          // Position in the candle series
        double price = 0.0;
        core::Timestamp timestamp;
        SwingType type = SwingType::Peak;
    };

    class SwingPointDetector {
    public:
        explicit SwingPointDetector(core::config::SwingPointConfig config = {});

        // Peaks of the high series and troughs of the low series, merged and sorted by index.
        // Returns an empty vector when the series is shorter than the configured minimum.
        std::vector<SwingPoint> detect(const core::TimeSeries<core::Candle>& candles) const;

        const core::config::SwingPointConfig& getConfig() const { return config_; }

    private:
        core::config::SwingPointConfig config_;
    };

} // namespace patterns
