#include "swing_point_detector.hpp"
#include "peak_finder.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <stdexcept>

namespace patterns {

std::string toString(SwingType type) {
    return type == SwingType::Peak ? "peak" : "trough";
}

SwingPointDetector::SwingPointDetector(core::config::SwingPointConfig config)
    : config_(std::move(config))
{
    if (config_.min_distance <= 0) {
        throw std::invalid_argument(fmt::format("Swing point distance must be positive (got {}).", config_.min_distance));
    }
    if (config_.prominence_factor < 0.0) {
        throw std::invalid_argument("Swing point prominence factor cannot be negative.");
    }
}

std::vector<SwingPoint> SwingPointDetector::detect(const core::TimeSeries<core::Candle>& candles) const {
    auto logger = core::logging::getLogger();
    std::vector<SwingPoint> swing_points;

    if (candles.size() < static_cast<size_t>(config_.min_bars)) {
        logger->debug("SwingPointDetector: {} bars is below the minimum of {}. No swing points.",
                      candles.size(), config_.min_bars);
        return swing_points;
    }

    const auto highs = core::utils::extractField(candles, core::PriceField::High);
    const auto lows = core::utils::extractField(candles, core::PriceField::Low);

    // Troughs are the peaks of the negated low series
    std::vector<double> inverted_lows(lows.size());
    std::transform(lows.begin(), lows.end(), inverted_lows.begin(), [](double v) { return -v; });

    const double peak_prominence = core::utils::populationStdDev(highs) * config_.prominence_factor;
    const double trough_prominence = core::utils::populationStdDev(lows) * config_.prominence_factor;

    for (size_t idx : findPeaks(highs, config_.min_distance, peak_prominence)) {
        swing_points.push_back({idx, highs[idx], candles[idx].timestamp, SwingType::Peak});
    }
    for (size_t idx : findPeaks(inverted_lows, config_.min_distance, trough_prominence)) {
        swing_points.push_back({idx, lows[idx], candles[idx].timestamp, SwingType::Trough});
    }

    std::stable_sort(swing_points.begin(), swing_points.end(),
        [](const SwingPoint& a, const SwingPoint& b) { return a.index < b.index; });

    logger->debug("SwingPointDetector: found {} swing points in {} bars", swing_points.size(), candles.size());
    return swing_points;
}

} // namespace patterns
