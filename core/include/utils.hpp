#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace core {
namespace utils {

    // Convert Timestamp to ISO 8601 UTC string (e.g. 2024-03-01T14:30:00Z)
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 string (Z or +HH:MM offset) to Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    std::string toString(NewsUrgency urgency);

    // --- Series helpers ---

    // Copies one column out of a candle series
    std::vector<double> extractField(const TimeSeries<Candle>& candles, PriceField field);

    double mean(const std::vector<double>& values);

    // Population standard deviation (divides by N); 0 for fewer than 2 values
    double populationStdDev(const std::vector<double>& values);

    // Sample standard deviation (divides by N-1); 0 for fewer than 2 values
    double sampleStdDev(const std::vector<double>& values);

    double clamp(double value, double lo, double hi);

    // Throws ValidationException if timestamps are not strictly increasing or a candle is malformed
    void validateCandles(const TimeSeries<Candle>& candles);

    // Case-insensitive substring test
    bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

} // namespace utils
} // namespace core
