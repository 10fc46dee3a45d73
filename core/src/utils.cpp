#include "utils.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For std::istringstream
#include <string>
#include <cmath>      // For std::pow, std::sqrt
#include <cctype>
#include <chrono>
#include <algorithm>
#include <numeric>
#include <ctime>

namespace core {
namespace utils {

    // Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]". A missing zone is read as UTC.
    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw ValidationException("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                    throw ValidationException("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else if (sign_or_z != 'Z') {
                throw ValidationException("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        }

        // 4. tm -> UTC epoch seconds
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
            throw ValidationException("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // Local wall time minus its offset gives UTC
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);

        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    std::string toString(NewsUrgency urgency) {
        switch (urgency) {
            case NewsUrgency::Low:    return "low";
            case NewsUrgency::Medium: return "medium";
            case NewsUrgency::High:   return "high";
            case NewsUrgency::Urgent: return "urgent";
        }
        return "low";
    }

    std::vector<double> extractField(const TimeSeries<Candle>& candles, PriceField field) {
        std::vector<double> values;
        values.reserve(candles.size());
        for (const auto& candle : candles) {
            switch (field) {
                case PriceField::Open:   values.push_back(candle.open); break;
                case PriceField::High:   values.push_back(candle.high); break;
                case PriceField::Low:    values.push_back(candle.low); break;
                case PriceField::Close:  values.push_back(candle.close); break;
                case PriceField::Volume: values.push_back(static_cast<double>(candle.volume)); break;
            }
        }
        return values;
    }

    double mean(const std::vector<double>& values) {
        if (values.empty()) {
            return 0.0;
        }
        return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    }

    double populationStdDev(const std::vector<double>& values) {
        if (values.size() < 2) {
            return 0.0;
        }
        const double m = mean(values);
        double sum_sq = 0.0;
        for (double v : values) {
            sum_sq += (v - m) * (v - m);
        }
        return std::sqrt(sum_sq / static_cast<double>(values.size()));
    }

    double sampleStdDev(const std::vector<double>& values) {
        if (values.size() < 2) {
            return 0.0;
        }
        const double m = mean(values);
        double sum_sq = 0.0;
        for (double v : values) {
            sum_sq += (v - m) * (v - m);
        }
        return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
    }

    double clamp(double value, double lo, double hi) {
        return std::max(lo, std::min(hi, value));
    }

    void validateCandles(const TimeSeries<Candle>& candles) {
        for (size_t i = 0; i < candles.size(); ++i) {
            const auto& c = candles[i];
            if (!std::isfinite(c.open) || !std::isfinite(c.high) || !std::isfinite(c.low) || !std::isfinite(c.close)) {
                throw ValidationException(fmt::format("Candle {} has a non-finite price.", i));
            }
            if (c.high < c.low) {
                throw ValidationException(fmt::format("Candle {} has high {} below low {}.", i, c.high, c.low));
            }
            if (c.volume < 0) {
                throw ValidationException(fmt::format("Candle {} has negative volume.", i));
            }
            if (i > 0 && !(candles[i - 1].timestamp < c.timestamp)) {
                throw ValidationException(fmt::format("Candle timestamps are not strictly increasing at index {}.", i));
            }
        }
    }

    bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
        auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
            [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
        return it != haystack.end();
    }

} // namespace utils
} // namespace core
