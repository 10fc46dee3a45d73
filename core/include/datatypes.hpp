#pragma once // Use #pragma once for include guards (common practice)

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <optional> // For nullable fields supplied by upstream collaborators

namespace core {

    // Using system_clock for time points, can be adjusted if needed
    using Timestamp = std::chrono::system_clock::time_point;


    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Basic TimeSeries concept
    template<typename T>
    using TimeSeries = std::vector<T>;

    // Which column of a candle an indicator or detector reads
    enum class PriceField {
        Open,
        High,
        Low,
        Close,
        Volume
    };

    // --- Externally supplied summaries ---
    // These are produced by the market-data, fundamentals and news collaborators.
    // The screening core only consumes them.

    struct FundamentalSummary {
        std::optional<double> float_shares;
        std::optional<double> shares_outstanding;
        std::optional<double> market_cap;
        std::string sector;
        std::string industry;
        double short_interest_pct = 0.0;
    };

    // Catalyst urgency as classified by the news pipeline
    enum class NewsUrgency {
        Low,
        Medium,
        High,
        Urgent
    };

    struct NewsSummary {
        double avg_sentiment = 0.0;          // [-1, 1]
        double sentiment_confidence = 0.5;   // [0, 1]
        bool catalyst_detected = false;
        std::vector<std::string> catalyst_types; // e.g. "fda_approval", "earnings_beat"
        double catalyst_score = 0.0;         // [0, 100]
        double catalyst_confidence = 0.5;    // [0, 1]
        double news_momentum_score = 0.0;    // [0, 100]
        std::optional<Timestamp> latest_catalyst_time;
        int total_articles = 0;
        int negative_articles = 0;
        NewsUrgency urgency = NewsUrgency::Low;
    };

    struct MarketSnapshot {
        double current_price = 0.0;
        long long volume = 0;
        double relative_volume = 1.0;
        double price_change_pct = 0.0;
        double gap_pct = 0.0;
        std::optional<double> week52_high;
        std::optional<double> week52_low;
    };

    // Only needed when position sizing is requested
    struct PortfolioSnapshot {
        double account_value = 0.0;
        double available_cash = 0.0;
        int open_positions = 0;
    };

} // namespace core
