#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace scoring {

    enum class RiskLevel { Low, Medium, High };
    enum class SignalStrength { Weak, Moderate, Strong, VeryStrong };
    enum class Recommendation { StrongBuy, Buy, Hold, Sell, StrongSell };
    enum class TimeHorizon { Scalp, DayTrade, Swing, Position };
    enum class Urgency { Low, Medium, High, Immediate };

    std::string toString(RiskLevel level);
    std::string toString(SignalStrength strength);
    std::string toString(Recommendation recommendation);
    std::string toString(TimeHorizon horizon);
    std::string toString(Urgency urgency);

    // Throws std::invalid_argument for unknown names
    RiskLevel riskLevelFromString(const std::string& name);

    // low < medium < high
    int riskRank(RiskLevel level);

    // Technical facts the composite rubric reads. Produced by analysis::TechnicalAnalyzer from a
    // candle series, or filled directly by callers that already hold the numbers.
    struct TechnicalSnapshot {
        double macd_line = 0.0;
        double macd_signal = 0.0;
        double macd_histogram = 0.0;
        double ema_9 = 0.0;
        double ema_20 = 0.0;
        double rsi = 50.0;
        double volatility = 0.0;       // annualized
        double relative_volume = 1.0;  // from the candle series, not the live snapshot
        std::vector<double> support_levels;
        std::vector<double> resistance_levels;
        std::vector<std::string> patterns_detected; // e.g. "abcd_bullish"
    };

    struct ComponentScore {
        std::string component;      // fundamental, technical, news_sentiment, volume_momentum
        double raw_score = 0.0;     // 0-100
        double weight = 0.0;        // 0-1
        double weighted_score = 0.0;
        double confidence = 0.0;    // 0-1
        nlohmann::json details = nlohmann::json::object();
    };

    struct CompositeScore {
        std::string symbol;
        double overall_score = 50.0;
        std::vector<ComponentScore> components;
        double confidence_level = 0.5;
        RiskLevel risk_level = RiskLevel::Medium;
        SignalStrength signal_strength = SignalStrength::Weak;
        Recommendation recommendation = Recommendation::Hold;
        std::optional<double> entry_price;
        std::optional<double> stop_loss;
        std::optional<double> take_profit;
        TimeHorizon time_horizon = TimeHorizon::DayTrade;
        Urgency urgency = Urgency::Low;
        std::vector<std::string> notes;
        bool is_default = false;

        // overall_score x confidence_level
        double adjustedScore() const { return overall_score * confidence_level; }

        // nullptr if the component is missing
        const ComponentScore* findComponent(const std::string& name) const;
    };

    struct RossScore {
        double volume = 50.0;       // pillar scores, 0-100
        double price_change = 50.0;
        double float_size = 50.0;
        double catalyst = 50.0;
        double price_range = 50.0;
        double overall = 50.0;
        std::string grade = "C";
        bool is_default = true;
    };

} // namespace scoring
