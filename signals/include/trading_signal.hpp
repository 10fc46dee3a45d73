#pragma once

#include "datatypes.hpp"
#include "scoring_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace signals {

    // Everything a signal carries. Filled once by the SignalGenerator and then frozen
    // inside a TradingSignal.
    struct TradingSignalData {
        std::string symbol;
        std::string signal_id;
        core::Timestamp timestamp;

        scoring::CompositeScore composite;
        scoring::RossScore ross;

        scoring::Recommendation signal_type = scoring::Recommendation::Hold;
        std::optional<double> position_size;      // shares
        std::optional<double> risk_reward_ratio;
        std::optional<core::Timestamp> expiry_time;

        std::vector<std::string> alerts;
        std::vector<std::string> risk_warnings;
        std::string notes;

        // Inputs the signal was derived from
        core::MarketSnapshot market;
        core::FundamentalSummary fundamentals;
        scoring::TechnicalSnapshot technical;
        core::NewsSummary news;
    };

    // Terminal result of one analysis request. Immutable: a new request produces a new signal.
    class TradingSignal {
    public:
        explicit TradingSignal(TradingSignalData data);

        const std::string& getSymbol() const { return data_.symbol; }
        const std::string& getSignalId() const { return data_.signal_id; }
        core::Timestamp getTimestamp() const { return data_.timestamp; }

        const scoring::CompositeScore& getCompositeScore() const { return data_.composite; }
        const scoring::RossScore& getRossScore() const { return data_.ross; }

        scoring::Recommendation getSignalType() const { return data_.signal_type; }
        scoring::SignalStrength getSignalStrength() const { return data_.composite.signal_strength; }
        scoring::Recommendation getRecommendation() const { return data_.composite.recommendation; }
        scoring::RiskLevel getRiskLevel() const { return data_.composite.risk_level; }
        double getOverallScore() const { return data_.composite.overall_score; }
        double getConfidence() const { return data_.composite.confidence_level; }

        std::optional<double> getEntryPrice() const { return data_.composite.entry_price; }
        std::optional<double> getStopLoss() const { return data_.composite.stop_loss; }
        std::optional<double> getTakeProfit() const { return data_.composite.take_profit; }
        std::optional<double> getPositionSize() const { return data_.position_size; }
        std::optional<double> getRiskRewardRatio() const { return data_.risk_reward_ratio; }

        scoring::TimeHorizon getTimeHorizon() const { return data_.composite.time_horizon; }
        scoring::Urgency getUrgency() const { return data_.composite.urgency; }
        std::optional<core::Timestamp> getExpiryTime() const { return data_.expiry_time; }

        const std::vector<std::string>& getAlerts() const { return data_.alerts; }
        const std::vector<std::string>& getRiskWarnings() const { return data_.risk_warnings; }
        const std::string& getNotes() const { return data_.notes; }

        const core::MarketSnapshot& getMarket() const { return data_.market; }
        const core::FundamentalSummary& getFundamentals() const { return data_.fundamentals; }
        const scoring::TechnicalSnapshot& getTechnical() const { return data_.technical; }
        const core::NewsSummary& getNews() const { return data_.news; }

        const TradingSignalData& data() const { return data_; }

    private:
        TradingSignalData data_;
    };

} // namespace signals
