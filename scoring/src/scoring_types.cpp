#include "scoring_types.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace scoring {

    std::string toString(RiskLevel level) {
        switch (level) {
            case RiskLevel::Low:    return "low";
            case RiskLevel::Medium: return "medium";
            case RiskLevel::High:   return "high";
        }
        return "medium";
    }

    std::string toString(SignalStrength strength) {
        switch (strength) {
            case SignalStrength::Weak:       return "weak";
            case SignalStrength::Moderate:   return "moderate";
            case SignalStrength::Strong:     return "strong";
            case SignalStrength::VeryStrong: return "very_strong";
        }
        return "weak";
    }

    std::string toString(Recommendation recommendation) {
        switch (recommendation) {
            case Recommendation::StrongBuy:  return "strong_buy";
            case Recommendation::Buy:        return "buy";
            case Recommendation::Hold:       return "hold";
            case Recommendation::Sell:       return "sell";
            case Recommendation::StrongSell: return "strong_sell";
        }
        return "hold";
    }

    std::string toString(TimeHorizon horizon) {
        switch (horizon) {
            case TimeHorizon::Scalp:    return "scalp";
            case TimeHorizon::DayTrade: return "day_trade";
            case TimeHorizon::Swing:    return "swing";
            case TimeHorizon::Position: return "position";
        }
        return "day_trade";
    }

    std::string toString(Urgency urgency) {
        switch (urgency) {
            case Urgency::Low:       return "low";
            case Urgency::Medium:    return "medium";
            case Urgency::High:      return "high";
            case Urgency::Immediate: return "immediate";
        }
        return "low";
    }

    RiskLevel riskLevelFromString(const std::string& name) {
        if (name == "low") return RiskLevel::Low;
        if (name == "medium") return RiskLevel::Medium;
        if (name == "high") return RiskLevel::High;
        throw std::invalid_argument(fmt::format("Unknown risk level '{}'", name));
    }

    int riskRank(RiskLevel level) {
        switch (level) {
            case RiskLevel::Low:    return 1;
            case RiskLevel::Medium: return 2;
            case RiskLevel::High:   return 3;
        }
        return 2;
    }

    const ComponentScore* CompositeScore::findComponent(const std::string& name) const {
        for (const auto& component : components) {
            if (component.component == name) {
                return &component;
            }
        }
        return nullptr;
    }

} // namespace scoring
