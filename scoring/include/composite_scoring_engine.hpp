#pragma once

#include "config.hpp"
#include "datatypes.hpp"
#include "scoring_types.hpp"
#include <optional>
#include <string>

namespace scoring {

    // Entry / stop / target derived from the live price and the technical levels
    struct TradeLevels {
        std::optional<double> entry_price;
        std::optional<double> stop_loss;
        std::optional<double> take_profit;
    };

    // Weighted four-component score (fundamental, technical, news sentiment, volume momentum).
    //
    // Every component is a tiered point rubric capped at 100 with a confidence in [0, 1] that
    // only accrues for the inputs actually present. The recommendation uses
    // overall_score x confidence_level against thresholds that rise with the risk level.
    class CompositeScoringEngine {
    public:
        explicit CompositeScoringEngine(core::config::ScoringWeights weights = {});

        // Never throws. A failure while scoring yields defaultScore(symbol) with an explanatory note.
        CompositeScore score(const std::string& symbol,
                             const core::MarketSnapshot& market,
                             const core::FundamentalSummary& fundamentals,
                             const TechnicalSnapshot& technical,
                             const core::NewsSummary& news,
                             core::Timestamp as_of) const;

        // --- Components ---
        ComponentScore fundamentalComponent(const core::FundamentalSummary& fundamentals,
                                            const core::MarketSnapshot& market) const;
        ComponentScore technicalComponent(const TechnicalSnapshot& technical,
                                          const core::MarketSnapshot& market) const;
        ComponentScore newsComponent(const core::NewsSummary& news, core::Timestamp as_of) const;
        ComponentScore momentumComponent(const core::MarketSnapshot& market,
                                         const TechnicalSnapshot& technical) const;

        // --- Derived labels ---
        static RiskLevel riskLevel(const TechnicalSnapshot& technical,
                                   const core::MarketSnapshot& market,
                                   const core::NewsSummary& news);
        static SignalStrength signalStrength(double overall_score, double confidence);
        static Recommendation recommendation(double overall_score, RiskLevel risk, double confidence);
        static TradeLevels tradeLevels(const core::MarketSnapshot& market,
                                       const TechnicalSnapshot& technical,
                                       RiskLevel risk);
        static TimeHorizon timeHorizon(const TechnicalSnapshot& technical,
                                       const core::NewsSummary& news,
                                       double overall_score);
        static Urgency urgency(const core::NewsSummary& news,
                               const TechnicalSnapshot& technical,
                               double overall_score);

        static CompositeScore defaultScore(const std::string& symbol);

        const core::config::ScoringWeights& getWeights() const { return weights_; }

    private:
        ComponentScore makeComponent(const std::string& name, double weight, double raw_score,
                                     double confidence, nlohmann::json details) const;

        core::config::ScoringWeights weights_;
    };

} // namespace scoring
