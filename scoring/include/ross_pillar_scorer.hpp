#pragma once

#include "at_least_condition.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include "scoring_types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace scoring {

    // Five-pillar momentum checklist: relative volume, price change, float, catalyst and price range.
    // Each pillar normalizes to [0, 1]; tiers use inclusive lower bounds.
    class RossCameronPillarScorer {
    public:
        explicit RossCameronPillarScorer(core::config::RossConfig config = {});

        RossScore score(const core::MarketSnapshot& market,
                        const core::FundamentalSummary& fundamentals,
                        const core::NewsSummary& news) const;

        // --- Pillars ---
        static double volumePillar(double relative_volume);
        static double priceChangePillar(double price_change_pct);
        static double floatPillar(std::optional<double> float_shares);
        double catalystPillar(const core::NewsSummary& news) const;
        static double priceRangePillar(double price);

        static std::string gradeFor(double overall_score);

        // At least `min_pillars` of the five pillar scores reach their configured bars
        bool meetsPillarRule(const RossScore& score) const;
        int pillarsPassed(const RossScore& score) const;

        static RossScore defaultScore();

        const core::config::RossConfig& getConfig() const { return config_; }

    private:
        core::config::RossConfig config_;
        std::unique_ptr<rule_engine::AtLeastCondition> pillar_rule_;
    };

} // namespace scoring
