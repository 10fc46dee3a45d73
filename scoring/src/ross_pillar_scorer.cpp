#include "ross_pillar_scorer.hpp"
#include "fact_condition.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace scoring {

    namespace {

        rule_engine::FactSnapshot pillarFacts(const RossScore& score) {
            rule_engine::FactSnapshot facts;
            facts.set("volume_pillar", score.volume);
            facts.set("price_change_pillar", score.price_change);
            facts.set("float_pillar", score.float_size);
            facts.set("catalyst_pillar", score.catalyst);
            facts.set("price_range_pillar", score.price_range);
            return facts;
        }

        std::unique_ptr<rule_engine::ICondition> atLeast(const std::string& fact, double bar) {
            return std::make_unique<rule_engine::FactCondition>(fact, rule_engine::ComparisonOp::GTE, bar);
        }

    } // end anonymous namespace

    RossCameronPillarScorer::RossCameronPillarScorer(core::config::RossConfig config)
        : config_(std::move(config))
    {
        core::config::ConfigLoader::validate(config_);

        std::vector<std::unique_ptr<rule_engine::ICondition>> pillars;
        pillars.push_back(atLeast("volume_pillar", config_.volume_bar));
        pillars.push_back(atLeast("price_change_pillar", config_.price_change_bar));
        pillars.push_back(atLeast("float_pillar", config_.float_bar));
        pillars.push_back(atLeast("catalyst_pillar", config_.catalyst_bar));
        pillars.push_back(atLeast("price_range_pillar", config_.price_range_bar));
        pillar_rule_ = std::make_unique<rule_engine::AtLeastCondition>(config_.min_pillars, std::move(pillars));
    }

    RossScore RossCameronPillarScorer::score(const core::MarketSnapshot& market,
                                             const core::FundamentalSummary& fundamentals,
                                             const core::NewsSummary& news) const
    {
        const double volume = volumePillar(market.relative_volume);
        const double price_change = priceChangePillar(market.price_change_pct);
        const double float_size = floatPillar(fundamentals.float_shares);
        const double catalyst = catalystPillar(news);
        const double price_range = priceRangePillar(market.current_price);

        RossScore result;
        result.is_default = false;
        result.volume = volume * 100.0;
        result.price_change = price_change * 100.0;
        result.float_size = float_size * 100.0;
        result.catalyst = catalyst * 100.0;
        result.price_range = price_range * 100.0;
        result.overall = (volume * config_.volume_weight +
                          price_change * config_.price_change_weight +
                          float_size * config_.float_weight +
                          catalyst * config_.catalyst_weight +
                          price_range * config_.price_range_weight) * 100.0;
        result.overall = core::utils::clamp(result.overall, 0.0, 100.0);
        result.grade = gradeFor(result.overall);

        core::logging::getLogger()->debug(
            "Ross pillars: volume {:.0f}, change {:.0f}, float {:.0f}, catalyst {:.0f}, range {:.0f} -> {:.1f} ({})",
            result.volume, result.price_change, result.float_size, result.catalyst, result.price_range,
            result.overall, result.grade);
        return result;
    }

    double RossCameronPillarScorer::volumePillar(double relative_volume) {
        if (relative_volume >= 5.0) return 1.0;
        if (relative_volume >= 3.0) return 0.9;
        if (relative_volume >= 2.0) return 0.8;
        if (relative_volume >= 1.5) return 0.6;
        return 0.2;
    }

    double RossCameronPillarScorer::priceChangePillar(double price_change_pct) {
        const double change = std::abs(price_change_pct);
        if (change >= 20.0) return 1.0;
        if (change >= 10.0) return 0.9;
        if (change >= 5.0) return 0.8;
        if (change >= 4.0) return 0.7;
        return 0.3;
    }

    // Smaller float is better; an unknown float scores the lowest tier
    double RossCameronPillarScorer::floatPillar(std::optional<double> float_shares) {
        if (!float_shares || *float_shares <= 0.0) {
            return 0.2;
        }
        const double shares = *float_shares;
        if (shares <= 10'000'000) return 1.0;
        if (shares <= 20'000'000) return 0.9;
        if (shares <= 30'000'000) return 0.8;
        if (shares <= 50'000'000) return 0.6;
        return 0.2;
    }

    double RossCameronPillarScorer::catalystPillar(const core::NewsSummary& news) const {
        if (!news.catalyst_detected) {
            return 0.1;
        }
        double normalized = core::utils::clamp(news.catalyst_score, 0.0, 100.0) / 100.0;
        const bool high_impact = std::any_of(news.catalyst_types.begin(), news.catalyst_types.end(),
            [this](const std::string& type) {
                return std::find(config_.high_impact_catalysts.begin(), config_.high_impact_catalysts.end(), type)
                       != config_.high_impact_catalysts.end();
            });
        if (high_impact) {
            normalized *= config_.high_impact_boost;
        }
        return std::min(1.0, normalized);
    }

    double RossCameronPillarScorer::priceRangePillar(double price) {
        if (price >= 2.0 && price <= 10.0) return 1.0;
        if (price >= 1.0 && price <= 20.0) return 0.8;
        if (price > 0.0 && price <= 50.0) return 0.6;
        return 0.2;
    }

    std::string RossCameronPillarScorer::gradeFor(double overall_score) {
        if (overall_score >= 95.0) return "A+";
        if (overall_score >= 90.0) return "A";
        if (overall_score >= 85.0) return "B+";
        if (overall_score >= 80.0) return "B";
        if (overall_score >= 75.0) return "C+";
        if (overall_score >= 70.0) return "C";
        if (overall_score >= 60.0) return "D";
        return "F";
    }

    bool RossCameronPillarScorer::meetsPillarRule(const RossScore& score) const {
        return pillar_rule_->evaluate(pillarFacts(score));
    }

    int RossCameronPillarScorer::pillarsPassed(const RossScore& score) const {
        return pillar_rule_->countSatisfied(pillarFacts(score));
    }

    RossScore RossCameronPillarScorer::defaultScore() {
        return RossScore{};
    }

} // namespace scoring
