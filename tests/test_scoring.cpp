#include <catch2/catch.hpp>

#include "composite_scoring_engine.hpp"
#include "exceptions.hpp"
#include "ross_pillar_scorer.hpp"
#include "test_fixtures.hpp"
#include <cmath>
#include <limits>

using namespace scoring;

TEST_CASE("Ross pillar tiers", "[scoring][ross]") {
    SECTION("volume") {
        REQUIRE(RossCameronPillarScorer::volumePillar(5.0) == 1.0);
        REQUIRE(RossCameronPillarScorer::volumePillar(4.99) == 0.9);
        REQUIRE(RossCameronPillarScorer::volumePillar(3.0) == 0.9);
        REQUIRE(RossCameronPillarScorer::volumePillar(2.0) == 0.8);
        REQUIRE(RossCameronPillarScorer::volumePillar(1.5) == 0.6);
        REQUIRE(RossCameronPillarScorer::volumePillar(1.49) == 0.2);
    }

    SECTION("price change uses the magnitude") {
        REQUIRE(RossCameronPillarScorer::priceChangePillar(20.0) == 1.0);
        REQUIRE(RossCameronPillarScorer::priceChangePillar(-12.0) == 0.9);
        REQUIRE(RossCameronPillarScorer::priceChangePillar(5.0) == 0.8);
        REQUIRE(RossCameronPillarScorer::priceChangePillar(4.0) == 0.7);
        REQUIRE(RossCameronPillarScorer::priceChangePillar(3.9) == 0.3);
    }

    SECTION("float") {
        REQUIRE(RossCameronPillarScorer::floatPillar(10'000'000.0) == 1.0);
        REQUIRE(RossCameronPillarScorer::floatPillar(20'000'000.0) == 0.9);
        REQUIRE(RossCameronPillarScorer::floatPillar(30'000'000.0) == 0.8);
        REQUIRE(RossCameronPillarScorer::floatPillar(50'000'000.0) == 0.6);
        REQUIRE(RossCameronPillarScorer::floatPillar(50'000'001.0) == 0.2);
        REQUIRE(RossCameronPillarScorer::floatPillar(std::nullopt) == 0.2);
        REQUIRE(RossCameronPillarScorer::floatPillar(0.0) == 0.2);
    }

    SECTION("price range") {
        REQUIRE(RossCameronPillarScorer::priceRangePillar(2.0) == 1.0);
        REQUIRE(RossCameronPillarScorer::priceRangePillar(10.0) == 1.0);
        REQUIRE(RossCameronPillarScorer::priceRangePillar(1.0) == 0.8);
        REQUIRE(RossCameronPillarScorer::priceRangePillar(20.0) == 0.8);
        REQUIRE(RossCameronPillarScorer::priceRangePillar(0.5) == 0.6);
        REQUIRE(RossCameronPillarScorer::priceRangePillar(50.0) == 0.6);
        REQUIRE(RossCameronPillarScorer::priceRangePillar(50.01) == 0.2);
        REQUIRE(RossCameronPillarScorer::priceRangePillar(0.0) == 0.2);
    }

    SECTION("catalyst") {
        RossCameronPillarScorer scorer;
        core::NewsSummary news;
        REQUIRE(scorer.catalystPillar(news) == Approx(0.1));

        news.catalyst_detected = true;
        news.catalyst_score = 70.0;
        news.catalyst_types = {"partnership"};
        REQUIRE(scorer.catalystPillar(news) == Approx(0.7));

        news.catalyst_types = {"partnership", "fda_approval"};
        REQUIRE(scorer.catalystPillar(news) == Approx(0.84));

        news.catalyst_score = 95.0;
        REQUIRE(scorer.catalystPillar(news) == 1.0);
    }
}

TEST_CASE("Ross grades", "[scoring][ross]") {
    REQUIRE(RossCameronPillarScorer::gradeFor(95.0) == "A+");
    REQUIRE(RossCameronPillarScorer::gradeFor(90.0) == "A");
    REQUIRE(RossCameronPillarScorer::gradeFor(85.0) == "B+");
    REQUIRE(RossCameronPillarScorer::gradeFor(80.0) == "B");
    REQUIRE(RossCameronPillarScorer::gradeFor(75.0) == "C+");
    REQUIRE(RossCameronPillarScorer::gradeFor(70.0) == "C");
    REQUIRE(RossCameronPillarScorer::gradeFor(60.0) == "D");
    REQUIRE(RossCameronPillarScorer::gradeFor(59.9) == "F");
}

TEST_CASE("Ross scoring of complete setups", "[scoring][ross]") {
    RossCameronPillarScorer scorer;

    SECTION("low-float runner passes every pillar") {
        const auto in = fixtures::lowFloatRunner();
        const auto score = scorer.score(in.market, in.fundamentals, in.news);

        REQUIRE_FALSE(score.is_default);
        REQUIRE(score.volume == Approx(100.0));
        REQUIRE(score.price_change == Approx(100.0));
        REQUIRE(score.float_size == Approx(100.0));
        REQUIRE(score.catalyst == Approx(84.0));
        REQUIRE(score.price_range == Approx(100.0));
        REQUIRE(score.overall == Approx(96.8));
        REQUIRE(score.grade == "A+");
        REQUIRE(scorer.pillarsPassed(score) == 5);
        REQUIRE(scorer.meetsPillarRule(score));
    }

    SECTION("quiet mega-cap fails") {
        const auto in = fixtures::quietMegaCap();
        const auto score = scorer.score(in.market, in.fundamentals, in.news);

        REQUIRE(score.overall == Approx(20.0));
        REQUIRE(score.grade == "F");
        REQUIRE(scorer.pillarsPassed(score) == 0);
        REQUIRE_FALSE(scorer.meetsPillarRule(score));
    }

    SECTION("four of five pillars is enough") {
        auto in = fixtures::lowFloatRunner();
        in.market.current_price = 35.0; // range pillar 60
        const auto score = scorer.score(in.market, in.fundamentals, in.news);
        REQUIRE(scorer.pillarsPassed(score) == 4);
        REQUIRE(scorer.meetsPillarRule(score));
    }

    SECTION("default score") {
        const auto fallback = RossCameronPillarScorer::defaultScore();
        REQUIRE(fallback.is_default);
        REQUIRE(fallback.overall == 50.0);
        REQUIRE(fallback.grade == "C");
    }

    SECTION("weights must sum to one") {
        core::config::RossConfig config;
        config.volume_weight = 0.5;
        REQUIRE_THROWS_AS(RossCameronPillarScorer(config), core::ConfigException);
    }
}

TEST_CASE("Composite components", "[scoring][composite]") {
    CompositeScoringEngine engine;

    SECTION("runner") {
        const auto in = fixtures::lowFloatRunner();

        const auto fundamental = engine.fundamentalComponent(in.fundamentals, in.market);
        REQUIRE(fundamental.raw_score == Approx(100.0));
        REQUIRE(fundamental.confidence == Approx(1.0));
        REQUIRE(fundamental.weighted_score == Approx(25.0));
        REQUIRE(fundamental.details.at("float_score") == 30);

        const auto technical = engine.technicalComponent(in.technical, in.market);
        REQUIRE(technical.raw_score == Approx(87.0));
        REQUIRE(technical.details.at("support_resistance_score") == 15);
        REQUIRE(technical.details.at("ema_alignment") == "bullish");

        const auto news = engine.newsComponent(in.news, in.as_of);
        REQUIRE(news.raw_score == Approx(80.0));
        REQUIRE(news.confidence == Approx(0.885));
        REQUIRE(news.details.at("recency_score") == 10);

        const auto momentum = engine.momentumComponent(in.market, in.technical);
        REQUIRE(momentum.raw_score == Approx(100.0));
        REQUIRE(momentum.details.at("price_change_score").get<double>() == Approx(30.0));
    }

    SECTION("missing fundamentals lower the confidence") {
        core::FundamentalSummary unknown;
        unknown.sector = "Utilities";
        core::MarketSnapshot market;
        market.current_price = 75.0;
        const auto fundamental = engine.fundamentalComponent(unknown, market);
        // price 0, sector 8, short interest 2
        REQUIRE(fundamental.raw_score == Approx(10.0));
        REQUIRE(fundamental.confidence == Approx(0.5));
    }

    SECTION("catalyst recency decays") {
        auto in = fixtures::lowFloatRunner();
        in.news.latest_catalyst_time = in.as_of - std::chrono::hours(3);
        REQUIRE(engine.newsComponent(in.news, in.as_of).details.at("recency_score") == 7);
        in.news.latest_catalyst_time = in.as_of - std::chrono::hours(12);
        REQUIRE(engine.newsComponent(in.news, in.as_of).details.at("recency_score") == 4);
        in.news.latest_catalyst_time = in.as_of - std::chrono::hours(48);
        REQUIRE(engine.newsComponent(in.news, in.as_of).details.at("recency_score") == 1);
        in.news.latest_catalyst_time.reset();
        REQUIRE(engine.newsComponent(in.news, in.as_of).details.at("recency_score") == 0);
    }

    SECTION("sentiment maps linearly onto 40 points") {
        core::NewsSummary news;
        news.avg_sentiment = -1.0;
        news.news_momentum_score = 0.0;
        REQUIRE(engine.newsComponent(news, fixtures::baseTime()).raw_score == Approx(0.0));
        news.avg_sentiment = 1.0;
        REQUIRE(engine.newsComponent(news, fixtures::baseTime()).raw_score == Approx(40.0));
    }
}

TEST_CASE("Composite score of a low-float runner", "[scoring][composite]") {
    CompositeScoringEngine engine;
    const auto in = fixtures::lowFloatRunner();
    const auto score = engine.score("GITS", in.market, in.fundamentals, in.technical, in.news, in.as_of);

    REQUIRE_FALSE(score.is_default);
    REQUIRE(score.symbol == "GITS");
    REQUIRE(score.components.size() == 4);
    REQUIRE(score.overall_score == Approx(91.1));
    REQUIRE(score.confidence_level == Approx(0.97125));
    REQUIRE(score.adjustedScore() == Approx(91.1 * 0.97125));
    REQUIRE(score.risk_level == RiskLevel::Low);
    REQUIRE(score.signal_strength == SignalStrength::VeryStrong);
    REQUIRE(score.recommendation == Recommendation::StrongBuy);
    REQUIRE(*score.entry_price == Approx(3.8784));
    REQUIRE(*score.stop_loss == Approx(3.724));
    REQUIRE(*score.take_profit == Approx(4.41));
    REQUIRE(score.time_horizon == TimeHorizon::DayTrade);
    REQUIRE(score.urgency == Urgency::Immediate);
    REQUIRE(score.notes.empty());

    const auto* news = score.findComponent("news_sentiment");
    REQUIRE(news != nullptr);
    REQUIRE(news->raw_score == Approx(80.0));
    REQUIRE(score.findComponent("sentiment") == nullptr);
}

TEST_CASE("Composite score of a quiet mega-cap", "[scoring][composite]") {
    CompositeScoringEngine engine;
    const auto in = fixtures::quietMegaCap();
    const auto score = engine.score("AAPL", in.market, in.fundamentals, in.technical, in.news, in.as_of);

    REQUIRE(score.findComponent("fundamental")->raw_score == Approx(28.0));
    REQUIRE(score.findComponent("technical")->raw_score == Approx(47.0));
    REQUIRE(score.findComponent("news_sentiment")->raw_score == Approx(25.0));
    REQUIRE(score.findComponent("volume_momentum")->raw_score == Approx(10.0));
    REQUIRE(score.overall_score == Approx(29.35));
    REQUIRE(score.confidence_level == Approx(0.91625));
    REQUIRE(score.risk_level == RiskLevel::Medium);
    REQUIRE(score.signal_strength == SignalStrength::Weak);
    REQUIRE(score.recommendation == Recommendation::Sell);
    REQUIRE(*score.stop_loss == Approx(176.4));
    REQUIRE(*score.take_profit == Approx(191.1));
    REQUIRE(score.time_horizon == TimeHorizon::Position);
    REQUIRE(score.urgency == Urgency::Low);
}

TEST_CASE("Composite labels", "[scoring][composite]") {
    SECTION("risk factors") {
        TechnicalSnapshot technical;
        core::MarketSnapshot market;
        market.relative_volume = 2.0;
        market.current_price = 10.0;
        core::NewsSummary news;
        REQUIRE(CompositeScoringEngine::riskLevel(technical, market, news) == RiskLevel::Low);

        technical.rsi = 85.0;
        REQUIRE(CompositeScoringEngine::riskLevel(technical, market, news) == RiskLevel::Medium);

        technical.volatility = 0.5;
        REQUIRE(CompositeScoringEngine::riskLevel(technical, market, news) == RiskLevel::High);

        technical = {};
        news.total_articles = 10;
        news.negative_articles = 4;
        market.relative_volume = 1.0;
        REQUIRE(CompositeScoringEngine::riskLevel(technical, market, news) == RiskLevel::Medium);
    }

    SECTION("recommendation thresholds move with risk") {
        REQUIRE(CompositeScoringEngine::recommendation(80.0, RiskLevel::Medium, 1.0) == Recommendation::StrongBuy);
        REQUIRE(CompositeScoringEngine::recommendation(80.0, RiskLevel::High, 1.0) == Recommendation::Buy);
        REQUIRE(CompositeScoringEngine::recommendation(75.0, RiskLevel::Low, 1.0) == Recommendation::StrongBuy);
        REQUIRE(CompositeScoringEngine::recommendation(100.0, RiskLevel::Medium, 0.5) == Recommendation::Hold);
        REQUIRE(CompositeScoringEngine::recommendation(44.0, RiskLevel::High, 1.0) == Recommendation::Sell);
        REQUIRE(CompositeScoringEngine::recommendation(24.9, RiskLevel::Low, 1.0) == Recommendation::StrongSell);
    }

    SECTION("signal strength uses the adjusted score") {
        REQUIRE(CompositeScoringEngine::signalStrength(80.0, 1.0) == SignalStrength::VeryStrong);
        REQUIRE(CompositeScoringEngine::signalStrength(80.0, 0.9) == SignalStrength::Strong);
        REQUIRE(CompositeScoringEngine::signalStrength(60.0, 1.0) == SignalStrength::Moderate);
        REQUIRE(CompositeScoringEngine::signalStrength(60.0, 0.9) == SignalStrength::Weak);
    }

    SECTION("scalp horizon on volatile heavy volume") {
        TechnicalSnapshot technical;
        technical.volatility = 0.45;
        technical.relative_volume = 8.0;
        REQUIRE(CompositeScoringEngine::timeHorizon(technical, {}, 50.0) == TimeHorizon::Scalp);
        technical.volatility = 0.1;
        REQUIRE(CompositeScoringEngine::timeHorizon(technical, {}, 72.0) == TimeHorizon::Swing);
    }
}

TEST_CASE("Trade levels", "[scoring][composite]") {
    core::MarketSnapshot market;
    market.current_price = 10.0;
    TechnicalSnapshot technical;

    SECTION("percentage stops without levels") {
        auto levels = CompositeScoringEngine::tradeLevels(market, technical, RiskLevel::Medium);
        REQUIRE(*levels.entry_price == Approx(10.1));
        REQUIRE(*levels.stop_loss == Approx(9.2));
        REQUIRE(*levels.take_profit == Approx(11.9));

        levels = CompositeScoringEngine::tradeLevels(market, technical, RiskLevel::Low);
        REQUIRE(*levels.stop_loss == Approx(9.5));
        levels = CompositeScoringEngine::tradeLevels(market, technical, RiskLevel::High);
        REQUIRE(*levels.stop_loss == Approx(9.0));
    }

    SECTION("only levels strictly on the right side of the price count") {
        technical.support_levels = {10.0, 9.0, 8.0};
        technical.resistance_levels = {10.0, 12.0, 15.0};
        const auto levels = CompositeScoringEngine::tradeLevels(market, technical, RiskLevel::Medium);
        REQUIRE(*levels.stop_loss == Approx(9.0 * 0.98));
        REQUIRE(*levels.take_profit == Approx(12.0 * 0.98));
    }

    SECTION("no price, no levels") {
        market.current_price = 0.0;
        const auto levels = CompositeScoringEngine::tradeLevels(market, technical, RiskLevel::Medium);
        REQUIRE_FALSE(levels.entry_price.has_value());
        REQUIRE_FALSE(levels.stop_loss.has_value());
        REQUIRE_FALSE(levels.take_profit.has_value());
    }
}

TEST_CASE("Composite scoring failure falls back to the default score", "[scoring][composite]") {
    CompositeScoringEngine engine;
    auto in = fixtures::lowFloatRunner();
    in.market.current_price = std::numeric_limits<double>::quiet_NaN();

    const auto score = engine.score("NAN", in.market, in.fundamentals, in.technical, in.news, in.as_of);
    REQUIRE(score.is_default);
    REQUIRE(score.symbol == "NAN");
    REQUIRE(score.overall_score == 50.0);
    REQUIRE(score.confidence_level == 0.5);
    REQUIRE(score.recommendation == Recommendation::Hold);
    REQUIRE(score.notes.size() == 1);
    REQUIRE(score.notes.front().find("current_price") != std::string::npos);

    SECTION("invalid weights are rejected up front") {
        core::config::ScoringWeights weights;
        weights.technical = 0.9;
        REQUIRE_THROWS_AS(CompositeScoringEngine(weights), core::ConfigException);
    }
}

TEST_CASE("Risk level names", "[scoring]") {
    REQUIRE(riskLevelFromString("high") == RiskLevel::High);
    REQUIRE(riskRank(RiskLevel::Low) < riskRank(RiskLevel::Medium));
    REQUIRE(riskRank(RiskLevel::Medium) < riskRank(RiskLevel::High));
    REQUIRE_THROWS_AS(riskLevelFromString("extreme"), std::invalid_argument);
    REQUIRE(toString(TimeHorizon::DayTrade) == "day_trade");
}
