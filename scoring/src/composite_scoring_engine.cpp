#include "composite_scoring_engine.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <limits>
#include <vector>

namespace scoring {

    namespace {

        const std::vector<std::string> kTargetSectors = {"healthcare", "biotechnology", "technology", "crypto", "ai"};
        const std::vector<std::string> kBullishPatterns = {"abcd_bullish", "cup_and_handle", "ascending_triangle", "bull_flag"};

        const double kNeutralComponentScore = 50.0;
        const double kNeutralComponentConfidence = 0.5;

        void requireFinite(double value, const char* name) {
            if (!std::isfinite(value)) {
                throw core::ScoringException(fmt::format("Input '{}' is not a finite number.", name));
            }
        }

        std::optional<double> highestBelow(const std::vector<double>& levels, double price) {
            std::optional<double> best;
            for (double level : levels) {
                if (level < price && (!best || level > *best)) {
                    best = level;
                }
            }
            return best;
        }

        std::optional<double> lowestAbove(const std::vector<double>& levels, double price) {
            std::optional<double> best;
            for (double level : levels) {
                if (level > price && (!best || level < *best)) {
                    best = level;
                }
            }
            return best;
        }

    } // end anonymous namespace

    CompositeScoringEngine::CompositeScoringEngine(core::config::ScoringWeights weights)
        : weights_(weights)
    {
        core::config::ConfigLoader::validate(weights_);
    }

    CompositeScore CompositeScoringEngine::score(const std::string& symbol,
                                                 const core::MarketSnapshot& market,
                                                 const core::FundamentalSummary& fundamentals,
                                                 const TechnicalSnapshot& technical,
                                                 const core::NewsSummary& news,
                                                 core::Timestamp as_of) const
    {
        auto logger = core::logging::getLogger();
        logger->debug("Calculating composite score for {}", symbol);

        try {
            requireFinite(market.current_price, "current_price");
            requireFinite(market.relative_volume, "relative_volume");
            requireFinite(market.price_change_pct, "price_change_pct");
            requireFinite(market.gap_pct, "gap_pct");
            requireFinite(technical.rsi, "rsi");
            requireFinite(technical.volatility, "volatility");

            CompositeScore result;
            result.symbol = symbol;

            int failed = 0;
            const auto guarded = [&](const std::string& name, double weight, const std::function<ComponentScore()>& compute) {
                try {
                    return compute();
                } catch (const std::exception& e) {
                    ++failed;
                    logger->warn("{}: {} component failed ({}). Using neutral score.", symbol, name, e.what());
                    return makeComponent(name, weight, kNeutralComponentScore, kNeutralComponentConfidence,
                                         nlohmann::json{{"error", e.what()}});
                }
            };

            result.components.push_back(guarded("fundamental", weights_.fundamental,
                [&] { return fundamentalComponent(fundamentals, market); }));
            result.components.push_back(guarded("technical", weights_.technical,
                [&] { return technicalComponent(technical, market); }));
            result.components.push_back(guarded("news_sentiment", weights_.news_sentiment,
                [&] { return newsComponent(news, as_of); }));
            result.components.push_back(guarded("volume_momentum", weights_.volume_momentum,
                [&] { return momentumComponent(market, technical); }));

            if (failed == static_cast<int>(result.components.size())) {
                throw core::ScoringException("every score component failed");
            }

            double overall = 0.0;
            double confidence_sum = 0.0;
            for (const auto& component : result.components) {
                overall += component.weighted_score;
                confidence_sum += component.confidence;
            }
            result.overall_score = core::utils::clamp(overall, 0.0, 100.0);
            result.confidence_level = core::utils::clamp(confidence_sum / static_cast<double>(result.components.size()), 0.0, 1.0);

            result.risk_level = riskLevel(technical, market, news);
            result.signal_strength = signalStrength(result.overall_score, result.confidence_level);
            result.recommendation = recommendation(result.overall_score, result.risk_level, result.confidence_level);

            const auto levels = tradeLevels(market, technical, result.risk_level);
            result.entry_price = levels.entry_price;
            result.stop_loss = levels.stop_loss;
            result.take_profit = levels.take_profit;

            result.time_horizon = timeHorizon(technical, news, result.overall_score);
            result.urgency = urgency(news, technical, result.overall_score);
            if (failed > 0) {
                result.notes.push_back(fmt::format("{} score component(s) fell back to neutral values", failed));
            }

            logger->debug("{}: overall {:.1f}, confidence {:.2f}, risk {}, {} ({})",
                          symbol, result.overall_score, result.confidence_level, toString(result.risk_level),
                          toString(result.recommendation), toString(result.signal_strength));
            return result;
        } catch (const core::ScoringException& e) {
            logger->error("Error calculating composite score for {}: {}", symbol, e.what());
            auto fallback = defaultScore(symbol);
            fallback.notes.push_back(fmt::format("Scoring failed: {}", e.what()));
            return fallback;
        } catch (const std::exception& e) {
            logger->error("Unexpected error calculating composite score for {}: {}", symbol, e.what());
            auto fallback = defaultScore(symbol);
            fallback.notes.push_back(fmt::format("Scoring failed: {}", e.what()));
            return fallback;
        }
    }

    // --- Components ---

    ComponentScore CompositeScoringEngine::fundamentalComponent(const core::FundamentalSummary& fundamentals,
                                                                const core::MarketSnapshot& market) const
    {
        double score = 0.0;
        double confidence = 0.0;
        nlohmann::json details = nlohmann::json::object();

        // Float (30)
        if (fundamentals.float_shares && *fundamentals.float_shares > 0.0) {
            const double shares = *fundamentals.float_shares;
            int points = 5;
            if (shares <= 10'000'000) {
                points = 30;
            } else if (shares <= 20'000'000) {
                points = 25;
            } else if (shares <= 50'000'000) {
                points = 15;
            }
            score += points;
            confidence += 0.3;
            details["float_score"] = points;
            details["float_shares"] = shares;
        }

        // Price range (20)
        if (market.current_price > 0.0) {
            const double price = market.current_price;
            int points = 0;
            if (price >= 2.0 && price <= 10.0) {
                points = 20;
            } else if (price >= 1.0 && price <= 20.0) {
                points = 15;
            } else if (price <= 50.0) {
                points = 10;
            }
            score += points;
            confidence += 0.2;
            details["price_score"] = points;
            details["current_price"] = price;
        }

        // Sector (15), neutral 8 for other sectors
        const bool target_sector = std::any_of(kTargetSectors.begin(), kTargetSectors.end(),
            [&](const std::string& target) { return core::utils::containsIgnoreCase(fundamentals.sector, target); });
        const int sector_points = target_sector ? 15 : 8;
        score += sector_points;
        confidence += 0.15;
        details["sector_score"] = sector_points;
        details["sector"] = fundamentals.sector;

        // Market cap (10)
        if (fundamentals.market_cap && *fundamentals.market_cap > 0.0) {
            const double cap = *fundamentals.market_cap;
            const int points = cap <= 300'000'000 ? 10 : (cap <= 2'000'000'000 ? 7 : 3);
            score += points;
            confidence += 0.1;
            details["market_cap_score"] = points;
            details["market_cap"] = cap;
        }

        // Shares outstanding (10)
        if (fundamentals.shares_outstanding && *fundamentals.shares_outstanding > 0.0) {
            const double shares = *fundamentals.shares_outstanding;
            const int points = shares <= 50'000'000 ? 10 : (shares <= 100'000'000 ? 7 : 3);
            score += points;
            confidence += 0.1;
            details["shares_score"] = points;
            details["shares_outstanding"] = shares;
        }

        // Short interest (15); high short interest means squeeze potential
        const double short_interest = fundamentals.short_interest_pct;
        int short_points = 2;
        if (short_interest >= 20.0) {
            short_points = 15;
        } else if (short_interest >= 10.0) {
            short_points = 10;
        } else if (short_interest >= 5.0) {
            short_points = 5;
        }
        score += short_points;
        confidence += 0.15;
        details["short_score"] = short_points;
        details["short_interest"] = short_interest;

        return makeComponent("fundamental", weights_.fundamental, score, confidence, std::move(details));
    }

    ComponentScore CompositeScoringEngine::technicalComponent(const TechnicalSnapshot& technical,
                                                              const core::MarketSnapshot& market) const
    {
        double score = 0.0;
        nlohmann::json details = nlohmann::json::object();
        const double price = market.current_price;

        // MACD (25)
        int macd_points = 0;
        if (technical.macd_line > technical.macd_signal && technical.macd_histogram > 0.0) {
            macd_points = 25;
        } else if (technical.macd_line > technical.macd_signal) {
            macd_points = 15;
        } else if (technical.macd_histogram > 0.0) {
            macd_points = 10;
        }
        score += macd_points;
        details["macd_score"] = macd_points;
        details["macd_bullish"] = technical.macd_line > technical.macd_signal;

        // EMA alignment (20)
        const bool aligned = price > technical.ema_9 && technical.ema_9 > technical.ema_20;
        int ema_points = 0;
        if (aligned) {
            ema_points = 20;
        } else if (price > technical.ema_9) {
            ema_points = 15;
        } else if (price > technical.ema_20) {
            ema_points = 10;
        }
        score += ema_points;
        details["ema_score"] = ema_points;
        details["ema_alignment"] = aligned ? "bullish" : "bearish";

        // RSI (15)
        const double rsi = technical.rsi;
        int rsi_points = 5;
        if (rsi >= 40.0 && rsi <= 60.0) {
            rsi_points = 15;
        } else if (rsi >= 30.0 && rsi <= 70.0) {
            rsi_points = 12;
        } else if (rsi > 70.0) {
            rsi_points = 8;
        } else if (rsi < 30.0) {
            rsi_points = 10;
        }
        score += rsi_points;
        details["rsi_score"] = rsi_points;
        details["rsi"] = rsi;

        // Support / resistance (15); neutral 8 without both sides
        int sr_points = 8;
        if (!technical.support_levels.empty() && !technical.resistance_levels.empty() && price > 0.0) {
            double support_distance = 1.0;
            double nearest_support = 0.0;
            for (double level : technical.support_levels) {
                if (level <= price) {
                    nearest_support = std::max(nearest_support, level);
                }
            }
            if (nearest_support > 0.0) {
                support_distance = (price - nearest_support) / price;
            }

            double resistance_distance = 1.0;
            double nearest_resistance = std::numeric_limits<double>::infinity();
            for (double level : technical.resistance_levels) {
                if (level >= price) {
                    nearest_resistance = std::min(nearest_resistance, level);
                }
            }
            if (std::isfinite(nearest_resistance)) {
                resistance_distance = (nearest_resistance - price) / price;
            }

            if (support_distance <= 0.02) {
                sr_points = 15;
            } else if (resistance_distance >= 0.05) {
                sr_points = 12;
            }
        }
        score += sr_points;
        details["support_resistance_score"] = sr_points;

        // Patterns (5 per bullish pattern, capped at 15)
        int pattern_points = 0;
        for (const auto& pattern : technical.patterns_detected) {
            const bool bullish = std::any_of(kBullishPatterns.begin(), kBullishPatterns.end(),
                [&](const std::string& name) { return core::utils::containsIgnoreCase(pattern, name); });
            if (bullish) {
                pattern_points += 5;
            }
        }
        pattern_points = std::min(15, pattern_points);
        score += pattern_points;
        details["pattern_score"] = pattern_points;
        details["patterns"] = technical.patterns_detected;

        // Volume confirmation (10)
        const double relative_volume = market.relative_volume;
        int volume_points = 0;
        if (relative_volume >= 3.0) {
            volume_points = 10;
        } else if (relative_volume >= 2.0) {
            volume_points = 8;
        } else if (relative_volume >= 1.5) {
            volume_points = 5;
        }
        score += volume_points;
        details["volume_confirmation_score"] = volume_points;

        // Every technical input is always present
        return makeComponent("technical", weights_.technical, score, 1.0, std::move(details));
    }

    ComponentScore CompositeScoringEngine::newsComponent(const core::NewsSummary& news, core::Timestamp as_of) const {
        double score = 0.0;
        double confidence = 0.0;
        nlohmann::json details = nlohmann::json::object();

        // Sentiment (40): -1 -> 0, 0 -> 20, 1 -> 40
        const double sentiment = core::utils::clamp(news.avg_sentiment, -1.0, 1.0);
        const double sentiment_points = (sentiment + 1.0) * 20.0;
        score += sentiment_points;
        confidence += core::utils::clamp(news.sentiment_confidence, 0.0, 1.0) * 0.4;
        details["sentiment_score"] = sentiment_points;
        details["avg_sentiment"] = news.avg_sentiment;

        // Catalyst (35)
        const double catalyst_points = core::utils::clamp(news.catalyst_score, 0.0, 100.0) / 100.0 * 35.0;
        score += catalyst_points;
        confidence += core::utils::clamp(news.catalyst_confidence, 0.0, 1.0) * 0.35;
        details["catalyst_score"] = catalyst_points;
        details["raw_catalyst_score"] = news.catalyst_score;
        details["catalyst_types"] = news.catalyst_types;

        // News momentum (15)
        const double momentum_points = core::utils::clamp(news.news_momentum_score, 0.0, 100.0) / 100.0 * 15.0;
        score += momentum_points;
        confidence += 0.15;
        details["momentum_score"] = momentum_points;

        // Recency (10)
        int recency_points = 0;
        if (news.latest_catalyst_time) {
            const double hours_since = std::chrono::duration<double, std::ratio<3600>>(as_of - *news.latest_catalyst_time).count();
            if (hours_since <= 1.0) {
                recency_points = 10;
            } else if (hours_since <= 6.0) {
                recency_points = 7;
            } else if (hours_since <= 24.0) {
                recency_points = 4;
            } else {
                recency_points = 1;
            }
            details["hours_since_catalyst"] = hours_since;
        }
        score += recency_points;
        confidence += 0.1;
        details["recency_score"] = recency_points;

        return makeComponent("news_sentiment", weights_.news_sentiment, score, confidence, std::move(details));
    }

    ComponentScore CompositeScoringEngine::momentumComponent(const core::MarketSnapshot& market,
                                                             const TechnicalSnapshot& technical) const
    {
        double score = 0.0;
        nlohmann::json details = nlohmann::json::object();

        // Relative volume (40)
        const double relative_volume = market.relative_volume;
        int volume_points = 0;
        if (relative_volume >= 10.0) {
            volume_points = 40;
        } else if (relative_volume >= 5.0) {
            volume_points = 35;
        } else if (relative_volume >= 3.0) {
            volume_points = 30;
        } else if (relative_volume >= 2.0) {
            volume_points = 20;
        } else if (relative_volume >= 1.5) {
            volume_points = 10;
        }
        score += volume_points;
        details["volume_score"] = volume_points;
        details["relative_volume"] = relative_volume;

        // Price change (30), upward moves get a 20% bonus
        const double change = market.price_change_pct;
        const double abs_change = std::abs(change);
        double change_points = 0.0;
        if (abs_change >= 20.0) {
            change_points = 30;
        } else if (abs_change >= 10.0) {
            change_points = 25;
        } else if (abs_change >= 5.0) {
            change_points = 20;
        } else if (abs_change >= 2.0) {
            change_points = 10;
        }
        if (change > 0.0) {
            change_points *= 1.2;
        }
        change_points = std::min(30.0, change_points);
        score += change_points;
        details["price_change_score"] = change_points;
        details["price_change_percent"] = change;

        // Gap (20), gap ups get a 10% bonus
        const double gap = market.gap_pct;
        const double abs_gap = std::abs(gap);
        double gap_points = 0.0;
        if (abs_gap >= 10.0) {
            gap_points = 20;
        } else if (abs_gap >= 5.0) {
            gap_points = 15;
        } else if (abs_gap >= 2.0) {
            gap_points = 10;
        }
        if (gap > 0.0) {
            gap_points *= 1.1;
        }
        gap_points = std::min(20.0, gap_points);
        score += gap_points;
        details["gap_score"] = gap_points;
        details["gap_percent"] = gap;

        // Volatility (10)
        const double volatility = technical.volatility;
        int volatility_points = 3;
        if (volatility >= 0.1 && volatility <= 0.3) {
            volatility_points = 10;
        } else if (volatility >= 0.05 && volatility <= 0.5) {
            volatility_points = 7;
        }
        score += volatility_points;
        details["volatility_score"] = volatility_points;
        details["volatility"] = volatility;

        return makeComponent("volume_momentum", weights_.volume_momentum, score, 1.0, std::move(details));
    }

    // --- Derived labels ---

    RiskLevel CompositeScoringEngine::riskLevel(const TechnicalSnapshot& technical,
                                                const core::MarketSnapshot& market,
                                                const core::NewsSummary& news)
    {
        int factors = 0;

        if (technical.rsi > 80.0) {
            factors += 2;
        } else if (technical.rsi > 70.0) {
            factors += 1;
        }

        if (market.relative_volume < 1.5) {
            factors += 1;
        }

        if (technical.volatility > 0.4) {
            factors += 2;
        } else if (technical.volatility > 0.25) {
            factors += 1;
        }

        if (news.total_articles > 0 &&
            static_cast<double>(news.negative_articles) / news.total_articles > 0.3) {
            factors += 1;
        }

        if (market.current_price > 50.0) {
            factors += 1;
        }

        if (factors >= 4) return RiskLevel::High;
        if (factors >= 2) return RiskLevel::Medium;
        return RiskLevel::Low;
    }

    SignalStrength CompositeScoringEngine::signalStrength(double overall_score, double confidence) {
        const double adjusted = overall_score * confidence;
        if (adjusted >= 80.0) return SignalStrength::VeryStrong;
        if (adjusted >= 70.0) return SignalStrength::Strong;
        if (adjusted >= 60.0) return SignalStrength::Moderate;
        return SignalStrength::Weak;
    }

    Recommendation CompositeScoringEngine::recommendation(double overall_score, RiskLevel risk, double confidence) {
        const double adjusted = overall_score * confidence;

        double strong_buy = 80.0;
        double buy = 70.0;
        double sell = 40.0;
        if (risk == RiskLevel::Low) {
            strong_buy = 75.0;
            buy = 65.0;
            sell = 35.0;
        } else if (risk == RiskLevel::High) {
            strong_buy = 85.0;
            buy = 75.0;
            sell = 45.0;
        }

        if (adjusted >= strong_buy) return Recommendation::StrongBuy;
        if (adjusted >= buy) return Recommendation::Buy;
        if (adjusted >= sell) return Recommendation::Hold;
        if (adjusted >= 25.0) return Recommendation::Sell;
        return Recommendation::StrongSell;
    }

    TradeLevels CompositeScoringEngine::tradeLevels(const core::MarketSnapshot& market,
                                                    const TechnicalSnapshot& technical,
                                                    RiskLevel risk)
    {
        TradeLevels levels;
        const double price = market.current_price;
        if (price <= 0.0) {
            return levels;
        }

        // Momentum entry sits 1% above the last print
        const double entry = price * 1.01;

        double stop = 0.0;
        if (auto support = highestBelow(technical.support_levels, price)) {
            stop = *support * 0.98;
        } else {
            switch (risk) {
                case RiskLevel::Low:    stop = price * 0.95; break;
                case RiskLevel::Medium: stop = price * 0.92; break;
                case RiskLevel::High:   stop = price * 0.90; break;
            }
        }

        double target = 0.0;
        if (auto resistance = lowestAbove(technical.resistance_levels, price)) {
            target = *resistance * 0.98;
        } else {
            target = entry + (entry - stop) * 2.0;
        }

        levels.entry_price = entry;
        levels.stop_loss = stop;
        levels.take_profit = target;
        return levels;
    }

    TimeHorizon CompositeScoringEngine::timeHorizon(const TechnicalSnapshot& technical,
                                                    const core::NewsSummary& news,
                                                    double overall_score)
    {
        if (technical.volatility > 0.3 && technical.relative_volume > 5.0) {
            return TimeHorizon::Scalp;
        }
        const bool urgent_news = news.urgency == core::NewsUrgency::Urgent || news.urgency == core::NewsUrgency::High;
        if (urgent_news && overall_score > 75.0) {
            return TimeHorizon::DayTrade;
        }
        if (overall_score > 70.0) {
            return TimeHorizon::Swing;
        }
        return TimeHorizon::Position;
    }

    Urgency CompositeScoringEngine::urgency(const core::NewsSummary& news,
                                            const TechnicalSnapshot& technical,
                                            double overall_score)
    {
        int factors = 0;

        switch (news.urgency) {
            case core::NewsUrgency::Urgent: factors += 3; break;
            case core::NewsUrgency::High:   factors += 2; break;
            case core::NewsUrgency::Medium: factors += 1; break;
            case core::NewsUrgency::Low:    break;
        }

        if (technical.rsi > 75.0) {
            factors += 1;
        }

        if (technical.relative_volume > 5.0) {
            factors += 2;
        } else if (technical.relative_volume > 3.0) {
            factors += 1;
        }

        if (overall_score > 85.0) {
            factors += 2;
        } else if (overall_score > 75.0) {
            factors += 1;
        }

        if (factors >= 5) return Urgency::Immediate;
        if (factors >= 3) return Urgency::High;
        if (factors >= 1) return Urgency::Medium;
        return Urgency::Low;
    }

    CompositeScore CompositeScoringEngine::defaultScore(const std::string& symbol) {
        CompositeScore score;
        score.symbol = symbol;
        score.is_default = true;
        return score;
    }

    ComponentScore CompositeScoringEngine::makeComponent(const std::string& name, double weight, double raw_score,
                                                         double confidence, nlohmann::json details) const
    {
        ComponentScore component;
        component.component = name;
        component.raw_score = core::utils::clamp(raw_score, 0.0, 100.0);
        component.weight = weight;
        component.weighted_score = component.raw_score * weight;
        component.confidence = core::utils::clamp(confidence, 0.0, 1.0);
        component.details = std::move(details);
        return component;
    }

} // namespace scoring
