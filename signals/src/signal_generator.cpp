#include "signal_generator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "rule_factory.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/chrono.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <ctime>
#include <thread>

namespace signals {

    namespace { // file-local helpers

        // Alert tiers: within a group only the first firing rule is reported
        const char* kDefaultAlertRules = R"({
            "name": "signal_alerts",
            "rules": [
                {"name": "exceptional_setup", "group": "composite",
                 "condition": {"type": "Fact", "fact": "overall_score", "op": ">=", "value": 90},
                 "message": "EXCEPTIONAL SETUP - Very high composite score!"},
                {"name": "strong_setup", "group": "composite",
                 "condition": {"type": "Fact", "fact": "overall_score", "op": ">=", "value": 80},
                 "message": "STRONG SETUP - High composite score"},
                {"name": "perfect_ross_setup", "group": "ross",
                 "condition": {"type": "Fact", "fact": "ross_score", "op": ">=", "value": 90},
                 "message": "PERFECT ROSS CAMERON SETUP - All pillars strong!"},
                {"name": "excellent_ross_setup", "group": "ross",
                 "condition": {"type": "Label", "label": "ross_grade", "in": ["A+", "A"]},
                 "message": "EXCELLENT ROSS SETUP - Grade: {ross_grade}"},
                {"name": "massive_volume", "group": "volume",
                 "condition": {"type": "Fact", "fact": "relative_volume", "op": ">=", "value": 10},
                 "message": "MASSIVE VOLUME - {relative_volume:.1f}x average!"},
                {"name": "high_volume", "group": "volume",
                 "condition": {"type": "Fact", "fact": "relative_volume", "op": ">=", "value": 5},
                 "message": "HIGH VOLUME - {relative_volume:.1f}x average"},
                {"name": "major_move", "group": "move",
                 "condition": {"type": "Fact", "fact": "abs_price_change_pct", "op": ">=", "value": 20},
                 "message": "MAJOR MOVE - {price_change_pct:+.1f}% price change!"},
                {"name": "significant_move", "group": "move",
                 "condition": {"type": "Fact", "fact": "abs_price_change_pct", "op": ">=", "value": 10},
                 "message": "SIGNIFICANT MOVE - {price_change_pct:+.1f}% price change"},
                {"name": "high_impact_catalyst",
                 "condition": {"type": "Fact", "fact": "high_impact_catalyst", "op": "==", "value": 1},
                 "message": "HIGH-IMPACT CATALYST DETECTED"},
                {"name": "immediate_urgency", "group": "urgency",
                 "condition": {"type": "Label", "label": "urgency", "in": ["immediate"]},
                 "message": "IMMEDIATE ACTION REQUIRED"},
                {"name": "high_urgency", "group": "urgency",
                 "condition": {"type": "Label", "label": "urgency", "in": ["high"]},
                 "message": "HIGH URGENCY - Act soon"}
            ]
        })";

        const char* kDefaultWarningRules = R"({
            "name": "risk_warnings",
            "rules": [
                {"name": "high_risk",
                 "condition": {"type": "Label", "label": "risk_level", "in": ["high"]},
                 "message": "HIGH RISK TRADE - Use smaller position size"},
                {"name": "highly_overbought", "group": "rsi",
                 "condition": {"type": "Fact", "fact": "rsi", "op": ">", "value": 80},
                 "message": "HIGHLY OVERBOUGHT - Risk of pullback"},
                {"name": "overbought", "group": "rsi",
                 "condition": {"type": "Fact", "fact": "rsi", "op": ">", "value": 70},
                 "message": "OVERBOUGHT CONDITIONS - Monitor closely"},
                {"name": "low_confidence",
                 "condition": {"type": "Fact", "fact": "confidence", "op": "<", "value": 0.6},
                 "message": "LOW CONFIDENCE SIGNAL - Consider waiting"},
                {"name": "high_volatility",
                 "condition": {"type": "Fact", "fact": "volatility", "op": ">", "value": 0.4},
                 "message": "HIGH VOLATILITY - Expect large price swings"},
                {"name": "high_price",
                 "condition": {"type": "Fact", "fact": "current_price", "op": ">", "value": 50},
                 "message": "HIGH PRICE STOCK - Increased risk"},
                {"name": "large_gap",
                 "condition": {"type": "Fact", "fact": "abs_gap_pct", "op": ">", "value": 15},
                 "message": "LARGE GAP - Risk of gap fill"}
            ]
        })";

        std::unique_ptr<rule_engine::RuleList> loadRuleList(const core::config::json& override_config,
                                                            const char* default_config)
        {
            const bool use_override = !override_config.is_null() && !override_config.empty();
            auto rules = rule_engine::RuleFactory::createRuleList(
                use_override ? override_config : core::config::json::parse(default_config));
            if (!rules) {
                throw core::ConfigException(use_override
                    ? "Invalid rule-list override in 'signals' configuration."
                    : "Embedded default rule list is invalid.");
            }
            return rules;
        }

        std::string signalId(const std::string& symbol, core::Timestamp as_of, bool failed) {
            std::time_t tt = std::chrono::system_clock::to_time_t(as_of);
            return fmt::format("{}_{}{:%Y%m%d_%H%M%S}", symbol, failed ? "error_" : "", fmt::gmtime(tt));
        }

        // "news_sentiment" -> "News Sentiment"
        std::string titleCase(const std::string& name) {
            std::string result = name;
            bool start = true;
            for (auto& ch : result) {
                if (ch == '_') {
                    ch = ' ';
                    start = true;
                } else if (start) {
                    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
                    start = false;
                }
            }
            return result;
        }

        bool higherOverall(const TradingSignal& a, const TradingSignal& b) {
            return a.getOverallScore() > b.getOverallScore();
        }

    } // end anonymous namespace

    SignalGenerator::SignalGenerator(const core::config::ScreenerConfig& config)
        : signal_config_(config.signals),
          batch_config_(config.batch),
          analyzer_(config),
          scoring_engine_(config.weights),
          ross_scorer_(config.ross),
          alert_rules_(loadRuleList(config.signals.alert_rules, kDefaultAlertRules)),
          warning_rules_(loadRuleList(config.signals.warning_rules, kDefaultWarningRules))
    {
        if (signal_config_.base_risk_per_trade <= 0.0 || signal_config_.base_risk_per_trade >= 1.0) {
            throw core::ConfigException(fmt::format(
                "'signals.base_risk_per_trade' must be in (0, 1), got {}.", signal_config_.base_risk_per_trade));
        }
        if (signal_config_.max_position_fraction <= 0.0 || signal_config_.max_position_fraction > 1.0) {
            throw core::ConfigException(fmt::format(
                "'signals.max_position_fraction' must be in (0, 1], got {}.", signal_config_.max_position_fraction));
        }
        core::logging::getLogger()->debug("SignalGenerator ready: {} alert rule(s), {} warning rule(s)",
                                          alert_rules_->size(), warning_rules_->size());
    }

    // --- Single symbol ---

    TradingSignal SignalGenerator::generateSignal(const AnalysisRequest& request) const {
        if (request.symbol.empty()) {
            throw core::ValidationException("Analysis request has an empty symbol.");
        }
        auto logger = core::logging::getLogger();

        scoring::TechnicalSnapshot technical;
        try {
            auto analysis = analyzer_.analyze(request.symbol, request.candles,
                                              request.market.current_price, request.market.volume,
                                              request.fundamentals.float_shares);
            technical = std::move(analysis.snapshot);
        } catch (const core::ValidationException& e) {
            logger->error("Rejected candle series for {}: {}", request.symbol, e.what());
            return defaultSignal(request.symbol, request.as_of,
                                 fmt::format("Invalid price series: {}", e.what()));
        } catch (const std::exception& e) {
            logger->error("Technical analysis failed for {}: {}", request.symbol, e.what());
            return defaultSignal(request.symbol, request.as_of,
                                 fmt::format("Technical analysis failed: {}", e.what()));
        }

        return generateSignal(request, technical);
    }

    TradingSignal SignalGenerator::generateSignal(const AnalysisRequest& request,
                                                  const scoring::TechnicalSnapshot& technical) const
    {
        if (request.symbol.empty()) {
            throw core::ValidationException("Analysis request has an empty symbol.");
        }
        auto logger = core::logging::getLogger();
        logger->debug("Generating signal for {}", request.symbol);

        try {
            TradingSignalData data;
            data.symbol = request.symbol;
            data.signal_id = signalId(request.symbol, request.as_of, false);
            data.timestamp = request.as_of;

            data.composite = scoring_engine_.score(request.symbol, request.market, request.fundamentals,
                                                   technical, request.news, request.as_of);
            data.ross = ross_scorer_.score(request.market, request.fundamentals, request.news);

            data.signal_type = signalTypeFor(data.composite.overall_score);
            data.risk_reward_ratio = riskRewardRatio(data.composite.entry_price, data.composite.stop_loss,
                                                     data.composite.take_profit);
            data.position_size = positionSize(data.composite, request.portfolio);
            data.expiry_time = expiryTime(data.composite.time_horizon, request.as_of);

            data.alerts = alerts(data.composite, data.ross, request.market, request.news);
            data.risk_warnings = riskWarnings(data.composite, request.market, technical);
            data.notes = analysisNotes(data.composite, data.ross);

            data.market = request.market;
            data.fundamentals = request.fundamentals;
            data.technical = technical;
            data.news = request.news;

            logger->info("{}: {} (score {:.1f}, confidence {:.2f}, risk {}, Ross {:.1f} {})",
                         request.symbol, scoring::toString(data.signal_type), data.composite.overall_score,
                         data.composite.confidence_level, scoring::toString(data.composite.risk_level),
                         data.ross.overall, data.ross.grade);
            return TradingSignal(std::move(data));
        } catch (const std::exception& e) {
            logger->error("Error generating signal for {}: {}", request.symbol, e.what());
            return defaultSignal(request.symbol, request.as_of,
                                 fmt::format("Signal generation failed: {}", e.what()));
        }
    }

    // --- Batch ---

    std::vector<TradingSignal> SignalGenerator::generateBatchSignals(const std::vector<AnalysisRequest>& requests) const {
        auto logger = core::logging::getLogger();
        if (requests.empty()) {
            return {};
        }

        size_t worker_count = batch_config_.worker_threads > 0
            ? static_cast<size_t>(batch_config_.worker_threads)
            : std::max(1u, std::thread::hardware_concurrency());
        worker_count = std::min(worker_count, requests.size());
        logger->info("Generating batch signals for {} symbol(s) on {} worker(s)", requests.size(), worker_count);

        // One slot per request, each written by exactly one worker
        std::vector<std::optional<TradingSignal>> slots(requests.size());
        std::atomic<size_t> next_index{0};

        auto worker = [&]() {
            for (size_t i = next_index.fetch_add(1); i < requests.size(); i = next_index.fetch_add(1)) {
                try {
                    slots[i].emplace(generateSignal(requests[i]));
                } catch (const std::exception& e) {
                    logger->warn("Skipping request #{} ('{}'): {}", i, requests[i].symbol, e.what());
                }
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (size_t t = 0; t < worker_count; ++t) {
            workers.emplace_back(worker);
        }
        for (auto& thread : workers) {
            if (thread.joinable()) {
                thread.join();
            }
        }

        std::vector<TradingSignal> signals;
        signals.reserve(requests.size());
        for (auto& slot : slots) {
            if (slot) {
                signals.push_back(std::move(*slot));
            }
        }
        std::stable_sort(signals.begin(), signals.end(), higherOverall);

        logger->info("Generated {} of {} signal(s)", signals.size(), requests.size());
        return signals;
    }

    // --- Post-processing ---

    SignalSummary SignalGenerator::createSignalSummary(const std::vector<TradingSignal>& signals) const {
        SignalSummary summary;
        summary.risk_distribution = {{"low", 0}, {"medium", 0}, {"high", 0}};
        if (signals.empty()) {
            return summary;
        }

        double score_sum = 0.0;
        double confidence_sum = 0.0;
        for (const auto& signal : signals) {
            switch (signal.getRecommendation()) {
                case scoring::Recommendation::StrongBuy: ++summary.strong_buy_signals; break;
                case scoring::Recommendation::Buy: ++summary.buy_signals; break;
                case scoring::Recommendation::Hold: ++summary.hold_signals; break;
                case scoring::Recommendation::Sell:
                case scoring::Recommendation::StrongSell: ++summary.sell_signals; break;
            }
            ++summary.risk_distribution[scoring::toString(signal.getRiskLevel())];
            score_sum += signal.getOverallScore();
            confidence_sum += signal.getConfidence();
        }
        summary.total_signals = static_cast<int>(signals.size());
        summary.avg_score = score_sum / signals.size();
        summary.avg_confidence = confidence_sum / signals.size();

        std::vector<const TradingSignal*> ranked;
        ranked.reserve(signals.size());
        for (const auto& signal : signals) {
            ranked.push_back(&signal);
        }
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const TradingSignal* a, const TradingSignal* b) { return higherOverall(*a, *b); });
        for (size_t i = 0; i < ranked.size() && i < 10; ++i) {
            summary.top_symbols.push_back(ranked[i]->getSymbol());
        }
        return summary;
    }

    std::vector<TradingSignal> SignalGenerator::filterSignalsByCriteria(const std::vector<TradingSignal>& signals,
                                                                        const SignalFilter& filter) const
    {
        std::vector<TradingSignal> filtered;
        for (const auto& signal : signals) {
            if (signal.getOverallScore() < filter.min_score) continue;
            if (scoring::riskRank(signal.getRiskLevel()) > scoring::riskRank(filter.max_risk)) continue;
            if (signal.getConfidence() < filter.min_confidence) continue;

            if (!filter.required_catalysts.empty()) {
                const auto& present = signal.getNews().catalyst_types;
                bool found = std::any_of(filter.required_catalysts.begin(), filter.required_catalysts.end(),
                    [&present](const std::string& wanted) {
                        return std::find(present.begin(), present.end(), wanted) != present.end();
                    });
                if (!found) continue;
            }
            filtered.push_back(signal);
        }
        core::logging::getLogger()->info("Filtered {} signal(s) to {}", signals.size(), filtered.size());
        return filtered;
    }

    std::vector<TradingSignal> SignalGenerator::getRossCameronSignals(const std::vector<TradingSignal>& signals) const {
        return getRossCameronSignals(signals, ross_scorer_.getConfig().min_ross_score);
    }

    std::vector<TradingSignal> SignalGenerator::getRossCameronSignals(const std::vector<TradingSignal>& signals,
                                                                      double min_ross_score) const
    {
        std::vector<TradingSignal> selected;
        for (const auto& signal : signals) {
            const auto& ross = signal.getRossScore();
            if (ross.overall < min_ross_score) continue;
            if (!ross_scorer_.meetsPillarRule(ross)) {
                core::logging::getLogger()->debug("{}: Ross score {:.1f} but only {} pillar(s) pass",
                                                  signal.getSymbol(), ross.overall, ross_scorer_.pillarsPassed(ross));
                continue;
            }
            selected.push_back(signal);
        }
        std::stable_sort(selected.begin(), selected.end(), [](const TradingSignal& a, const TradingSignal& b) {
            return a.getRossScore().overall > b.getRossScore().overall;
        });
        core::logging::getLogger()->info("Found {} signal(s) meeting the Ross Cameron criteria", selected.size());
        return selected;
    }

    // --- Building blocks ---

    scoring::Recommendation SignalGenerator::signalTypeFor(double overall_score) {
        if (overall_score >= 80.0) return scoring::Recommendation::StrongBuy;
        if (overall_score >= 65.0) return scoring::Recommendation::Buy;
        if (overall_score >= 45.0) return scoring::Recommendation::Hold;
        if (overall_score >= 30.0) return scoring::Recommendation::Sell;
        return scoring::Recommendation::StrongSell;
    }

    std::optional<double> SignalGenerator::riskRewardRatio(std::optional<double> entry,
                                                           std::optional<double> stop,
                                                           std::optional<double> target)
    {
        if (!entry || !stop || !target) {
            return std::nullopt;
        }
        const double risk = *entry - *stop;
        if (risk <= 0.0) {
            return std::nullopt;
        }
        return (*target - *entry) / risk;
    }

    std::optional<double> SignalGenerator::positionSize(const scoring::CompositeScore& composite,
                                                        const std::optional<core::PortfolioSnapshot>& portfolio) const
    {
        if (!portfolio || portfolio->account_value <= 0.0) {
            return std::nullopt;
        }
        if (!composite.entry_price || !composite.stop_loss || *composite.entry_price <= 0.0) {
            return std::nullopt;
        }
        const double risk_per_share = *composite.entry_price - *composite.stop_loss;
        if (risk_per_share <= 0.0) {
            return std::nullopt;
        }

        double risk_fraction = signal_config_.base_risk_per_trade;
        if (composite.confidence_level > 0.8 && composite.overall_score > 85.0) {
            risk_fraction *= 1.5;
        } else if (composite.confidence_level < 0.6) {
            risk_fraction *= 0.5;
        }
        if (composite.risk_level == scoring::RiskLevel::High) {
            risk_fraction *= 0.5;
        } else if (composite.risk_level == scoring::RiskLevel::Low) {
            risk_fraction *= 1.2;
        }

        const double by_risk = portfolio->account_value * risk_fraction / risk_per_share;
        const double by_value = portfolio->account_value * signal_config_.max_position_fraction / *composite.entry_price;
        return std::min(by_risk, by_value);
    }

    core::Timestamp SignalGenerator::expiryTime(scoring::TimeHorizon horizon, core::Timestamp as_of) {
        switch (horizon) {
            case scoring::TimeHorizon::Scalp: return as_of + std::chrono::minutes(30);
            case scoring::TimeHorizon::DayTrade: return as_of + std::chrono::hours(6);
            case scoring::TimeHorizon::Swing: return as_of + std::chrono::hours(24 * 5);
            case scoring::TimeHorizon::Position: return as_of + std::chrono::hours(24 * 30);
        }
        return as_of + std::chrono::hours(24);
    }

    bool SignalGenerator::isHighImpact(const std::string& catalyst_type) const {
        const auto& high_impact = ross_scorer_.getConfig().high_impact_catalysts;
        return std::find(high_impact.begin(), high_impact.end(), catalyst_type) != high_impact.end();
    }

    std::vector<std::string> SignalGenerator::alerts(const scoring::CompositeScore& composite,
                                                     const scoring::RossScore& ross,
                                                     const core::MarketSnapshot& market,
                                                     const core::NewsSummary& news) const
    {
        rule_engine::FactSnapshot facts;
        facts.set("overall_score", composite.overall_score);
        facts.set("ross_score", ross.overall);
        facts.setLabel("ross_grade", ross.grade);
        facts.set("relative_volume", market.relative_volume);
        facts.set("price_change_pct", market.price_change_pct);
        facts.set("abs_price_change_pct", std::abs(market.price_change_pct));
        facts.setFlag("high_impact_catalyst",
                      std::any_of(news.catalyst_types.begin(), news.catalyst_types.end(),
                                  [this](const std::string& type) { return isHighImpact(type); }));
        facts.setLabel("urgency", scoring::toString(composite.urgency));
        return alert_rules_->evaluate(facts);
    }

    std::vector<std::string> SignalGenerator::riskWarnings(const scoring::CompositeScore& composite,
                                                           const core::MarketSnapshot& market,
                                                           const scoring::TechnicalSnapshot& technical) const
    {
        rule_engine::FactSnapshot facts;
        facts.setLabel("risk_level", scoring::toString(composite.risk_level));
        facts.set("rsi", technical.rsi);
        facts.set("confidence", composite.confidence_level);
        facts.set("volatility", technical.volatility);
        facts.set("current_price", market.current_price);
        facts.set("gap_pct", market.gap_pct);
        facts.set("abs_gap_pct", std::abs(market.gap_pct));
        return warning_rules_->evaluate(facts);
    }

    std::string SignalGenerator::analysisNotes(const scoring::CompositeScore& composite,
                                               const scoring::RossScore& ross)
    {
        std::vector<std::string> lines;
        lines.push_back(fmt::format("Overall Score: {:.1f}/100", composite.overall_score));
        lines.push_back(fmt::format("Ross Cameron Grade: {}", ross.grade));
        lines.push_back(fmt::format("Confidence: {:.1f}%", composite.confidence_level * 100.0));
        lines.push_back(fmt::format("Risk Level: {}", titleCase(scoring::toString(composite.risk_level))));

        if (!composite.components.empty()) {
            lines.emplace_back("");
            lines.emplace_back("Component Scores:");
            for (const auto& component : composite.components) {
                lines.push_back(fmt::format("- {}: {:.1f}/100", titleCase(component.component), component.raw_score));
            }
        }

        lines.emplace_back("");
        lines.emplace_back("Ross Cameron Pillars:");
        lines.push_back(fmt::format("- Volume: {:.1f}/100", ross.volume));
        lines.push_back(fmt::format("- Price Change: {:.1f}/100", ross.price_change));
        lines.push_back(fmt::format("- Float: {:.1f}/100", ross.float_size));
        lines.push_back(fmt::format("- Catalyst: {:.1f}/100", ross.catalyst));
        lines.push_back(fmt::format("- Price Range: {:.1f}/100", ross.price_range));

        if (composite.entry_price || composite.stop_loss || composite.take_profit) {
            lines.emplace_back("");
        }
        if (composite.entry_price) lines.push_back(fmt::format("Entry: ${:.2f}", *composite.entry_price));
        if (composite.stop_loss) lines.push_back(fmt::format("Stop Loss: ${:.2f}", *composite.stop_loss));
        if (composite.take_profit) lines.push_back(fmt::format("Take Profit: ${:.2f}", *composite.take_profit));

        for (const auto& note : composite.notes) {
            lines.push_back(note);
        }

        std::string result;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) result += '\n';
            result += lines[i];
        }
        return result;
    }

    TradingSignal SignalGenerator::defaultSignal(const std::string& symbol, core::Timestamp as_of,
                                                 const std::string& reason)
    {
        TradingSignalData data;
        data.symbol = symbol;
        data.signal_id = signalId(symbol, as_of, true);
        data.timestamp = as_of;
        data.composite = scoring::CompositeScoringEngine::defaultScore(symbol);
        data.composite.notes.push_back(reason);
        data.ross = scoring::RossCameronPillarScorer::defaultScore();
        data.signal_type = scoring::Recommendation::Hold;
        data.alerts = {"Signal generation error"};
        data.risk_warnings = {"Signal reliability unknown"};
        data.notes = fmt::format("Error in signal generation: {}", reason);
        return TradingSignal(std::move(data));
    }

} // namespace signals
