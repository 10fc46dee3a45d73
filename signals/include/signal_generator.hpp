#pragma once

#include "composite_scoring_engine.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include "ross_pillar_scorer.hpp"
#include "rule_list.hpp"
#include "technical_analyzer.hpp"
#include "trading_signal.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace signals {

    // Everything needed to analyze one symbol
    struct AnalysisRequest {
        std::string symbol;
        core::TimeSeries<core::Candle> candles;
        core::MarketSnapshot market;
        core::FundamentalSummary fundamentals;
        core::NewsSummary news;
        std::optional<core::PortfolioSnapshot> portfolio; // Only needed for position sizing
        core::Timestamp as_of = std::chrono::system_clock::now(); // Drives news recency and expiry
    };

    struct SignalFilter {
        double min_score = 70.0;
        scoring::RiskLevel max_risk = scoring::RiskLevel::Medium;
        double min_confidence = 0.7;
        std::vector<std::string> required_catalysts; // Any one of them must be present; empty -> no filter
    };

    struct SignalSummary {
        int total_signals = 0;
        int strong_buy_signals = 0;
        int buy_signals = 0;
        int hold_signals = 0;
        int sell_signals = 0; // sell + strong_sell
        double avg_score = 0.0;
        double avg_confidence = 0.0;
        std::vector<std::string> top_symbols; // Up to 10, best overall score first
        std::map<std::string, int> risk_distribution;
    };

    class SignalGenerator {
    public:
        // Throws core::ConfigException if the configuration or a rule-list override is invalid
        explicit SignalGenerator(const core::config::ScreenerConfig& config = {});

        // Full pipeline from candles. Never throws for analysis failures: the result is then a
        // hold signal carrying an explanatory note. Throws core::ValidationException on an empty symbol.
        TradingSignal generateSignal(const AnalysisRequest& request) const;

        // Same, from technical facts the caller already holds (request.candles is ignored)
        TradingSignal generateSignal(const AnalysisRequest& request,
                                     const scoring::TechnicalSnapshot& technical) const;

        // One task per symbol spread over the configured worker threads.
        // Result is sorted by overall score, best first.
        std::vector<TradingSignal> generateBatchSignals(const std::vector<AnalysisRequest>& requests) const;

        SignalSummary createSignalSummary(const std::vector<TradingSignal>& signals) const;

        std::vector<TradingSignal> filterSignalsByCriteria(const std::vector<TradingSignal>& signals,
                                                           const SignalFilter& filter = {}) const;

        // Ross score >= min_ross_score AND the 4-of-5 pillar rule. Sorted by Ross score, best first.
        std::vector<TradingSignal> getRossCameronSignals(const std::vector<TradingSignal>& signals) const;
        std::vector<TradingSignal> getRossCameronSignals(const std::vector<TradingSignal>& signals,
                                                         double min_ross_score) const;

        // --- Building blocks ---
        static scoring::Recommendation signalTypeFor(double overall_score);
        static std::optional<double> riskRewardRatio(std::optional<double> entry,
                                                     std::optional<double> stop,
                                                     std::optional<double> target);
        std::optional<double> positionSize(const scoring::CompositeScore& composite,
                                           const std::optional<core::PortfolioSnapshot>& portfolio) const;
        static core::Timestamp expiryTime(scoring::TimeHorizon horizon, core::Timestamp as_of);

        std::vector<std::string> alerts(const scoring::CompositeScore& composite,
                                        const scoring::RossScore& ross,
                                        const core::MarketSnapshot& market,
                                        const core::NewsSummary& news) const;
        std::vector<std::string> riskWarnings(const scoring::CompositeScore& composite,
                                              const core::MarketSnapshot& market,
                                              const scoring::TechnicalSnapshot& technical) const;
        static std::string analysisNotes(const scoring::CompositeScore& composite,
                                         const scoring::RossScore& ross);

        static TradingSignal defaultSignal(const std::string& symbol, core::Timestamp as_of,
                                           const std::string& reason);

        const rule_engine::RuleList& getAlertRules() const { return *alert_rules_; }
        const rule_engine::RuleList& getWarningRules() const { return *warning_rules_; }

    private:
        bool isHighImpact(const std::string& catalyst_type) const;

        core::config::SignalConfig signal_config_;
        core::config::BatchConfig batch_config_;
        analysis::TechnicalAnalyzer analyzer_;
        scoring::CompositeScoringEngine scoring_engine_;
        scoring::RossCameronPillarScorer ross_scorer_;
        std::unique_ptr<rule_engine::RuleList> alert_rules_;
        std::unique_ptr<rule_engine::RuleList> warning_rules_;
    };

} // namespace signals
