#pragma once

#include "abcd_pattern_matcher.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include "scoring_types.hpp"
#include "support_resistance_calculator.hpp"
#include "technical_indicator_engine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace analysis {

    enum class MomentumStrength { Weak, Moderate, Strong };
    enum class VolatilityLevel { Low, Medium, High };
    enum class SetupQuality { Poor, Fair, Good, Excellent };
    enum class EntryTiming { Avoid, Wait, WaitForConfirmation, Immediate };
    enum class EntryAction { Hold, WeakBuy, Buy, StrongBuy };
    enum class ExitAction { Hold, PartialSell, Sell };

    std::string toString(MomentumStrength strength);
    std::string toString(VolatilityLevel level);
    std::string toString(SetupQuality quality);
    std::string toString(EntryTiming timing);
    std::string toString(EntryAction action);
    std::string toString(ExitAction action);

    struct EntryRecommendation {
        EntryAction action = EntryAction::Hold;
        double confidence = 0.0;
        std::vector<std::string> reasons;
        double entry_price = 0.0;
        EntryTiming timing = EntryTiming::Wait;
    };

    struct ExitRecommendation {
        ExitAction action = ExitAction::Hold;
        double confidence = 0.0;
        std::vector<std::string> reasons;
        double exit_price = 0.0;
        scoring::Urgency urgency = scoring::Urgency::Low;
    };

    struct TechnicalAnalysisResult {
        std::string symbol;
        double current_price = 0.0;

        indicators::TechnicalSignalSet signals;
        patterns::ABCDAnalysis abcd;
        SupportResistanceResult levels;

        EntryRecommendation entry;
        ExitRecommendation exit;

        std::optional<double> stop_loss;
        std::optional<double> take_profit;
        std::optional<double> risk_reward_ratio;

        double technical_score = 50.0;
        indicators::Direction trend = indicators::Direction::Sideways;
        MomentumStrength momentum = MomentumStrength::Weak;
        VolatilityLevel volatility = VolatilityLevel::Medium;

        bool ross_setup = false;
        SetupQuality setup_quality = SetupQuality::Poor;
        EntryTiming entry_timing = EntryTiming::Avoid;

        scoring::TechnicalSnapshot snapshot;
    };

    // Runs the pattern matcher, indicator engine and support/resistance calculator over one
    // candle series and condenses them into recommendations plus the scoring snapshot.
    class TechnicalAnalyzer {
    public:
        explicit TechnicalAnalyzer(const core::config::ScreenerConfig& config);

        // Throws core::ValidationException on malformed candles. Short series degrade to the
        // neutral results of each sub-component.
        TechnicalAnalysisResult analyze(const std::string& symbol,
                                        const core::TimeSeries<core::Candle>& candles,
                                        double current_price,
                                        long long current_volume,
                                        std::optional<double> float_shares = std::nullopt) const;

        // --- Assessments (exposed for tests) ---
        static double technicalScore(const indicators::TechnicalSignalSet& signals,
                                     const patterns::ABCDAnalysis& abcd,
                                     const SupportResistanceResult& levels);
        static indicators::Direction trendDirection(const indicators::TechnicalSignalSet& signals,
                                                    const patterns::ABCDAnalysis& abcd);
        static MomentumStrength momentumStrength(const indicators::TechnicalSignalSet& signals);
        static VolatilityLevel volatilityLevel(double annualized_volatility);

        static EntryRecommendation entryRecommendation(const indicators::TechnicalSignalSet& signals,
                                                       const patterns::ABCDAnalysis& abcd,
                                                       double current_price);
        static ExitRecommendation exitRecommendation(const indicators::TechnicalSignalSet& signals,
                                                     const patterns::ABCDAnalysis& abcd,
                                                     double current_price,
                                                     std::optional<double> nearest_resistance);

        static scoring::TechnicalSnapshot buildSnapshot(const indicators::TechnicalSignalSet& signals,
                                                        const patterns::ABCDAnalysis& abcd,
                                                        const SupportResistanceResult& levels);

    private:
        void assessSetup(TechnicalAnalysisResult& result, std::optional<double> float_shares) const;
        void assessRisk(TechnicalAnalysisResult& result) const;

        patterns::ABCDPatternMatcher matcher_;
        indicators::TechnicalIndicatorEngine engine_;
        SupportResistanceCalculator levels_;
    };

} // namespace analysis
