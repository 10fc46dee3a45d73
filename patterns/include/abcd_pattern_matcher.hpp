#pragma once

#include "abcd_pattern.hpp"
#include "swing_point_detector.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace patterns {

    enum class PatternSignalKind {
        Entry,            // Complete pattern, price sitting at D
        AnticipatedEntry, // Actionable forming pattern
        TakeProfit,
        StopLoss
    };

    std::string toString(PatternSignalKind kind);

    struct PatternSignal {
        PatternSignalKind kind = PatternSignalKind::Entry;
        PatternType pattern_type = PatternType::Bullish;
        double price = 0.0;        // Entry price for entries, exit level for exits
        double target_price = 0.0;
        double stop_loss = 0.0;
        double confidence = 0.0;
        double completion_ratio = 1.0;
        PatternStrength signal_strength = PatternStrength::Moderate;
    };

    // Forming counts include only actionable (valid) forming patterns
    struct PatternSummary {
        int total_complete = 0;
        int total_forming = 0;
        int bullish_complete = 0;
        int bearish_complete = 0;
        int bullish_forming = 0;
        int bearish_forming = 0;
        int strong_patterns = 0;
        int high_confidence_patterns = 0; // confidence >= 80
    };

    struct ABCDAnalysis {
        std::vector<SwingPoint> swing_points;
        std::vector<ABCDPattern> complete_patterns; // Non-overlapping, best first
        std::vector<ABCDPattern> forming_patterns;  // Best completion first
        std::optional<ABCDPattern> active_pattern;
        std::vector<PatternSignal> entry_signals;
        std::vector<PatternSignal> exit_signals;
        PatternSummary summary;
    };

    // Bounded search for ABCD harmonic patterns over swing points.
    //
    // Each vertex is searched only within `lookahead` swing points of the previous one and a
    // quadruple may span at most `max_pattern_bars` bars, so the search is linear in the number
    // of swing points (lookahead^3 candidates per starting point) rather than O(n^4).
    class ABCDPatternMatcher {
    public:
        explicit ABCDPatternMatcher(core::config::ABCDConfig config = {},
                                    core::config::SwingPointConfig swing_config = {});

        // Full analysis of a candle series. Never throws; short or unusable input yields an empty analysis.
        ABCDAnalysis analyze(const core::TimeSeries<core::Candle>& candles) const;

        // Valid, non-overlapping complete patterns sorted by (confidence, D index) descending
        std::vector<ABCDPattern> findCompletePatterns(const std::vector<SwingPoint>& swing_points) const;

        // ABC legs with an in-range retracement whose C is at most `stale_bars` old, best completion first
        std::vector<ABCDPattern> findFormingPatterns(const std::vector<SwingPoint>& swing_points,
                                                     double current_price, size_t bar_count) const;

        // Scores one quadruple. std::nullopt if the types do not alternate, the order is wrong or
        // the span is too long. A returned pattern may still be invalid (see isValid()).
        std::optional<ABCDPattern> evaluateCandidate(const SwingPoint& a, const SwingPoint& b,
                                                     const SwingPoint& c, const SwingPoint& d) const;

        // Scores one ABC leg against the current price. std::nullopt unless the retracement is in range.
        std::optional<ABCDPattern> evaluateFormingCandidate(const SwingPoint& a, const SwingPoint& b,
                                                            const SwingPoint& c, double current_price) const;

        std::optional<ABCDPattern> selectActivePattern(const std::vector<ABCDPattern>& complete,
                                                       const std::vector<ABCDPattern>& forming) const;

        std::vector<PatternSignal> entrySignals(const std::vector<ABCDPattern>& complete,
                                                const std::vector<ABCDPattern>& forming,
                                                double current_price) const;

        std::vector<PatternSignal> exitSignals(const std::vector<ABCDPattern>& complete, double current_price) const;

        static PatternSummary summarize(const std::vector<ABCDPattern>& complete,
                                        const std::vector<ABCDPattern>& forming);

        const core::config::ABCDConfig& getConfig() const { return config_; }

    private:
        bool ratiosValid(double ab_cd, double bc_retracement) const;
        double completeConfidence(double ab_cd, double bc_cd, double bc_retracement) const;
        double formingConfidence(double bc_retracement, double completion_ratio) const;
        PatternStrength strengthFor(double confidence, double ab_cd) const;
        double targetFor(PatternType type, double d_price, double cd_distance) const;
        double stopFor(PatternType type, double c_price) const;

        core::config::ABCDConfig config_;
        SwingPointDetector detector_;
    };

} // namespace patterns
