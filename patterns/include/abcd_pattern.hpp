#pragma once

#include "swing_point_detector.hpp"
#include <optional>
#include <string>

namespace patterns {

    enum class PatternType {
        Bullish, // trough - peak - trough (- peak)
        Bearish  // peak - trough - peak (- trough)
    };

    enum class PatternStrength {
        Weak,
        Moderate,
        Strong
    };

    std::string toString(PatternType type);
    std::string toString(PatternStrength strength);

    // Measured and derived values of a pattern
    struct PatternMetrics {
        double ab_cd_ratio = 0.0;      // CD / AB (0 when AB is 0)
        double bc_cd_ratio = 0.0;      // BC / CD (0 when CD is 0)
        double bc_retracement = 0.0;   // BC / AB (0 when AB is 0)
        double completion_ratio = 0.0; // 1 for complete patterns
        double confidence = 0.0;       // [0, 100]
        double projected_d = 0.0;      // D price, or its projection while forming
        double target_price = 0.0;
        double stop_loss = 0.0;
        double entry_price = 0.0;
        bool is_valid = false;
        PatternStrength strength = PatternStrength::Weak;
    };

    // An ABCD harmonic pattern. Forming patterns have no D point.
    // The constructor enforces A < B < C < D index order, peak/trough alternation matching the
    // pattern type, and the maximum A..D bar span; confidence and completion are clamped.
    class ABCDPattern {
    public:
        ABCDPattern(PatternType type,
                    SwingPoint a, SwingPoint b, SwingPoint c,
                    std::optional<SwingPoint> d,
                    PatternMetrics metrics,
                    int max_pattern_bars);

        PatternType getType() const { return type_; }
        const SwingPoint& getA() const { return a_; }
        const SwingPoint& getB() const { return b_; }
        const SwingPoint& getC() const { return c_; }
        const std::optional<SwingPoint>& getD() const { return d_; }
        const PatternMetrics& getMetrics() const { return metrics_; }

        bool isComplete() const { return d_.has_value(); }
        bool isValid() const { return metrics_.is_valid; }
        double getConfidence() const { return metrics_.confidence; }
        double getCompletionRatio() const { return metrics_.completion_ratio; }
        PatternStrength getStrength() const { return metrics_.strength; }

        // Last vertex index: D when complete, otherwise C
        size_t getEndIndex() const { return d_ ? d_->index : c_.index; }

        // [A.index, end] intervals intersect
        bool overlaps(const ABCDPattern& other) const;

        std::string describe() const;

    private:
        PatternType type_;
        SwingPoint a_;
        SwingPoint b_;
        SwingPoint c_;
        std::optional<SwingPoint> d_;
        PatternMetrics metrics_;
    };

} // namespace patterns
