#include "abcd_pattern.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace patterns {

std::string toString(PatternType type) {
    return type == PatternType::Bullish ? "bullish" : "bearish";
}

std::string toString(PatternStrength strength) {
    switch (strength) {
        case PatternStrength::Weak:     return "weak";
        case PatternStrength::Moderate: return "moderate";
        case PatternStrength::Strong:   return "strong";
    }
    return "weak";
}

ABCDPattern::ABCDPattern(PatternType type,
                         SwingPoint a, SwingPoint b, SwingPoint c,
                         std::optional<SwingPoint> d,
                         PatternMetrics metrics,
                         int max_pattern_bars)
    : type_(type), a_(a), b_(b), c_(c), d_(std::move(d)), metrics_(metrics)
{
    if (!(a_.index < b_.index && b_.index < c_.index)) {
        throw core::ValidationException(fmt::format("ABCD points out of order: A={} B={} C={}",
                                                    a_.index, b_.index, c_.index));
    }
    if (d_ && !(c_.index < d_->index)) {
        throw core::ValidationException(fmt::format("ABCD point D ({}) must follow C ({}).", d_->index, c_.index));
    }

    const SwingType first = type_ == PatternType::Bullish ? SwingType::Trough : SwingType::Peak;
    const SwingType second = type_ == PatternType::Bullish ? SwingType::Peak : SwingType::Trough;
    if (a_.type != first || b_.type != second || c_.type != first || (d_ && d_->type != second)) {
        throw core::ValidationException(fmt::format("Swing point types do not alternate as a {} pattern requires.",
                                                    toString(type_)));
    }

    if (d_ && d_->index - a_.index > static_cast<size_t>(max_pattern_bars)) {
        throw core::ValidationException(fmt::format("ABCD pattern spans {} bars, maximum is {}.",
                                                    d_->index - a_.index, max_pattern_bars));
    }

    metrics_.confidence = core::utils::clamp(metrics_.confidence, 0.0, 100.0);
    metrics_.completion_ratio = d_ ? 1.0 : core::utils::clamp(metrics_.completion_ratio, 0.0, 1.0);
}

bool ABCDPattern::overlaps(const ABCDPattern& other) const {
    return a_.index <= other.getEndIndex() && getEndIndex() >= other.a_.index;
}

std::string ABCDPattern::describe() const {
    if (d_) {
        return fmt::format("{} ABCD [{}..{}] AB:CD={:.3f} BC:CD={:.3f} conf={:.1f} {}",
                           toString(type_), a_.index, d_->index, metrics_.ab_cd_ratio, metrics_.bc_cd_ratio,
                           metrics_.confidence, toString(metrics_.strength));
    }
    return fmt::format("{} ABC forming [{}..{}] projected D={:.4f} completion={:.2f} conf={:.1f}",
                       toString(type_), a_.index, c_.index, metrics_.projected_d,
                       metrics_.completion_ratio, metrics_.confidence);
}

} // namespace patterns
