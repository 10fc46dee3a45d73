#include "abcd_pattern_matcher.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace patterns {

    namespace {

        // Tight band around a Fibonacci level that earns the top tier of a rubric line
        constexpr double kTightTolerance = 0.05;

        constexpr double kGoldenRatio = 0.618;
        constexpr double kGoldenExtension = 1.618;
        constexpr double kHalf = 0.5;

        bool near(double value, double level, double tolerance) {
            return std::fabs(value - level) <= tolerance;
        }

        std::optional<PatternType> typeFor(const SwingPoint& a, const SwingPoint& b, const SwingPoint& c) {
            if (a.type == SwingType::Trough && b.type == SwingType::Peak && c.type == SwingType::Trough) {
                return PatternType::Bullish;
            }
            if (a.type == SwingType::Peak && b.type == SwingType::Trough && c.type == SwingType::Peak) {
                return PatternType::Bearish;
            }
            return std::nullopt;
        }

        double safeRatio(double numerator, double denominator) {
            return denominator > 0.0 ? numerator / denominator : 0.0;
        }

    } // end anonymous namespace

std::string toString(PatternSignalKind kind) {
    switch (kind) {
        case PatternSignalKind::Entry:            return "entry";
        case PatternSignalKind::AnticipatedEntry: return "anticipated_entry";
        case PatternSignalKind::TakeProfit:       return "take_profit";
        case PatternSignalKind::StopLoss:         return "stop_loss";
    }
    return "entry";
}

ABCDPatternMatcher::ABCDPatternMatcher(core::config::ABCDConfig config, core::config::SwingPointConfig swing_config)
    : config_(std::move(config)), detector_(std::move(swing_config))
{
    if (config_.lookahead < 2 || config_.forming_lookahead < 2) {
        throw std::invalid_argument(fmt::format("ABCD lookahead windows must be at least 2 (got {} / {}).",
                                                config_.lookahead, config_.forming_lookahead));
    }
    if (config_.max_pattern_bars <= 0) {
        throw std::invalid_argument("ABCD max_pattern_bars must be positive.");
    }
    if (config_.min_retracement >= config_.max_retracement) {
        throw std::invalid_argument("ABCD retracement range is empty.");
    }
}

// --- Rubrics ---

bool ABCDPatternMatcher::ratiosValid(double ab_cd, double bc_retracement) const {
    const double tol = config_.fib_tolerance;
    const bool ab_cd_valid = near(ab_cd, config_.ideal_ab_cd, tol) ||
                             near(ab_cd, kGoldenRatio, tol) ||
                             near(ab_cd, kGoldenExtension, tol);
    const bool retracement_valid = bc_retracement >= config_.min_retracement &&
                                   bc_retracement <= config_.max_retracement;
    return ab_cd_valid && retracement_valid;
}

double ABCDPatternMatcher::completeConfidence(double ab_cd, double bc_cd, double bc_retracement) const {
    const double tol = config_.fib_tolerance;
    double confidence = 0.0;

    // AB:CD proximity (40)
    if (near(ab_cd, config_.ideal_ab_cd, kTightTolerance)) {
        confidence += 40;
    } else if (near(ab_cd, config_.ideal_ab_cd, tol)) {
        confidence += 30;
    } else if (near(ab_cd, kGoldenRatio, tol) || near(ab_cd, kGoldenExtension, tol)) {
        confidence += 25;
    }

    // BC retracement (30)
    if (near(bc_retracement, kGoldenRatio, kTightTolerance)) {
        confidence += 30;
    } else if (near(bc_retracement, kHalf, kTightTolerance)) {
        confidence += 25;
    } else if (bc_retracement >= config_.min_retracement && bc_retracement <= config_.max_retracement) {
        confidence += 20;
    }

    // BC:CD (30)
    if (near(bc_cd, config_.ideal_bc_cd, kTightTolerance)) {
        confidence += 30;
    } else if (near(bc_cd, kHalf, 0.1)) {
        confidence += 20;
    } else if (bc_cd >= 0.3 && bc_cd <= 0.8) {
        confidence += 15;
    }

    return std::min(confidence, 100.0);
}

double ABCDPatternMatcher::formingConfidence(double bc_retracement, double completion_ratio) const {
    double confidence = 0.0;

    // Retracement quality (50)
    if (near(bc_retracement, kGoldenRatio, kTightTolerance)) {
        confidence += 50;
    } else if (near(bc_retracement, kHalf, kTightTolerance)) {
        confidence += 40;
    } else if (bc_retracement >= config_.min_retracement && bc_retracement <= config_.max_retracement) {
        confidence += 30;
    }

    // Completion (50)
    confidence += completion_ratio * 50.0;
    return std::min(confidence, 100.0);
}

PatternStrength ABCDPatternMatcher::strengthFor(double confidence, double ab_cd) const {
    if (confidence >= 80.0 && near(ab_cd, 1.0, 0.1)) {
        return PatternStrength::Strong;
    }
    if (confidence >= 60.0) {
        return PatternStrength::Moderate;
    }
    return PatternStrength::Weak;
}

double ABCDPatternMatcher::targetFor(PatternType type, double d_price, double cd_distance) const {
    const double extension = cd_distance * config_.target_extension;
    return type == PatternType::Bullish ? d_price + extension : d_price - extension;
}

double ABCDPatternMatcher::stopFor(PatternType type, double c_price) const {
    return type == PatternType::Bullish ? c_price * (1.0 - config_.stop_buffer)
                                        : c_price * (1.0 + config_.stop_buffer);
}

// --- Candidate scoring ---

std::optional<ABCDPattern> ABCDPatternMatcher::evaluateCandidate(const SwingPoint& a, const SwingPoint& b,
                                                                 const SwingPoint& c, const SwingPoint& d) const {
    auto type = typeFor(a, b, c);
    const SwingType expected_d = (type && *type == PatternType::Bullish) ? SwingType::Peak : SwingType::Trough;
    if (!type || d.type != expected_d) {
        return std::nullopt;
    }
    if (!(a.index < b.index && b.index < c.index && c.index < d.index)) {
        return std::nullopt;
    }
    if (d.index - a.index > static_cast<size_t>(config_.max_pattern_bars)) {
        return std::nullopt;
    }

    const double ab = std::fabs(b.price - a.price);
    const double bc = std::fabs(c.price - b.price);
    const double cd = std::fabs(d.price - c.price);

    PatternMetrics m;
    m.ab_cd_ratio = safeRatio(cd, ab);
    m.bc_cd_ratio = safeRatio(bc, cd);
    m.bc_retracement = safeRatio(bc, ab);
    m.completion_ratio = 1.0;
    m.is_valid = ratiosValid(m.ab_cd_ratio, m.bc_retracement);
    m.confidence = completeConfidence(m.ab_cd_ratio, m.bc_cd_ratio, m.bc_retracement);
    m.projected_d = d.price;
    m.target_price = targetFor(*type, d.price, cd);
    m.stop_loss = stopFor(*type, c.price);
    m.entry_price = d.price;
    m.strength = strengthFor(m.confidence, m.ab_cd_ratio);

    return ABCDPattern(*type, a, b, c, d, m, config_.max_pattern_bars);
}

std::optional<ABCDPattern> ABCDPatternMatcher::evaluateFormingCandidate(const SwingPoint& a, const SwingPoint& b,
                                                                        const SwingPoint& c, double current_price) const {
    auto type = typeFor(a, b, c);
    if (!type || !(a.index < b.index && b.index < c.index)) {
        return std::nullopt;
    }

    const double ab = std::fabs(b.price - a.price);
    const double bc = std::fabs(c.price - b.price);
    const double retracement = safeRatio(bc, ab);
    if (retracement < config_.min_retracement || retracement > config_.max_retracement) {
        return std::nullopt;
    }

    // Project D from C with the ideal AB:CD ratio
    const double projected_cd = ab * config_.ideal_ab_cd;
    const double projected_d = *type == PatternType::Bullish ? c.price + projected_cd : c.price - projected_cd;

    const double max_diff = ab * 0.2;
    const double completion = max_diff > 0.0
        ? std::max(0.0, 1.0 - std::fabs(current_price - projected_d) / max_diff)
        : 0.0;

    PatternMetrics m;
    m.ab_cd_ratio = config_.ideal_ab_cd;
    m.bc_cd_ratio = safeRatio(bc, projected_cd);
    m.bc_retracement = retracement;
    m.completion_ratio = std::min(completion, 1.0);
    m.confidence = formingConfidence(retracement, m.completion_ratio);
    m.projected_d = projected_d;
    m.target_price = targetFor(*type, projected_d, std::fabs(projected_d - c.price));
    m.stop_loss = stopFor(*type, c.price);
    m.entry_price = projected_d;
    m.is_valid = m.completion_ratio >= config_.actionable_completion; // actionable
    m.strength = strengthFor(m.confidence, m.ab_cd_ratio);

    return ABCDPattern(*type, a, b, c, std::nullopt, m, config_.max_pattern_bars);
}

// --- Searches ---

std::vector<ABCDPattern> ABCDPatternMatcher::findCompletePatterns(const std::vector<SwingPoint>& swing_points) const {
    std::vector<ABCDPattern> candidates;
    const size_t n = swing_points.size();
    if (n < static_cast<size_t>(config_.min_swing_points_complete)) {
        return candidates;
    }

    const size_t window = static_cast<size_t>(config_.lookahead);
    size_t evaluated = 0;

    for (size_t i = 0; i + 3 < n; ++i) {
        for (size_t j = i + 1; j < std::min(i + window, n - 2); ++j) {
            for (size_t k = j + 1; k < std::min(j + window, n - 1); ++k) {
                for (size_t l = k + 1; l < std::min(k + window, n); ++l) {
                    if (swing_points[l].index - swing_points[i].index > static_cast<size_t>(config_.max_pattern_bars)) {
                        continue;
                    }
                    ++evaluated;
                    auto pattern = evaluateCandidate(swing_points[i], swing_points[j], swing_points[k], swing_points[l]);
                    if (pattern && pattern->isValid()) {
                        core::logging::getLogger()->trace("Candidate accepted: {}", pattern->describe());
                        candidates.push_back(std::move(*pattern));
                    }
                }
            }
        }
    }

    // Best confidence first, most recent D breaks ties
    std::stable_sort(candidates.begin(), candidates.end(), [](const ABCDPattern& lhs, const ABCDPattern& rhs) {
        if (lhs.getConfidence() != rhs.getConfidence()) {
            return lhs.getConfidence() > rhs.getConfidence();
        }
        return lhs.getEndIndex() > rhs.getEndIndex();
    });

    // Greedy overlap resolution against already accepted, higher-ranked patterns
    std::vector<ABCDPattern> accepted;
    for (auto& candidate : candidates) {
        bool overlaps = std::any_of(accepted.begin(), accepted.end(),
            [&](const ABCDPattern& existing) { return candidate.overlaps(existing); });
        if (!overlaps) {
            accepted.push_back(std::move(candidate));
        }
    }

    core::logging::getLogger()->debug("ABCD search: {} quadruples scored, {} valid, {} kept after overlap filter",
                                      evaluated, candidates.size(), accepted.size());
    return accepted;
}

std::vector<ABCDPattern> ABCDPatternMatcher::findFormingPatterns(const std::vector<SwingPoint>& swing_points,
                                                                 double current_price, size_t bar_count) const {
    std::vector<ABCDPattern> patterns;
    const size_t n = swing_points.size();
    if (n < static_cast<size_t>(config_.min_swing_points_forming)) {
        return patterns;
    }

    const size_t window = static_cast<size_t>(config_.forming_lookahead);
    for (size_t i = 0; i + 2 < n; ++i) {
        for (size_t j = i + 1; j < std::min(i + window, n - 1); ++j) {
            for (size_t k = j + 1; k < std::min(j + window, n); ++k) {
                // Stale once C is too far behind the last bar
                if (bar_count < swing_points[k].index ||
                    bar_count - swing_points[k].index > static_cast<size_t>(config_.stale_bars)) {
                    continue;
                }
                auto pattern = evaluateFormingCandidate(swing_points[i], swing_points[j], swing_points[k], current_price);
                if (pattern) {
                    patterns.push_back(std::move(*pattern));
                }
            }
        }
    }

    std::stable_sort(patterns.begin(), patterns.end(), [](const ABCDPattern& lhs, const ABCDPattern& rhs) {
        if (lhs.getCompletionRatio() != rhs.getCompletionRatio()) {
            return lhs.getCompletionRatio() > rhs.getCompletionRatio();
        }
        return lhs.getC().index > rhs.getC().index;
    });

    if (patterns.size() > static_cast<size_t>(config_.max_forming_patterns)) {
        patterns.erase(patterns.begin() + config_.max_forming_patterns, patterns.end());
    }

    core::logging::getLogger()->debug("ABCD search: {} forming pattern(s) kept", patterns.size());
    return patterns;
}

// --- Selection and signals ---

std::optional<ABCDPattern> ABCDPatternMatcher::selectActivePattern(const std::vector<ABCDPattern>& complete,
                                                                   const std::vector<ABCDPattern>& forming) const {
    for (const auto& pattern : complete) {
        if (pattern.getConfidence() >= 70.0 && pattern.getStrength() != PatternStrength::Weak) {
            return pattern;
        }
    }
    for (const auto& pattern : forming) {
        if (pattern.getCompletionRatio() >= 0.8 && pattern.getConfidence() >= 60.0) {
            return pattern;
        }
    }
    if (!complete.empty()) {
        return complete.front();
    }
    // Forming legs short of the actionable completion never become active
    for (const auto& pattern : forming) {
        if (pattern.isValid()) {
            return pattern;
        }
    }
    return std::nullopt;
}

std::vector<PatternSignal> ABCDPatternMatcher::entrySignals(const std::vector<ABCDPattern>& complete,
                                                            const std::vector<ABCDPattern>& forming,
                                                            double current_price) const {
    std::vector<PatternSignal> signals;

    for (const auto& pattern : complete) {
        if (pattern.getConfidence() < config_.min_entry_confidence) {
            continue;
        }
        const double d_price = pattern.getD()->price;
        const double tolerance = std::fabs(d_price - pattern.getC().price) * config_.entry_proximity;
        if (std::fabs(current_price - d_price) > tolerance) {
            continue;
        }
        const auto& m = pattern.getMetrics();
        signals.push_back({PatternSignalKind::Entry, pattern.getType(), m.entry_price, m.target_price, m.stop_loss,
                           m.confidence, 1.0,
                           m.confidence >= 80.0 ? PatternStrength::Strong : PatternStrength::Moderate});
    }

    for (const auto& pattern : forming) {
        if (!pattern.isValid()) {
            continue; // Not actionable yet
        }
        const auto& m = pattern.getMetrics();
        signals.push_back({PatternSignalKind::AnticipatedEntry, pattern.getType(), m.entry_price, m.target_price,
                           m.stop_loss, m.confidence, m.completion_ratio, PatternStrength::Moderate});
    }
    return signals;
}

std::vector<PatternSignal> ABCDPatternMatcher::exitSignals(const std::vector<ABCDPattern>& complete,
                                                           double current_price) const {
    std::vector<PatternSignal> signals;
    for (const auto& pattern : complete) {
        const auto& m = pattern.getMetrics();
        const bool bullish = pattern.getType() == PatternType::Bullish;

        const bool target_hit = bullish ? current_price >= m.target_price : current_price <= m.target_price;
        if (target_hit) {
            signals.push_back({PatternSignalKind::TakeProfit, pattern.getType(), m.target_price, m.target_price,
                               m.stop_loss, m.confidence, 1.0, PatternStrength::Strong});
        }

        const bool stop_hit = bullish ? current_price <= m.stop_loss : current_price >= m.stop_loss;
        if (stop_hit) {
            signals.push_back({PatternSignalKind::StopLoss, pattern.getType(), m.stop_loss, m.target_price,
                               m.stop_loss, m.confidence, 1.0, PatternStrength::Strong});
        }
    }
    return signals;
}

PatternSummary ABCDPatternMatcher::summarize(const std::vector<ABCDPattern>& complete,
                                             const std::vector<ABCDPattern>& forming) {
    PatternSummary summary;
    summary.total_complete = static_cast<int>(complete.size());
    for (const auto& p : complete) {
        (p.getType() == PatternType::Bullish ? summary.bullish_complete : summary.bearish_complete)++;
        if (p.getStrength() == PatternStrength::Strong) ++summary.strong_patterns;
        if (p.getConfidence() >= 80.0) ++summary.high_confidence_patterns;
    }
    for (const auto& p : forming) {
        if (!p.isValid()) {
            continue;
        }
        ++summary.total_forming;
        (p.getType() == PatternType::Bullish ? summary.bullish_forming : summary.bearish_forming)++;
    }
    return summary;
}

// --- Entry point ---

ABCDAnalysis ABCDPatternMatcher::analyze(const core::TimeSeries<core::Candle>& candles) const {
    auto logger = core::logging::getLogger();
    ABCDAnalysis analysis;

    try {
        analysis.swing_points = detector_.detect(candles);
        if (analysis.swing_points.size() < static_cast<size_t>(config_.min_swing_points_forming)) {
            logger->debug("ABCD analysis: only {} swing point(s), pattern search unavailable",
                          analysis.swing_points.size());
            return analysis;
        }

        const double current_price = candles.back().close;
        analysis.complete_patterns = findCompletePatterns(analysis.swing_points);
        analysis.forming_patterns = findFormingPatterns(analysis.swing_points, current_price, candles.size());
        analysis.active_pattern = selectActivePattern(analysis.complete_patterns, analysis.forming_patterns);
        analysis.entry_signals = entrySignals(analysis.complete_patterns, analysis.forming_patterns, current_price);
        analysis.exit_signals = exitSignals(analysis.complete_patterns, current_price);
        analysis.summary = summarize(analysis.complete_patterns, analysis.forming_patterns);

        logger->debug("ABCD analysis: {} complete, {} forming, {} entry / {} exit signal(s)",
                      analysis.complete_patterns.size(), analysis.forming_patterns.size(),
                      analysis.entry_signals.size(), analysis.exit_signals.size());
    } catch (const core::ValidationException& e) {
        logger->error("ABCD analysis failed on an inconsistent pattern: {}", e.what());
        return ABCDAnalysis{};
    } catch (const std::exception& e) {
        logger->error("ABCD analysis failed: {}", e.what());
        return ABCDAnalysis{};
    }
    return analysis;
}

} // namespace patterns
