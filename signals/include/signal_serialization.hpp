#pragma once

#include "scoring_types.hpp"
#include "signal_generator.hpp"
#include "trading_signal.hpp"
#include <nlohmann/json.hpp>

namespace signals {

    using json = nlohmann::json;

    // Output documents for downstream API / CLI / storage layers.
    // Enum values use their lower_snake_case names, timestamps ISO 8601 UTC, absent optionals null.
    json toJson(const scoring::ComponentScore& component);
    json toJson(const scoring::CompositeScore& composite);
    json toJson(const scoring::RossScore& ross);
    json toJson(const scoring::TechnicalSnapshot& technical);
    json toJson(const TradingSignal& signal);
    json toJson(const SignalSummary& summary);

} // namespace signals
