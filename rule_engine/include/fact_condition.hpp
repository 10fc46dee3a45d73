#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>
#include <variant> // To hold either a double value or a second fact name

namespace rule_engine {

    // --- FactCondition Class ---
    // Compares a numeric fact against a fixed value OR against another fact.
    class FactCondition : public ICondition {
    public:
        // e.g. FactCondition("rsi", ComparisonOp::GT, 70.0) -> "rsi > 70"
        FactCondition(const std::string& fact_name, ComparisonOp op, double value);

        // e.g. FactCondition("close", ComparisonOp::GT, "ema_9") -> "close > ema_9"
        FactCondition(const std::string& fact_name, ComparisonOp op, const std::string& other_fact);

        ~FactCondition() override = default;

        bool evaluate(const FactSnapshot& facts) const override;
        std::string describe() const override;

    private:
        std::string fact_name_;
        ComparisonOp op_;
        std::variant<double, std::string> rhs_;
    };

} // namespace rule_engine
