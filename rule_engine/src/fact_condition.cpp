#include "fact_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace rule_engine {

FactCondition::FactCondition(const std::string& fact_name, ComparisonOp op, double value)
    : fact_name_(fact_name), op_(op), rhs_(value)
{
    if (fact_name_.empty()) {
        throw std::invalid_argument("Fact name cannot be empty.");
    }
}

FactCondition::FactCondition(const std::string& fact_name, ComparisonOp op, const std::string& other_fact)
    : fact_name_(fact_name), op_(op), rhs_(other_fact)
{
    if (fact_name_.empty() || other_fact.empty()) {
        throw std::invalid_argument("Fact names cannot be empty.");
    }
    if (fact_name_ == other_fact) {
        throw std::invalid_argument(fmt::format("Cannot compare fact '{}' to itself.", fact_name_));
    }
}

bool FactCondition::evaluate(const FactSnapshot& facts) const {
    auto lhs = facts.get(fact_name_);
    if (!lhs) {
        core::logging::getLogger()->trace("FactCondition: LHS fact '{}' not found in snapshot.", fact_name_);
        return false; // Cannot evaluate if the fact is missing
    }

    double rhs_value = 0.0;
    if (const double* value = std::get_if<double>(&rhs_)) {
        rhs_value = *value;
    } else {
        const auto& other_name = std::get<std::string>(rhs_);
        auto rhs = facts.get(other_name);
        if (!rhs) {
            core::logging::getLogger()->trace("FactCondition: RHS fact '{}' not found in snapshot.", other_name);
            return false;
        }
        rhs_value = *rhs;
    }

    return compare(*lhs, op_, rhs_value);
}

std::string FactCondition::describe() const {
    if (const double* value = std::get_if<double>(&rhs_)) {
        return fmt::format("{} {} {}", fact_name_, opToString(op_), *value);
    }
    return fmt::format("{} {} {}", fact_name_, opToString(op_), std::get<std::string>(rhs_));
}

} // namespace rule_engine
