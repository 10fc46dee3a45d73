#include "and_condition.hpp"
#include <sstream> // For describe()
#include <stdexcept>

namespace rule_engine {

AndCondition::AndCondition(std::vector<std::unique_ptr<ICondition>> conditions)
    : conditions_(std::move(conditions))
{
    if (conditions_.empty()) {
        throw std::invalid_argument("AndCondition must receive at least one condition.");
    }
    for (const auto& condition : conditions_) {
        if (!condition) {
            throw std::invalid_argument("AndCondition received a null condition.");
        }
    }
}

bool AndCondition::evaluate(const FactSnapshot& facts) const {
    for (const auto& condition : conditions_) {
        if (!condition->evaluate(facts)) {
            return false;
        }
    }
    return true;
}

std::string AndCondition::describe() const {
    std::stringstream ss;
    ss << "(";
    for (size_t i = 0; i < conditions_.size(); ++i) {
        ss << conditions_[i]->describe();
        if (i < conditions_.size() - 1) {
            ss << " AND ";
        }
    }
    ss << ")";
    return ss.str();
}

} // namespace rule_engine
