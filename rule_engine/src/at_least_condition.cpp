#include "at_least_condition.hpp"
#include <spdlog/fmt/fmt.h>
#include <sstream>
#include <stdexcept>

namespace rule_engine {

AtLeastCondition::AtLeastCondition(int min_true, std::vector<std::unique_ptr<ICondition>> conditions)
    : min_true_(min_true), conditions_(std::move(conditions))
{
    if (conditions_.empty()) {
        throw std::invalid_argument("AtLeastCondition must receive at least one condition.");
    }
    if (min_true_ < 1 || static_cast<size_t>(min_true_) > conditions_.size()) {
        throw std::invalid_argument(fmt::format("AtLeastCondition minimum {} is outside [1, {}].",
                                                min_true_, conditions_.size()));
    }
    for (const auto& condition : conditions_) {
        if (!condition) {
            throw std::invalid_argument("AtLeastCondition received a null condition.");
        }
    }
}

int AtLeastCondition::countSatisfied(const FactSnapshot& facts) const {
    int satisfied = 0;
    for (const auto& condition : conditions_) {
        if (condition->evaluate(facts)) {
            ++satisfied;
        }
    }
    return satisfied;
}

bool AtLeastCondition::evaluate(const FactSnapshot& facts) const {
    return countSatisfied(facts) >= min_true_;
}

std::string AtLeastCondition::describe() const {
    std::stringstream ss;
    ss << "AT LEAST " << min_true_ << " OF (";
    for (size_t i = 0; i < conditions_.size(); ++i) {
        ss << conditions_[i]->describe();
        if (i < conditions_.size() - 1) {
            ss << ", ";
        }
    }
    ss << ")";
    return ss.str();
}

} // namespace rule_engine
