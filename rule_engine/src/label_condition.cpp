#include "label_condition.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <algorithm>
#include <stdexcept>

namespace rule_engine {

LabelCondition::LabelCondition(std::string label_name, std::vector<std::string> accepted)
    : label_name_(std::move(label_name)), accepted_(std::move(accepted))
{
    if (label_name_.empty()) {
        throw std::invalid_argument("Label name cannot be empty.");
    }
    if (accepted_.empty()) {
        throw std::invalid_argument(fmt::format("LabelCondition on '{}' needs at least one accepted value.", label_name_));
    }
}

bool LabelCondition::evaluate(const FactSnapshot& facts) const {
    auto label = facts.getLabel(label_name_);
    if (!label) {
        return false;
    }
    return std::find(accepted_.begin(), accepted_.end(), *label) != accepted_.end();
}

std::string LabelCondition::describe() const {
    return fmt::format("{} in [{}]", label_name_, fmt::join(accepted_, ", "));
}

} // namespace rule_engine
