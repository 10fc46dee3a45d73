#include "rule_list.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <set>
#include <sstream>
#include <stdexcept>

namespace rule_engine {

RuleList::RuleList(std::string name, std::vector<std::unique_ptr<IRule>> rules)
    : name_(std::move(name)), rules_(std::move(rules))
{
    if (name_.empty()) {
        throw std::invalid_argument("RuleList name cannot be empty.");
    }
    for (const auto& rule : rules_) {
        if (!rule) {
            throw std::invalid_argument(fmt::format("RuleList '{}' received a null rule.", name_));
        }
    }
}

std::vector<std::string> RuleList::evaluate(const FactSnapshot& facts) const {
    std::vector<std::string> messages;
    std::set<std::string> fired_groups;

    for (const auto& rule : rules_) {
        const auto& group = rule->getGroup();
        if (!group.empty() && fired_groups.count(group) > 0) {
            continue; // A higher tier of this group already fired
        }
        auto message = rule->evaluate(facts);
        if (!message) {
            continue;
        }
        messages.push_back(std::move(*message));
        if (!group.empty()) {
            fired_groups.insert(group);
        }
    }

    core::logging::getLogger()->trace("RuleList '{}' produced {} message(s) from {} rule(s)",
                                      name_, messages.size(), rules_.size());
    return messages;
}

std::string RuleList::describe() const {
    std::stringstream ss;
    ss << "RuleList('" << name_ << "'):";
    for (const auto& rule : rules_) {
        ss << "\n  " << rule->describe();
    }
    return ss.str();
}

} // namespace rule_engine
