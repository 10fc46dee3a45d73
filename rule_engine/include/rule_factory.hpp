#pragma once

#include "interfaces.hpp"
#include "rule_list.hpp"
#include <string>
#include <memory> // For std::unique_ptr
#include <nlohmann/json.hpp>

namespace rule_engine {

    using json = nlohmann::json;

    class RuleFactory {
    public:
        // Builds a rule list from {"name": "...", "rules": [ {"name","group"?,"condition","message"}, ... ]}.
        // Returns nullptr (after logging) if the document is malformed.
        static std::unique_ptr<RuleList> createRuleList(const json& config);

        // Condition types: "Fact", "Label", "AND", "OR", "AtLeast". Throws std::invalid_argument.
        static std::unique_ptr<ICondition> parseCondition(const json& condition_config);

    private:
        static std::unique_ptr<IRule> parseRule(const json& rule_config);
    };

} // namespace rule_engine
