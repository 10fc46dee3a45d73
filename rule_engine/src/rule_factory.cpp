#include "rule_factory.hpp"
#include "rule.hpp"
#include "fact_condition.hpp"
#include "label_condition.hpp"
#include "and_condition.hpp"
#include "or_condition.hpp"
#include "at_least_condition.hpp"
#include "common_types.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

#include <stdexcept>
#include <vector>
#include <string>
#include <memory>

namespace rule_engine {

    namespace { // file-local helpers

        std::vector<std::unique_ptr<ICondition>> parseSubConditions(const json& config, const std::string& type) {
            if (!config.contains("conditions") || !config["conditions"].is_array() || config["conditions"].empty()) {
                throw std::invalid_argument(fmt::format("{} condition requires 'conditions' (non-empty array).", type));
            }
            std::vector<std::unique_ptr<ICondition>> sub_conditions;
            sub_conditions.reserve(config["conditions"].size());
            for (const auto& sub_conf : config["conditions"]) {
                sub_conditions.push_back(RuleFactory::parseCondition(sub_conf)); // Recursive call
            }
            return sub_conditions;
        }

    } // end anonymous namespace

    // --- Recursive Condition Parser ---
    std::unique_ptr<ICondition> RuleFactory::parseCondition(const json& config) {
        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) {
            throw std::invalid_argument("Condition config must be an object with a 'type' (string).");
        }
        std::string type = config["type"].get<std::string>();
        auto logger = core::logging::getLogger();
        logger->trace("Parsing condition of type: {}", type);

        try {
            if (type == "Fact") {
                if (!config.contains("fact") || !config["fact"].is_string() ||
                    !config.contains("op") || !config["op"].is_string()) {
                    throw std::invalid_argument("Fact condition requires 'fact' (string) and 'op' (string).");
                }
                std::string fact = config["fact"].get<std::string>();
                ComparisonOp op = stringToCompOp(config["op"].get<std::string>());

                if (config.contains("value") && config["value"].is_number()) {
                    return std::make_unique<FactCondition>(fact, op, config["value"].get<double>());
                } else if (config.contains("fact2") && config["fact2"].is_string()) {
                    return std::make_unique<FactCondition>(fact, op, config["fact2"].get<std::string>());
                }
                throw std::invalid_argument("Fact condition requires 'value' (number) or 'fact2' (string).");
            } else if (type == "Label") {
                if (!config.contains("label") || !config["label"].is_string() ||
                    !config.contains("in") || !config["in"].is_array()) {
                    throw std::invalid_argument("Label condition requires 'label' (string) and 'in' (array).");
                }
                return std::make_unique<LabelCondition>(config["label"].get<std::string>(),
                                                        config["in"].get<std::vector<std::string>>());
            } else if (type == "AND") {
                return std::make_unique<AndCondition>(parseSubConditions(config, type));
            } else if (type == "OR") {
                return std::make_unique<OrCondition>(parseSubConditions(config, type));
            } else if (type == "AtLeast") {
                if (!config.contains("min") || !config["min"].is_number_integer()) {
                    throw std::invalid_argument("AtLeast condition requires 'min' (integer).");
                }
                return std::make_unique<AtLeastCondition>(config["min"].get<int>(), parseSubConditions(config, type));
            }
            throw std::invalid_argument(fmt::format("Unknown condition type '{}' in config.", type));
        } catch (const json::exception& e) {
            logger->error("JSON error parsing condition type '{}': {}", type, e.what());
            throw std::invalid_argument(fmt::format("Invalid JSON structure for condition type '{}'", type));
        }
    }

    // --- Rule Parser ---
    std::unique_ptr<IRule> RuleFactory::parseRule(const json& config) {
        if (!config.is_object() ||
            !config.contains("name") || !config["name"].is_string() ||
            !config.contains("message") || !config["message"].is_string() ||
            !config.contains("condition") || !config["condition"].is_object())
        {
            throw std::invalid_argument("Rule config must be object with 'name'(string), 'message'(string), 'condition'(object).");
        }
        std::string name = config["name"].get<std::string>();
        std::string group;
        if (config.contains("group")) {
            if (!config["group"].is_string()) {
                throw std::invalid_argument(fmt::format("Rule '{}' has a non-string 'group'.", name));
            }
            group = config["group"].get<std::string>();
        }

        try {
            auto condition = parseCondition(config["condition"]);
            return std::make_unique<Rule>(name, std::move(condition), config["message"].get<std::string>(), group);
        } catch (const std::invalid_argument& e) {
            core::logging::getLogger()->error("Invalid config for rule '{}': {}", name, e.what());
            throw; // Re-throw
        }
    }

    // --- Main Factory Method ---
    std::unique_ptr<RuleList> RuleFactory::createRuleList(const json& config) {
        auto logger = core::logging::getLogger();

        try {
            if (!config.is_object()) throw std::invalid_argument("Rule list config must be JSON object.");
            if (!config.contains("name") || !config["name"].is_string()) throw std::invalid_argument("Rule list config missing 'name'.");
            if (!config.contains("rules") || !config["rules"].is_array()) throw std::invalid_argument("Rule list config missing 'rules' array.");

            std::string name = config["name"].get<std::string>();
            std::vector<std::unique_ptr<IRule>> rules;
            rules.reserve(config["rules"].size());
            for (const auto& rule_conf : config["rules"]) {
                rules.push_back(parseRule(rule_conf));
            }

            logger->debug("Created rule list '{}' with {} rule(s)", name, rules.size());
            return std::make_unique<RuleList>(name, std::move(rules));

        } catch (const json::exception& e) {
            logger->error("JSON parsing error while creating rule list: {}", e.what());
            return nullptr;
        } catch (const std::invalid_argument& e) {
            logger->error("Invalid rule list configuration: {}", e.what());
            return nullptr;
        }
    }

} // namespace rule_engine
