#include "rule.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <fmt/args.h>
#include <stdexcept>

namespace rule_engine {

Rule::Rule(std::string rule_name,
           std::unique_ptr<ICondition> condition,
           std::string message_template,
           std::string group)
    : name_(std::move(rule_name)),
      condition_(std::move(condition)),
      message_template_(std::move(message_template)),
      group_(std::move(group))
{
    if (name_.empty()) {
        throw std::invalid_argument("Rule name cannot be empty.");
    }
    if (!condition_) {
        throw std::invalid_argument(fmt::format("Condition cannot be null for Rule '{}'.", name_));
    }
    if (message_template_.empty()) {
        throw std::invalid_argument(fmt::format("Message cannot be empty for Rule '{}'.", name_));
    }
}

std::optional<std::string> Rule::evaluate(const FactSnapshot& facts) const {
    bool condition_result = condition_->evaluate(facts);

    core::logging::getLogger()->trace("Rule '{}' evaluated condition '{}' -> {}",
                                      name_, condition_->describe(), condition_result);

    if (!condition_result) {
        return std::nullopt;
    }
    return render(facts);
}

std::string Rule::render(const FactSnapshot& facts) const {
    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const auto& [name, value] : facts.values) {
        store.push_back(fmt::arg(name.c_str(), value));
    }
    for (const auto& [name, label] : facts.labels) {
        store.push_back(fmt::arg(name.c_str(), label));
    }

    try {
        return fmt::vformat(message_template_, store);
    } catch (const fmt::format_error& e) {
        // A template naming an absent fact still fires, just unformatted
        core::logging::getLogger()->error("Rule '{}' could not render message '{}': {}",
                                          name_, message_template_, e.what());
        return message_template_;
    }
}

std::string Rule::describe() const {
    return fmt::format("Rule('{}'): IF ({}) THEN \"{}\"", name_, condition_->describe(), message_template_);
}

} // namespace rule_engine
