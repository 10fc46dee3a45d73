#pragma once

#include "interfaces.hpp"
#include <string>
#include <memory> // For std::unique_ptr

namespace rule_engine {

    // --- Rule Class ---
    // Holds a condition and the message to emit when it evaluates to true.
    // The message is an fmt template whose named fields are looked up in the snapshot,
    // e.g. "HIGH VOLUME - {relative_volume:.1f}x average".
    class Rule : public IRule {
    public:
        Rule(std::string rule_name,
             std::unique_ptr<ICondition> condition,
             std::string message_template,
             std::string group = "");

        ~Rule() override = default;

        std::optional<std::string> evaluate(const FactSnapshot& facts) const override;
        std::string describe() const override;

        std::string getName() const override { return name_; }
        const std::string& getGroup() const override { return group_; }

    private:
        std::string render(const FactSnapshot& facts) const;

        std::string name_;
        std::unique_ptr<ICondition> condition_;
        std::string message_template_;
        std::string group_;
    };

} // namespace rule_engine
