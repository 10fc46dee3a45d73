#pragma once

#include <map>
#include <string>
#include <optional>

namespace rule_engine {

    // Named facts a condition can look at. Numeric facts cover scores, ratios and
    // boolean flags (stored as 1.0 / 0.0); labels cover categorical values such as a grade.
    struct FactSnapshot {
        std::map<std::string, double> values;
        std::map<std::string, std::string> labels;

        void set(const std::string& name, double value) { values[name] = value; }
        void setFlag(const std::string& name, bool flag) { values[name] = flag ? 1.0 : 0.0; }
        void setLabel(const std::string& name, const std::string& label) { labels[name] = label; }

        std::optional<double> get(const std::string& name) const;
        std::optional<std::string> getLabel(const std::string& name) const;
    };

    // --- Condition Interface ---
    // A single logical test over a fact snapshot (e.g. rsi > 70)
    class ICondition {
    public:
        virtual ~ICondition() = default;
        virtual bool evaluate(const FactSnapshot& facts) const = 0;
        virtual std::string describe() const = 0;
    };

    // --- Rule Interface ---
    // A condition paired with the message emitted when it holds
    class IRule {
    public:
        virtual ~IRule() = default;
        // Returns the rendered message if triggered, std::nullopt otherwise
        virtual std::optional<std::string> evaluate(const FactSnapshot& facts) const = 0;
        virtual std::string describe() const = 0;
        virtual std::string getName() const = 0;
        // Rules sharing a non-empty group are mutually exclusive: only the first firing one counts
        virtual const std::string& getGroup() const = 0;
    };

} // namespace rule_engine
