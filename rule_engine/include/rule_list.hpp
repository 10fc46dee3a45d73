#pragma once

#include "interfaces.hpp"
#include <string>
#include <vector>
#include <memory>

namespace rule_engine {

    // --- RuleList Class ---
    // An ordered list of rules. evaluate() returns the messages of every firing rule in
    // list order, except that within a group only the first firing rule is reported
    // (tiered rules such as "score >= 90" / "score >= 80").
    class RuleList {
    public:
        RuleList(std::string name, std::vector<std::unique_ptr<IRule>> rules);

        std::vector<std::string> evaluate(const FactSnapshot& facts) const;

        const std::string& getName() const { return name_; }
        size_t size() const { return rules_.size(); }
        std::string describe() const;

    private:
        std::string name_;
        std::vector<std::unique_ptr<IRule>> rules_;
    };

} // namespace rule_engine
