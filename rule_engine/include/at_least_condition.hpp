#pragma once

#include "interfaces.hpp"
#include <vector>
#include <memory>
#include <string>

namespace rule_engine {

    // --- AtLeastCondition Class ---
    // True when at least `min_true` of the contained conditions hold ("k of n" confirmation sets).
    class AtLeastCondition : public ICondition {
    public:
        AtLeastCondition(int min_true, std::vector<std::unique_ptr<ICondition>> conditions);

        ~AtLeastCondition() override = default;

        bool evaluate(const FactSnapshot& facts) const override;
        std::string describe() const override;

        // Number of contained conditions that currently hold
        int countSatisfied(const FactSnapshot& facts) const;

        int getMinimum() const { return min_true_; }
        size_t size() const { return conditions_.size(); }

    private:
        int min_true_;
        std::vector<std::unique_ptr<ICondition>> conditions_;
    };

} // namespace rule_engine
