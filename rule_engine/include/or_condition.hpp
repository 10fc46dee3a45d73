#pragma once

#include "interfaces.hpp"
#include <vector>
#include <memory>
#include <string>

namespace rule_engine {

    // --- OrCondition Class ---
    // Evaluates to true if ANY contained condition evaluates to true.
    class OrCondition : public ICondition {
    public:
        explicit OrCondition(std::vector<std::unique_ptr<ICondition>> conditions);

        ~OrCondition() override = default;

        bool evaluate(const FactSnapshot& facts) const override;
        std::string describe() const override;

    private:
        std::vector<std::unique_ptr<ICondition>> conditions_;
    };

} // namespace rule_engine
