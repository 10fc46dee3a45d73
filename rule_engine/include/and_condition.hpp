#pragma once

#include "interfaces.hpp"
#include <vector>
#include <memory> // For std::unique_ptr
#include <string>

namespace rule_engine {

    // --- AndCondition Class ---
    // Evaluates to true only if ALL contained conditions evaluate to true.
    class AndCondition : public ICondition {
    public:
        // Constructor takes ownership of a vector of conditions
        explicit AndCondition(std::vector<std::unique_ptr<ICondition>> conditions);

        ~AndCondition() override = default;

        bool evaluate(const FactSnapshot& facts) const override;
        std::string describe() const override;

    private:
        std::vector<std::unique_ptr<ICondition>> conditions_;
    };

} // namespace rule_engine
