#pragma once

#include "interfaces.hpp"
#include <string>
#include <vector>

namespace rule_engine {

    // True when a categorical label equals one of the accepted values (e.g. grade in {A+, A})
    class LabelCondition : public ICondition {
    public:
        LabelCondition(std::string label_name, std::vector<std::string> accepted);
        ~LabelCondition() override = default;

        bool evaluate(const FactSnapshot& facts) const override;
        std::string describe() const override;

    private:
        std::string label_name_;
        std::vector<std::string> accepted_;
    };

} // namespace rule_engine
