#include "interfaces.hpp"

namespace rule_engine {

std::optional<double> FactSnapshot::get(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> FactSnapshot::getLabel(const std::string& name) const {
    auto it = labels.find(name);
    if (it == labels.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace rule_engine
