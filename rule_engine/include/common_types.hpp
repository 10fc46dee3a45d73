#pragma once

#include <string>

namespace rule_engine {

    // Enum for comparison types
    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE, // Greater Than or Equal To (>=)
        LTE, // Less Than or Equal To (<=)
        EQ   // Equal To (==)
    };

    std::string opToString(ComparisonOp op);

    // Accepts ">", "GT", "<", "LT", ">=", "GTE", "<=", "LTE", "==", "EQ"
    ComparisonOp stringToCompOp(const std::string& op_str);

    bool compare(double lhs, ComparisonOp op, double rhs);

} // namespace rule_engine
