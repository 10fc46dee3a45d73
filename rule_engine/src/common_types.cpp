#include "common_types.hpp"
#include <cmath>
#include <stdexcept>

namespace rule_engine {

std::string opToString(ComparisonOp op) {
    switch (op) {
        case ComparisonOp::GT:  return ">";
        case ComparisonOp::LT:  return "<";
        case ComparisonOp::GTE: return ">=";
        case ComparisonOp::LTE: return "<=";
        case ComparisonOp::EQ:  return "==";
    }
    return "InvalidOp";
}

ComparisonOp stringToCompOp(const std::string& op_str) {
    if (op_str == ">" || op_str == "GT") return ComparisonOp::GT;
    if (op_str == "<" || op_str == "LT") return ComparisonOp::LT;
    if (op_str == ">=" || op_str == "GTE") return ComparisonOp::GTE;
    if (op_str == "<=" || op_str == "LTE") return ComparisonOp::LTE;
    if (op_str == "==" || op_str == "EQ") return ComparisonOp::EQ;
    throw std::invalid_argument("Unknown comparison operator string: " + op_str);
}

bool compare(double lhs, ComparisonOp op, double rhs) {
    switch (op) {
        case ComparisonOp::GT:  return lhs > rhs;
        case ComparisonOp::LT:  return lhs < rhs;
        case ComparisonOp::GTE: return lhs >= rhs;
        case ComparisonOp::LTE: return lhs <= rhs;
        case ComparisonOp::EQ:
            // Use tolerance for floating point equality
            return std::fabs(lhs - rhs) < 1e-9;
    }
    return false;
}

} // namespace rule_engine
