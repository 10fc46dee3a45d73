#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries, PriceField
#include <string>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Name including parameters, e.g. "EMA(20)"
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first valid output.
    // getResult()[i] lines up with input[i + getLookback()].
    virtual int getLookback() const = 0;

    // Calculate the indicator and store the result internally.
    // Too little input leaves an empty result; a TA-Lib failure throws core::IndicatorCalculationException.
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    virtual const core::TimeSeries<double>& getResult() const = 0;
};

} // namespace indicators
