#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// MACD line (fast EMA - slow EMA), its signal EMA and the histogram.
// getResult() returns the MACD line; all three series share the same lookback.
class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_period, int slow_period, int signal_period);

    ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    const core::TimeSeries<double>& getSignalLine() const;
    const core::TimeSeries<double>& getHistogram() const;

private:
    const int fast_period_;
    const int slow_period_;
    const int signal_period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> macd_;
    core::TimeSeries<double> signal_;
    core::TimeSeries<double> histogram_;
};

} // namespace indicators
