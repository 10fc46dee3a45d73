#pragma once

#include "indicators.hpp" // Base interface
#include <string>

namespace indicators {

class SmaIndicator : public IIndicator {
public:
    // Simple moving average of one candle column (close by default, volume for relative volume)
    explicit SmaIndicator(int period, core::PriceField source = core::PriceField::Close);

    ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    core::PriceField source_;
    int lookback_;              // Calculated TA-Lib lookback
    std::string name_;          // e.g. "SMA(20)" or "SMA(20,volume)"
    core::TimeSeries<double> results_;
};

} // namespace indicators
