#include "macd_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <vector>
#include <stdexcept>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_period_(fast_period), slow_period_(slow_period), signal_period_(signal_period), lookback_(0)
{
    if (fast_period_ <= 0 || slow_period_ <= 0 || signal_period_ <= 0) {
        throw std::invalid_argument("MACD periods must be positive.");
    }
    if (fast_period_ >= slow_period_) {
        throw std::invalid_argument(fmt::format("MACD fast period ({}) must be below slow period ({}).",
                                                fast_period_, slow_period_));
    }

    lookback_ = TA_MACD_Lookback(fast_period_, slow_period_, signal_period_);
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA_MACD_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("MACD({},{},{})", fast_period_, slow_period_, signal_period_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& MacdIndicator::getResult() const {
    return macd_;
}

const core::TimeSeries<double>& MacdIndicator::getSignalLine() const {
    return signal_;
}

const core::TimeSeries<double>& MacdIndicator::getHistogram() const {
    return histogram_;
}

void MacdIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    macd_.clear();
    signal_.clear();
    histogram_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    const std::vector<double> close_prices = core::utils::extractField(input, core::PriceField::Close);
    const int output_size = static_cast<int>(close_prices.size()) - lookback_;
    macd_.resize(output_size);
    signal_.resize(output_size);
    histogram_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MACD(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        fast_period_,
        slow_period_,
        signal_period_,
        &out_begin_idx,
        &out_nb_element,
        macd_.data(),
        signal_.data(),
        histogram_.data()
    );

    if (ret_code != TA_SUCCESS) {
        macd_.clear();
        signal_.clear();
        histogram_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MACD failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
        logger->warn("TA_MACD out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                     out_begin_idx, lookback_, name_);
    }
    if (out_nb_element != output_size) {
        macd_.resize(out_nb_element);
        signal_.resize(out_nb_element);
        histogram_.resize(out_nb_element);
    }

    logger->trace("Successfully calculated {} results for {}", macd_.size(), name_);
}

} // namespace indicators
