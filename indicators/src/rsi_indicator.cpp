#include "rsi_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <vector>
#include <stdexcept>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("RSI period must be positive.");
    }

    // Determine the lookback period required by TA-Lib
    lookback_ = TA_RSI_Lookback(period_);
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA_RSI_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->trace("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    const std::vector<double> close_prices = core::utils::extractField(input, core::PriceField::Close);

    const int output_size = static_cast<int>(close_prices.size()) - lookback_;
    results_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_RSI(
        0,                                         // startIdx
        static_cast<int>(close_prices.size()) - 1, // endIdx
        close_prices.data(),
        period_,                                   // optInTimePeriod
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_RSI failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
        logger->warn("TA_RSI out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                     out_begin_idx, lookback_, name_);
    }
    if (out_nb_element != output_size) {
        logger->warn("TA_RSI out_nb_element ({}) does not match expected output size ({}) for {}. Resizing results vector.",
                     out_nb_element, output_size, name_);
        results_.resize(out_nb_element);
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
