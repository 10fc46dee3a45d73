#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <vector>
#include <stdexcept>

namespace indicators {

EmaIndicator::EmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("EMA period must be positive.");
    }

    lookback_ = TA_EMA_Lookback(period_);
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA_EMA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("EMA({})", period_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& EmaIndicator::getResult() const {
    return results_;
}

void EmaIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
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

    // EMA seeded with the SMA of the first `period` closes
    TA_RetCode ret_code = TA_EMA(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_EMA failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_nb_element != output_size) {
        logger->warn("TA_EMA out_nb_element ({}) does not match expected output size ({}) for {}. Resizing results vector.",
                     out_nb_element, output_size, name_);
        results_.resize(out_nb_element);
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
