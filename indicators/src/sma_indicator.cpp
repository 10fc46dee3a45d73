#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "ta_libc.h"            // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <vector>
#include <stdexcept>

namespace indicators {

SmaIndicator::SmaIndicator(int period, core::PriceField source)
    : period_(period), source_(source), lookback_(0)
{
    if (period_ <= 0) {
        throw std::invalid_argument("SMA period must be positive.");
    }

    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = source_ == core::PriceField::Volume ? fmt::format("SMA({},volume)", period_)
                                                : fmt::format("SMA({})", period_);
    core::logging::getLogger()->trace("SmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& SmaIndicator::getResult() const {
    return results_;
}

void SmaIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    const std::vector<double> values = core::utils::extractField(input, source_);

    // TA-Lib output size = input size - lookback
    const int output_size = static_cast<int>(values.size()) - lookback_;
    results_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MA(
        0,                                   // startIdx
        static_cast<int>(values.size()) - 1, // endIdx
        values.data(),
        period_,
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
        logger->warn("TA_MA out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                     out_begin_idx, lookback_, name_);
    }
    if (out_nb_element != output_size) {
        logger->warn("TA_MA out_nb_element ({}) does not match expected output size ({}) for {}. Resizing results vector.",
                     out_nb_element, output_size, name_);
        results_.resize(out_nb_element);
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
