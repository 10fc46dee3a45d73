#include "trading_signal.hpp"
#include <stdexcept>
#include <utility>

namespace signals {

    TradingSignal::TradingSignal(TradingSignalData data) : data_(std::move(data)) {
        if (data_.symbol.empty()) {
            throw std::invalid_argument("TradingSignal requires a symbol.");
        }
    }

} // namespace signals
