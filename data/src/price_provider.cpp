#include "price_provider.hpp"
#include "exceptions.hpp"
#include <algorithm>

namespace data {

    VectorPriceProvider::VectorPriceProvider(core::TimeSeries<core::PriceBar> bars)
        : bars_(std::move(bars))
    {
        std::stable_sort(bars_.begin(), bars_.end());
    }

    core::TimeSeries<core::PriceBar> VectorPriceProvider::getPriceHistory() {
        return bars_;
    }

    core::Decimal VectorPriceProvider::getCurrentPrice() {
        if (bars_.empty()) {
            throw core::DataLoadException("No price data available");
        }
        return bars_.back().close;
    }

    void VectorPriceProvider::append(const core::PriceBar& bar) {
        if (!bars_.empty() && bar.timestamp < bars_.back().timestamp) {
            throw core::DataLoadException("Appended bar is older than the latest bar");
        }
        bars_.push_back(bar);
    }

} // namespace data
