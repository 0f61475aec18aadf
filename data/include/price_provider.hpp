#pragma once

#include "datatypes.hpp"
#include <string>

namespace data {

    // Pull-based, read-only source of bars for one instrument and interval.
    class IPriceProvider {
    public:
        virtual ~IPriceProvider() = default;

        // Ascending by timestamp.
        virtual core::TimeSeries<core::PriceBar> getPriceHistory() = 0;

        // Close of the most recent bar. Throws DataLoadException when there is none.
        virtual core::Decimal getCurrentPrice() = 0;
    };

    // In-memory provider over a fixed series. Sorts its input once on construction.
    class VectorPriceProvider : public IPriceProvider {
    public:
        explicit VectorPriceProvider(core::TimeSeries<core::PriceBar> bars);

        core::TimeSeries<core::PriceBar> getPriceHistory() override;
        core::Decimal getCurrentPrice() override;

        // Appends a newer bar, as a live feed would between cycles.
        void append(const core::PriceBar& bar);

    private:
        core::TimeSeries<core::PriceBar> bars_;
    };

} // namespace data
