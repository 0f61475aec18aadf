#pragma once

#include "price_provider.hpp"
#include "database_manager.hpp"
#include <string>

namespace data {

    // Serves one instrument/interval window from the price_bars table.
    // The DatabaseManager must outlive the provider and be connected.
    class SqlitePriceProvider : public IPriceProvider {
    public:
        SqlitePriceProvider(DatabaseManager& db,
                            std::string instrument_key,
                            std::string interval,
                            core::Timestamp start_time,
                            core::Timestamp end_time);

        // Throws DataLoadException when the database is not connected
        core::TimeSeries<core::PriceBar> getPriceHistory() override;
        core::Decimal getCurrentPrice() override;

    private:
        DatabaseManager& db_;
        std::string instrument_key_;
        std::string interval_;
        core::Timestamp start_time_;
        core::Timestamp end_time_;
    };

} // namespace data
