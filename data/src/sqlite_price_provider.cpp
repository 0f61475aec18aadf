#include "sqlite_price_provider.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

namespace data {

    SqlitePriceProvider::SqlitePriceProvider(DatabaseManager& db,
                                             std::string instrument_key,
                                             std::string interval,
                                             core::Timestamp start_time,
                                             core::Timestamp end_time)
        : db_(db),
          instrument_key_(std::move(instrument_key)),
          interval_(std::move(interval)),
          start_time_(start_time),
          end_time_(end_time)
    {
        if (end_time_ < start_time_) {
            throw core::DataLoadException("Price window end is before its start");
        }
    }

    core::TimeSeries<core::PriceBar> SqlitePriceProvider::getPriceHistory() {
        if (!db_.isConnected()) {
            throw core::DataLoadException("Price database is not connected");
        }
        core::TimeSeries<core::PriceBar> bars = db_.queryBars(instrument_key_, interval_, start_time_, end_time_);
        core::logging::getLogger()->debug("SqlitePriceProvider returned {} bars for {} ({})",
                                          bars.size(), instrument_key_, interval_);
        return bars;
    }

    core::Decimal SqlitePriceProvider::getCurrentPrice() {
        core::TimeSeries<core::PriceBar> bars = getPriceHistory();
        if (bars.empty()) {
            throw core::DataLoadException("No price data available for " + instrument_key_);
        }
        return bars.back().close;
    }

} // namespace data
