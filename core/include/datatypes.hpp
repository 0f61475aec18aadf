#pragma once

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <optional> // For fields that are only set in some states

#include "decimal.hpp"

namespace core {

    // Using system_clock for time points, can be adjusted if needed
    using Timestamp = std::chrono::system_clock::time_point;


    // One OHLCV observation. Immutable once produced by a price source.
    struct PriceBar {
        Timestamp timestamp;
        Decimal open = 0;
        Decimal high = 0;
        Decimal low = 0;
        Decimal close = 0;
        Decimal volume = 0;
        std::string source; // e.g. "sqlite", "csv", "coingecko-backtest"

        bool operator<(const PriceBar& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Derived per cycle from the trailing window, never persisted.
    // rsi/ema are confirmation inputs only, kept as doubles like any other oscillator value.
    struct Indicators {
        Decimal sma = 0;
        Decimal std_dev = 0;
        Decimal upper_band = 0;
        Decimal lower_band = 0;
        std::optional<Decimal> z_score; // Unset when std_dev == 0
        std::optional<double> rsi;
        std::optional<double> ema;
    };

    enum class SignalType {
        Buy,
        Sell,
        Hold
    };

    struct TradingSignal {
        SignalType type = SignalType::Hold;
        double strength = 0.0; // Confidence in [0, 1]
        Decimal price = 0;
        Timestamp timestamp;
        Indicators indicators; // Snapshot used to produce the signal
        std::string reason;
    };

    enum class PositionSide {
        Long,
        Short
    };

    enum class PositionStatus {
        Pending,
        Open,
        Closed
    };

    struct Position {
        std::string id;
        Decimal entry_price = 0;
        Timestamp entry_time;
        Decimal size = 0;
        PositionSide side = PositionSide::Long;
        std::optional<Decimal> stop_loss;
        std::optional<Decimal> take_profit;
        std::optional<Decimal> current_price;
        std::optional<Decimal> pnl;          // Defined only when current_price is set
        std::optional<Decimal> pnl_percent;  // Percent units: -10 means -10%
        PositionStatus status = PositionStatus::Pending;
        std::optional<Timestamp> exit_time;
    };

    enum class TradeSide {
        Buy,
        Sell
    };

    enum class TradeStatus {
        Pending,
        Success,
        Failed
    };

    // Append-only audit record of one execution attempt.
    struct Trade {
        std::string id;
        Timestamp timestamp;
        TradeSide side = TradeSide::Buy;
        Decimal price = 0;
        Decimal size = 0;
        Decimal fee = 0;
        TradeStatus status = TradeStatus::Pending;
        std::optional<std::string> error;
        std::string position_id; // Position opened or closed by this trade, empty if none
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    std::string toString(SignalType type);
    std::string toString(PositionSide side);
    std::string toString(PositionStatus status);
    std::string toString(TradeSide side);
    std::string toString(TradeStatus status);

    // Recomputes current_price, pnl and pnl_percent of an OPEN position. No-op otherwise.
    void markPosition(Position& position, const Decimal& price);

} // namespace core
