#include "datatypes.hpp"

namespace core {

    std::string toString(SignalType type) {
        switch (type) {
            case SignalType::Buy:  return "BUY";
            case SignalType::Sell: return "SELL";
            case SignalType::Hold: return "HOLD";
        }
        return "UNKNOWN";
    }

    std::string toString(PositionSide side) {
        return side == PositionSide::Long ? "LONG" : "SHORT";
    }

    std::string toString(PositionStatus status) {
        switch (status) {
            case PositionStatus::Pending: return "PENDING";
            case PositionStatus::Open:    return "OPEN";
            case PositionStatus::Closed:  return "CLOSED";
        }
        return "UNKNOWN";
    }

    std::string toString(TradeSide side) {
        return side == TradeSide::Buy ? "BUY" : "SELL";
    }

    std::string toString(TradeStatus status) {
        switch (status) {
            case TradeStatus::Pending: return "PENDING";
            case TradeStatus::Success: return "SUCCESS";
            case TradeStatus::Failed:  return "FAILED";
        }
        return "UNKNOWN";
    }

    void markPosition(Position& position, const Decimal& price) {
        if (position.status != PositionStatus::Open) {
            return; // Closed positions keep the values fixed at close
        }
        position.current_price = price;

        Decimal entry_value = position.entry_price * position.size;
        Decimal current_value = price * position.size;
        Decimal pnl = (position.side == PositionSide::Long)
            ? current_value - entry_value
            : entry_value - current_value;
        position.pnl = pnl;
        position.pnl_percent = (entry_value != 0) ? Decimal(pnl / entry_value * 100) : Decimal(0);
    }

} // namespace core
