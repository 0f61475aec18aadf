#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept> // For invalid_argument

namespace backtester {

    namespace dec = core::decimal;

    Portfolio::Portfolio(const core::Decimal& initial_balance, const core::Decimal& fee_rate,
                         std::string trade_id_prefix)
        : initial_balance_(initial_balance), fee_rate_(fee_rate),
          trade_id_prefix_(std::move(trade_id_prefix)), cash_(initial_balance) {
        if (initial_balance <= 0) {
            throw std::invalid_argument("Initial balance must be positive.");
        }
        if (fee_rate < 0 || fee_rate >= 1) {
            throw std::invalid_argument("Fee rate must be in [0, 1).");
        }
    }

    std::vector<core::Position> Portfolio::getOpenPositions() const {
        std::vector<core::Position> open;
        for (const auto& p : positions_) {
            if (p.status == core::PositionStatus::Open) open.push_back(p);
        }
        return open;
    }

    std::vector<core::Position> Portfolio::getClosedPositions() const {
        std::vector<core::Position> closed;
        for (const auto& p : positions_) {
            if (p.status == core::PositionStatus::Closed) closed.push_back(p);
        }
        return closed;
    }

    std::optional<std::string> Portfolio::firstOpenPositionId() const {
        for (const auto& p : positions_) {
            if (p.status == core::PositionStatus::Open) return p.id;
        }
        return std::nullopt;
    }

    core::Decimal Portfolio::getTotalEquity() const {
        core::Decimal positions_value = 0;
        for (const auto& p : positions_) {
            if (p.status != core::PositionStatus::Open) continue;
            positions_value += p.size * (p.current_price ? *p.current_price : p.entry_price);
        }
        return cash_ + positions_value;
    }

    std::string Portfolio::nextTradeId(core::Timestamp timestamp) {
        return fmt::format("{}_{}_{}", trade_id_prefix_, core::utils::toUnixMillis(timestamp), next_trade_seq_++);
    }

    core::Position* Portfolio::findPosition(const std::string& position_id) {
        for (auto& p : positions_) {
            if (p.id == position_id) return &p;
        }
        return nullptr;
    }

    std::optional<std::string> Portfolio::openLong(core::Timestamp timestamp,
                                                   const core::Decimal& price,
                                                   const core::Decimal& size,
                                                   const std::optional<core::Decimal>& stop_loss,
                                                   const std::optional<core::Decimal>& take_profit) {
        auto logger = core::logging::getLogger();
        if (size <= 0 || price <= 0) {
            logger->warn("Attempted to open position with non-positive size ({}) or price ({})",
                         dec::toPlainString(size), dec::toPlainString(price));
            return std::nullopt;
        }

        core::Decimal cost = size * price;
        core::Decimal fee = cost * fee_rate_;

        core::Trade trade;
        trade.id = nextTradeId(timestamp);
        trade.timestamp = timestamp;
        trade.side = core::TradeSide::Buy;
        trade.price = price;
        trade.size = size;
        trade.fee = fee;

        if (cash_ < cost + fee) {
            trade.status = core::TradeStatus::Failed;
            trade.fee = 0;
            trade.error = fmt::format("Insufficient cash: have {}, need {}",
                                      dec::toString(cash_, 2), dec::toString(cost + fee, 2));
            logger->warn("BUY {} rejected by ledger: {}", trade.id, *trade.error);
            trade_log_.push_back(trade);
            return std::nullopt;
        }

        cash_ -= cost + fee;
        total_fees_ += fee;

        core::Position position;
        position.id = fmt::format("pos_{}_{}", core::utils::toUnixMillis(timestamp), next_position_seq_++);
        position.entry_price = price;
        position.entry_time = timestamp;
        position.size = size;
        position.side = core::PositionSide::Long;
        position.stop_loss = stop_loss;
        position.take_profit = take_profit;
        position.status = core::PositionStatus::Open;
        core::markPosition(position, price);

        trade.status = core::TradeStatus::Success;
        trade.position_id = position.id;
        trade_log_.push_back(trade);
        positions_.push_back(position);

        core::logging::trade("BUY executed: Time={}, Id={}, Size={}, Price={}, Fee={}, NewCash={}",
                             core::utils::timestampToString(timestamp), trade.id,
                             dec::toPlainString(size), dec::toPlainString(price),
                             dec::toString(fee, 4), dec::toString(cash_, 2));
        return position.id;
    }

    const core::Position& Portfolio::closePosition(const std::string& position_id,
                                                   core::Timestamp timestamp,
                                                   const core::Decimal& price,
                                                   const std::string& reason) {
        core::Position* position = findPosition(position_id);
        if (!position) {
            throw core::BacktestException(fmt::format("Unknown position id: {}", position_id));
        }
        if (position->status != core::PositionStatus::Open) {
            throw core::BacktestException(fmt::format("Position {} is not open", position_id));
        }

        core::Decimal proceeds = position->size * price;
        core::Decimal fee = proceeds * fee_rate_;

        cash_ += proceeds - fee;
        total_fees_ += fee;

        // pnl is fixed at the exit price and never recomputed afterwards
        core::markPosition(*position, price);
        position->status = core::PositionStatus::Closed;
        position->exit_time = timestamp;

        core::Trade trade;
        trade.id = nextTradeId(timestamp);
        trade.timestamp = timestamp;
        trade.side = core::TradeSide::Sell;
        trade.price = price;
        trade.size = position->size;
        trade.fee = fee;
        trade.status = core::TradeStatus::Success;
        trade.position_id = position->id;
        trade_log_.push_back(trade);

        core::logging::trade("SELL executed: Time={}, Id={}, Position={}, Price={}, PnL={} ({}%), Reason='{}', NewCash={}",
                             core::utils::timestampToString(timestamp), trade.id, position->id,
                             dec::toPlainString(price), dec::toString(*position->pnl, 2),
                             dec::toString(*position->pnl_percent, 2), reason, dec::toString(cash_, 2));
        return *position;
    }

    void Portfolio::markToMarket(const core::Decimal& price) {
        for (auto& p : positions_) {
            core::markPosition(p, price);
        }
    }

    // Records the portfolio state at a specific timestamp
    void Portfolio::recordTimestampValue(core::Timestamp timestamp) {
        // Avoid duplicate entries for the same timestamp
        if (!equity_curve_.empty() && equity_curve_.back().timestamp == timestamp) {
            equity_curve_.pop_back();
        }
        PortfolioState state;
        state.timestamp = timestamp;
        state.cash = cash_;
        state.total_equity = getTotalEquity();
        state.positions_value = state.total_equity - cash_;
        equity_curve_.push_back(state);
    }

} // namespace backtester
