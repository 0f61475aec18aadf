// backtester/include/portfolio.hpp
#pragma once

#include <string>
#include <vector>
#include <optional>

#include "datatypes.hpp" // Provides core::Position, core::Trade, core::Decimal

namespace backtester {

    // --- Portfolio State Struct (for equity curve) ---
    struct PortfolioState {
        core::Timestamp timestamp;
        core::Decimal cash = 0;
        core::Decimal positions_value = 0; // Market value of all OPEN positions
        core::Decimal total_equity = 0;    // cash + positions_value
    };

    // --- Portfolio Class Definition ---
    // Simulated single-instrument ledger. Cash moves only through openLong and
    // closePosition, so at any time:
    //   cash == initial + sum(closed pnl) - sum(fees) - sum(open entry cost)
    class Portfolio {
    public:
        // Trade ids are <trade_id_prefix>_<millis>_<seq>
        Portfolio(const core::Decimal& initial_balance, const core::Decimal& fee_rate,
                  std::string trade_id_prefix = "backtest");

        // --- Getters ---
        const core::Decimal& getCash() const { return cash_; }
        const core::Decimal& getInitialBalance() const { return initial_balance_; }
        const core::Decimal& getTotalFees() const { return total_fees_; }
        const std::vector<core::Position>& getPositions() const { return positions_; }
        const std::vector<core::Trade>& getTradeLog() const { return trade_log_; }
        const std::vector<PortfolioState>& getEquityCurve() const { return equity_curve_; }

        // Copies of the OPEN positions, in opening order
        std::vector<core::Position> getOpenPositions() const;
        std::vector<core::Position> getClosedPositions() const;
        std::optional<std::string> firstOpenPositionId() const;

        // cash + mark-to-market value of OPEN positions (entry price when never marked)
        core::Decimal getTotalEquity() const;

        // --- Modifiers ---
        // Debits size*price plus fee and opens a LONG. When cash does not cover it,
        // a FAILED trade is logged and nothing else changes.
        std::optional<std::string> openLong(core::Timestamp timestamp,
                                            const core::Decimal& price,
                                            const core::Decimal& size,
                                            const std::optional<core::Decimal>& stop_loss,
                                            const std::optional<core::Decimal>& take_profit);

        // Credits size*price minus fee and fixes pnl at 'price'. Throws BacktestException
        // for an unknown id or a position that is not OPEN.
        const core::Position& closePosition(const std::string& position_id,
                                            core::Timestamp timestamp,
                                            const core::Decimal& price,
                                            const std::string& reason);

        // Refreshes current_price / pnl / pnl_percent on every OPEN position
        void markToMarket(const core::Decimal& price);

        // Records portfolio equity state at a specific timestamp
        void recordTimestampValue(core::Timestamp timestamp);

    private:
        core::Decimal initial_balance_;
        core::Decimal fee_rate_;
        std::string trade_id_prefix_;
        core::Decimal cash_;
        core::Decimal total_fees_ = 0;
        std::vector<core::Position> positions_;
        std::vector<core::Trade> trade_log_;
        std::vector<PortfolioState> equity_curve_;
        long long next_trade_seq_ = 1;
        long long next_position_seq_ = 1;

        std::string nextTradeId(core::Timestamp timestamp);
        core::Position* findPosition(const std::string& position_id);
    };

} // namespace backtester
