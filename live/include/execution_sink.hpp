#pragma once

#include "datatypes.hpp"
#include "portfolio.hpp"
#include <optional>
#include <string>
#include <vector>

namespace live {

    struct PortfolioStats {
        int total_trades = 0;   // Closed positions with a pnl
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;  // Percent
        core::Decimal total_pnl = 0;
        core::Decimal average_pnl = 0;
    };

    // Where approved trades go. Implementations own the position book.
    class IExecutionSink {
    public:
        virtual ~IExecutionSink() = default;

        // BUY opens a LONG, SELL closes the first OPEN position.
        // Empty when nothing was attempted (e.g. SELL with no open position).
        virtual std::optional<core::Trade> executeTrade(const core::TradingSignal& signal,
                                                        const core::Decimal& size) = 0;

        // Closes one specific position, used by exits and shutdown.
        virtual std::optional<core::Trade> closePosition(const std::string& position_id,
                                                         const core::Decimal& price,
                                                         core::Timestamp timestamp,
                                                         const std::string& reason) = 0;

        // Refreshes current_price and pnl of every OPEN position
        virtual void markToMarket(const core::Decimal& price) = 0;

        virtual std::vector<core::Position> getOpenPositions() const = 0;
        virtual std::optional<core::Position> findPosition(const std::string& position_id) const = 0;

        // Cash plus marked value of open positions
        virtual core::Decimal getAccountBalance() const = 0;
    };

    // Simulated fills at the signal price with the configured fee.
    class PaperExecutionSink : public IExecutionSink {
    public:
        PaperExecutionSink(const core::Decimal& starting_balance, const core::Decimal& fee_rate);

        std::optional<core::Trade> executeTrade(const core::TradingSignal& signal,
                                                const core::Decimal& size) override;
        std::optional<core::Trade> closePosition(const std::string& position_id,
                                                 const core::Decimal& price,
                                                 core::Timestamp timestamp,
                                                 const std::string& reason) override;
        void markToMarket(const core::Decimal& price) override;

        std::vector<core::Position> getOpenPositions() const override;
        std::optional<core::Position> findPosition(const std::string& position_id) const override;
        core::Decimal getAccountBalance() const override;

        PortfolioStats getPortfolioStats() const;
        const std::vector<core::Position>& getAllPositions() const { return portfolio_.getPositions(); }

        // Most recent 'limit' trades, all when limit is 0
        std::vector<core::Trade> getTradeHistory(size_t limit = 0) const;

    private:
        backtester::Portfolio portfolio_;
    };

} // namespace live
