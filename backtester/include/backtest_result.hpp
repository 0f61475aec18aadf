#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp"
#include "portfolio.hpp"

namespace backtester {

    // Aggregate snapshot of one simulation run. Read-only once computed.
    struct BacktestResult {
        core::Timestamp start_time;
        core::Timestamp end_time;
        std::string instrument;
        std::string interval;
        int bars_processed = 0;

        core::Decimal initial_balance = 0;
        core::Decimal final_balance = 0;
        core::Decimal total_return = 0;
        core::Decimal total_return_percent = 0;
        core::Decimal total_fees = 0;

        int total_trades = 0;   // Closed positions
        int winning_trades = 0;
        int losing_trades = 0;
        core::Decimal win_rate = 0;       // Percent
        core::Decimal average_win = 0;
        core::Decimal average_loss = 0;   // Absolute value
        core::Decimal profit_factor = 0;  // average_win / average_loss, 0 without losers
        core::Decimal sharpe_ratio = 0;   // Per-trade, not annualized
        core::Decimal max_drawdown = 0;   // Fraction of peak equity

        std::vector<core::Trade> trades;
        std::vector<core::Position> positions;
        std::vector<PortfolioState> equity_curve;

        // Helper method to log calculated metrics
        void logMetrics() const;

        // Human-readable summary block
        std::string generateReport() const;
    };

    // Fills the statistics of 'result' from the closed positions of a finished run.
    void computeStatistics(BacktestResult& result, const std::vector<core::Position>& closed_positions);

    // mean / population stdev of the per-trade fractional returns; 0 below two trades.
    core::Decimal sharpeRatio(const std::vector<core::Position>& closed_positions);

} // namespace backtester
