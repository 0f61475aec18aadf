#include "backtest_result.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <chrono>

namespace backtester {

    namespace dec = core::decimal;
    using core::Decimal;

    core::Decimal sharpeRatio(const std::vector<core::Position>& closed_positions) {
        std::vector<Decimal> returns;
        for (const auto& p : closed_positions) {
            if (p.pnl_percent) returns.push_back(*p.pnl_percent / 100);
        }
        if (returns.size() < 2) {
            return Decimal(0);
        }

        Decimal sum = 0;
        for (const auto& r : returns) sum += r;
        Decimal mean = sum / Decimal(static_cast<long long>(returns.size()));

        Decimal sq_sum = 0;
        for (const auto& r : returns) {
            Decimal diff = r - mean;
            sq_sum += diff * diff;
        }
        Decimal std_dev = dec::sqrt(sq_sum / Decimal(static_cast<long long>(returns.size())));
        return std_dev > 0 ? mean / std_dev : Decimal(0);
    }

    void computeStatistics(BacktestResult& result, const std::vector<core::Position>& closed_positions) {
        Decimal gross_profit = 0;
        Decimal gross_loss = 0; // Absolute
        int winners = 0;
        int losers = 0;

        for (const auto& p : closed_positions) {
            if (!p.pnl) continue;
            if (*p.pnl > 0) {
                ++winners;
                gross_profit += *p.pnl;
            } else if (*p.pnl < 0) {
                ++losers;
                gross_loss += dec::abs(*p.pnl);
            }
        }

        result.total_trades = static_cast<int>(closed_positions.size());
        result.winning_trades = winners;
        result.losing_trades = losers;
        result.total_return = result.final_balance - result.initial_balance;
        result.total_return_percent = result.initial_balance > 0
            ? result.total_return / result.initial_balance * 100
            : Decimal(0);
        result.win_rate = result.total_trades > 0
            ? Decimal(winners) / Decimal(result.total_trades) * 100
            : Decimal(0);
        result.average_win = winners > 0 ? gross_profit / Decimal(winners) : Decimal(0);
        result.average_loss = losers > 0 ? gross_loss / Decimal(losers) : Decimal(0);
        result.profit_factor = result.average_loss > 0 ? result.average_win / result.average_loss : Decimal(0);
        result.sharpe_ratio = sharpeRatio(closed_positions);
    }

    void BacktestResult::logMetrics() const {
        core::logging::metric("--- Backtest Metrics ---");
        core::logging::metric("Final Balance: {} (initial {})", dec::toString(final_balance, 2), dec::toString(initial_balance, 2));
        core::logging::metric("Total Return: {} ({}%)", dec::toString(total_return, 2), dec::toString(total_return_percent, 2));
        core::logging::metric("Max Drawdown: {}%", dec::toString(max_drawdown * 100, 2));
        core::logging::metric("Trades: {} (won {}, lost {})", total_trades, winning_trades, losing_trades);
        core::logging::metric("Win Rate: {}%", dec::toString(win_rate, 1));
        core::logging::metric("Avg Win: {}  Avg Loss: {}", dec::toString(average_win, 2), dec::toString(average_loss, 2));
        core::logging::metric("Profit Factor: {}", dec::toString(profit_factor, 2));
        core::logging::metric("Sharpe Ratio: {}", dec::toString(sharpe_ratio, 2));
        core::logging::metric("Total Fees: {}", dec::toString(total_fees, 2));
        core::logging::metric("------------------------");
    }

    std::string BacktestResult::generateReport() const {
        auto days = std::chrono::duration_cast<std::chrono::hours>(end_time - start_time).count() / 24.0;

        Decimal best = 0;
        Decimal worst = 0;
        for (const auto& p : positions) {
            if (p.status != core::PositionStatus::Closed || !p.pnl) continue;
            best = dec::max(best, *p.pnl);
            worst = dec::min(worst, *p.pnl);
        }

        std::string report;
        report += "=================================================\n";
        report += "           BACKTEST RESULTS REPORT\n";
        report += "=================================================\n\n";
        report += fmt::format("Period: {} to {} ({:.0f} days, {} bars)\n",
                              core::utils::timestampToString(start_time),
                              core::utils::timestampToString(end_time), days, bars_processed);
        report += fmt::format("Instrument: {} ({})\n", instrument, interval);
        report += "Strategy: Mean Reversion\n\n";

        report += "PERFORMANCE SUMMARY:\n";
        report += fmt::format("  Initial Balance:  ${}\n", dec::toString(initial_balance, 2));
        report += fmt::format("  Final Balance:    ${}\n", dec::toString(final_balance, 2));
        report += fmt::format("  Total Return:     ${}\n", dec::toString(total_return, 2));
        report += fmt::format("  Return %:         {}%\n", dec::toString(total_return_percent, 2));
        report += fmt::format("  Max Drawdown:     {}%\n", dec::toString(max_drawdown * 100, 2));
        report += fmt::format("  Sharpe Ratio:     {}\n\n", dec::toString(sharpe_ratio, 2));

        report += "TRADING STATISTICS:\n";
        report += fmt::format("  Total Trades:     {}\n", total_trades);
        report += fmt::format("  Winning Trades:   {}\n", winning_trades);
        report += fmt::format("  Losing Trades:    {}\n", losing_trades);
        report += fmt::format("  Win Rate:         {}%\n", dec::toString(win_rate, 1));
        report += fmt::format("  Average Win:      ${}\n", dec::toString(average_win, 2));
        report += fmt::format("  Average Loss:     ${}\n", dec::toString(average_loss, 2));
        report += fmt::format("  Profit Factor:    {}\n", dec::toString(profit_factor, 2));
        report += fmt::format("  Best Trade:       ${}\n", dec::toString(best, 2));
        report += fmt::format("  Worst Trade:      ${}\n", dec::toString(worst, 2));
        report += fmt::format("  Total Fees:       ${}\n", dec::toString(total_fees, 2));
        report += "=================================================\n";
        return report;
    }

} // namespace backtester
