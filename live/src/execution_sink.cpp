#include "execution_sink.hpp"
#include "logging.hpp"
#include <cstddef>

namespace live {

    namespace dec = core::decimal;

    PaperExecutionSink::PaperExecutionSink(const core::Decimal& starting_balance, const core::Decimal& fee_rate)
        : portfolio_(starting_balance, fee_rate, "paper")
    {
        core::logging::getLogger()->info("Paper execution sink ready with balance {}", dec::toString(starting_balance, 2));
    }

    std::optional<core::Trade> PaperExecutionSink::executeTrade(const core::TradingSignal& signal,
                                                                const core::Decimal& size) {
        auto logger = core::logging::getLogger();
        switch (signal.type) {
            case core::SignalType::Buy: {
                size_t before = portfolio_.getTradeLog().size();
                std::optional<std::string> position_id =
                    portfolio_.openLong(signal.timestamp, signal.price, size, std::nullopt, std::nullopt);
                if (!position_id && portfolio_.getTradeLog().size() == before) {
                    // Non-positive size or price, nothing recorded
                    return std::nullopt;
                }
                const core::Trade& trade = portfolio_.getTradeLog().back();
                core::logging::trade("[PAPER] {} {} at {} status={}", core::toString(trade.side),
                                     dec::toPlainString(trade.size), dec::toPlainString(trade.price),
                                     core::toString(trade.status));
                return trade;
            }
            case core::SignalType::Sell: {
                std::optional<std::string> first_open = portfolio_.firstOpenPositionId();
                if (!first_open) {
                    logger->info("[PAPER] SELL signal with no open position, nothing to close");
                    return std::nullopt;
                }
                return closePosition(*first_open, signal.price, signal.timestamp, signal.reason);
            }
            case core::SignalType::Hold:
                break;
        }
        return std::nullopt;
    }

    std::optional<core::Trade> PaperExecutionSink::closePosition(const std::string& position_id,
                                                                 const core::Decimal& price,
                                                                 core::Timestamp timestamp,
                                                                 const std::string& reason) {
        // Throws BacktestException for unknown or already closed positions
        const core::Position& closed = portfolio_.closePosition(position_id, timestamp, price, reason);
        core::logging::getLogger()->info("[PAPER] Position {} closed, pnl={} ({}%)", closed.id,
                                         dec::toString(*closed.pnl, 2), dec::toString(*closed.pnl_percent, 2));
        return portfolio_.getTradeLog().back();
    }

    void PaperExecutionSink::markToMarket(const core::Decimal& price) {
        portfolio_.markToMarket(price);
    }

    std::vector<core::Position> PaperExecutionSink::getOpenPositions() const {
        return portfolio_.getOpenPositions();
    }

    std::optional<core::Position> PaperExecutionSink::findPosition(const std::string& position_id) const {
        for (const auto& p : portfolio_.getPositions()) {
            if (p.id == position_id) return p;
        }
        return std::nullopt;
    }

    core::Decimal PaperExecutionSink::getAccountBalance() const {
        return portfolio_.getTotalEquity();
    }

    PortfolioStats PaperExecutionSink::getPortfolioStats() const {
        PortfolioStats stats;
        for (const auto& p : portfolio_.getClosedPositions()) {
            if (!p.pnl) continue;
            ++stats.total_trades;
            if (*p.pnl > 0) ++stats.winning_trades;
            if (*p.pnl < 0) ++stats.losing_trades;
            stats.total_pnl += *p.pnl;
        }
        if (stats.total_trades > 0) {
            stats.average_pnl = stats.total_pnl / stats.total_trades;
            stats.win_rate = 100.0 * stats.winning_trades / stats.total_trades;
        }
        return stats;
    }

    std::vector<core::Trade> PaperExecutionSink::getTradeHistory(size_t limit) const {
        const auto& log = portfolio_.getTradeLog();
        if (limit == 0 || limit >= log.size()) {
            return log;
        }
        return std::vector<core::Trade>(log.end() - static_cast<std::ptrdiff_t>(limit), log.end());
    }

} // namespace live
