#include "backtester.hpp"
#include "portfolio.hpp"
#include "signal_engine.hpp"
#include "risk_manager.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace backtester {

    namespace dec = core::decimal;

    BacktestSimulator::BacktestSimulator(const core::EngineConfig& config)
        : config_(config)
    {
        core::validateConfig(config_);
        core::logging::getLogger()->debug("BacktestSimulator initialized with balance: {}",
                                          dec::toPlainString(config_.backtest.initial_balance));
    }

    BacktestResult BacktestSimulator::run(data::IPriceProvider& provider) const {
        auto logger = core::logging::getLogger();
        logger->info("Loading historical data for backtest...");

        core::TimeSeries<core::PriceBar> history = provider.getPriceHistory();
        if (!std::is_sorted(history.begin(), history.end())) {
            logger->warn("Price provider returned unordered bars, sorting by timestamp");
            std::stable_sort(history.begin(), history.end());
        }

        const auto& start = config_.backtest.start_time;
        const auto& end = config_.backtest.end_time;
        core::TimeSeries<core::PriceBar> bars;
        bars.reserve(history.size());
        for (const auto& bar : history) {
            if (start && bar.timestamp < *start) continue;
            if (end && bar.timestamp > *end) continue;
            bars.push_back(bar);
        }

        if (bars.empty()) {
            throw core::DataLoadException("No historical data available for the specified period");
        }
        logger->info("Loaded {} data points for backtesting", bars.size());
        return run(bars);
    }

    BacktestResult BacktestSimulator::run(const core::TimeSeries<core::PriceBar>& bars) const {
        auto logger = core::logging::getLogger();
        if (bars.empty()) {
            throw core::DataLoadException("No historical data available for the specified period");
        }

        logger->info("========================================================");
        logger->info("Starting Backtest Run");
        logger->info("========================================================");
        logger->info("Period: {} to {}, MA={}, multiplier={}, balance={}",
                     core::utils::timestampToString(bars.front().timestamp),
                     core::utils::timestampToString(bars.back().timestamp),
                     config_.strategy.ma_period,
                     dec::toPlainString(config_.strategy.std_dev_multiplier),
                     dec::toPlainString(config_.backtest.initial_balance));

        // Risk checks run on replay time, not wall-clock time
        core::Timestamp now = bars.front().timestamp;
        strategy_engine::SignalEngine engine(config_);
        risk::RiskManager risk_manager(config_.risk, [&now]() { return now; }, config_.strategy.size_precision);
        Portfolio portfolio(config_.backtest.initial_balance, config_.backtest.fee_rate);

        auto closeWithRiskTracking = [&](const std::string& position_id, const core::Decimal& price,
                                         const std::string& reason) {
            const core::Position& closed = portfolio.closePosition(position_id, now, price, reason);
            if (closed.pnl && *closed.pnl < 0) {
                risk_manager.updateDailyLoss(dec::abs(*closed.pnl));
            }
        };

        const size_t ma_period = static_cast<size_t>(config_.strategy.ma_period);
        const size_t max_window = ma_period * 2;
        core::TimeSeries<core::PriceBar> window;
        window.reserve(max_window + 1);

        for (size_t i = 0; i < bars.size(); ++i) {
            const core::PriceBar& bar = bars[i];
            now = bar.timestamp;

            // --- 1. Maintain trailing window ---
            window.push_back(bar);
            if (window.size() > max_window) {
                window.erase(window.begin(), window.begin() + (window.size() - max_window));
            }
            if (window.size() < ma_period) {
                continue;
            }

            // --- 2. Refresh open positions and evaluate exits ---
            portfolio.markToMarket(bar.close);
            for (const auto& position : portfolio.getOpenPositions()) {
                risk::ExitDecision exit = risk_manager.shouldClosePosition(position);
                if (exit.should_close) {
                    logger->info("Closing position {}: {}", position.id, exit.reason);
                    closeWithRiskTracking(position.id, bar.close, exit.reason);
                }
            }

            // --- 3. Signal, size, validate, execute ---
            std::optional<core::TradingSignal> signal = engine.analyze(window);
            if (signal && signal->type != core::SignalType::Hold) {
                core::Decimal size = engine.calculatePositionSize(*signal, portfolio.getCash(), signal->price);
                risk::TradeValidation validation = risk_manager.validateTrade(
                    *signal, size, portfolio.getTotalEquity(), portfolio.getOpenPositions());

                if (!validation.allowed) {
                    logger->debug("Trade rejected by risk manager: {}", validation.reason);
                } else {
                    core::Decimal final_size = validation.adjusted_size ? *validation.adjusted_size : size;
                    if (validation.adjusted_size) {
                        logger->debug("{}", validation.reason);
                    }

                    if (signal->type == core::SignalType::Buy) {
                        core::Decimal cost = final_size * signal->price;
                        if (portfolio.getCash() >= cost + cost * config_.backtest.fee_rate) {
                            strategy_engine::RiskLevels levels = engine.calculateRiskLevels(signal->price, signal->type);
                            portfolio.openLong(now, signal->price, final_size, levels.stop_loss, levels.take_profit);
                        } else {
                            logger->debug("Insufficient cash for BUY of {} at {}",
                                          dec::toPlainString(final_size), dec::toPlainString(signal->price));
                        }
                    } else if (std::optional<std::string> first_open = portfolio.firstOpenPositionId()) {
                        // Only the first OPEN position is targeted per SELL signal
                        closeWithRiskTracking(*first_open, signal->price, signal->reason);
                    }
                }
            }

            // --- 4. Track equity and drawdown ---
            risk_manager.updateDrawdown(portfolio.getTotalEquity());
            portfolio.recordTimestampValue(now);

            if (i % 100 == 0) {
                logger->info("Backtest progress: {:.1f}% - Balance: ${}",
                             100.0 * static_cast<double>(i) / static_cast<double>(bars.size()),
                             dec::toString(portfolio.getCash(), 2));
            }
        }

        // --- Close any remaining open positions at the final close ---
        const core::PriceBar& last = bars.back();
        now = last.timestamp;
        portfolio.markToMarket(last.close);
        for (const auto& position : portfolio.getOpenPositions()) {
            closeWithRiskTracking(position.id, last.close, "End of backtest");
        }
        risk_manager.updateDrawdown(portfolio.getTotalEquity());
        portfolio.recordTimestampValue(now);

        BacktestResult result;
        result.start_time = bars.front().timestamp;
        result.end_time = last.timestamp;
        result.instrument = config_.backtest.instrument;
        result.interval = config_.backtest.interval;
        result.bars_processed = static_cast<int>(bars.size());
        result.initial_balance = portfolio.getInitialBalance();
        result.final_balance = portfolio.getCash();
        result.total_fees = portfolio.getTotalFees();
        result.max_drawdown = risk_manager.getState().max_drawdown_observed;
        result.trades = portfolio.getTradeLog();
        result.positions = portfolio.getPositions();
        result.equity_curve = portfolio.getEquityCurve();
        computeStatistics(result, portfolio.getClosedPositions());

        logger->info("Backtest completed! finalBalance={} totalReturn={}% totalTrades={} winRate={}%",
                     dec::toString(result.final_balance, 2), dec::toString(result.total_return_percent, 2),
                     result.total_trades, dec::toString(result.win_rate, 1));
        return result;
    }

} // namespace backtester
