#include "trading_cycle.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>

namespace live {

    namespace dec = core::decimal;

    TradingCycle::TradingCycle(const core::EngineConfig& config,
                               data::IPriceProvider& provider,
                               IExecutionSink& sink,
                               IMetricsSink* metrics,
                               risk::Clock clock)
        : config_(config),
          provider_(provider),
          sink_(sink),
          metrics_(metrics),
          clock_(std::move(clock)),
          engine_(config),
          risk_manager_(config.risk, clock_, config.strategy.size_precision),
          deduplicator_(config.trading.duplicate_signal_window)
    {
        core::validateConfig(config_);
        auto logger = core::logging::getLogger();
        logger->info("Trading cycle ready: tradingEnabled={}, paperTrading={}, MA={}, multiplier={}",
                     config_.trading.trading_enabled, config_.trading.paper_trading,
                     config_.strategy.ma_period, dec::toPlainString(config_.strategy.std_dev_multiplier));
    }

    core::Timestamp TradingCycle::now() const {
        return clock_ ? clock_() : std::chrono::system_clock::now();
    }

    bool TradingCycle::runOnce() {
        auto logger = core::logging::getLogger();
        try {
            logger->debug("Running trading cycle...");

            core::TimeSeries<core::PriceBar> history = provider_.getPriceHistory();
            const size_t ma_period = static_cast<size_t>(config_.strategy.ma_period);
            if (history.size() < ma_period) {
                logger->debug("Insufficient price history for analysis ({} < {})", history.size(), ma_period);
                return true;
            }

            const size_t window_size = std::min(history.size(), ma_period * 2);
            core::TimeSeries<core::PriceBar> window(history.end() - static_cast<std::ptrdiff_t>(window_size),
                                                    history.end());
            const core::Decimal current_price = window.back().close;

            std::optional<core::TradingSignal> signal = engine_.analyze(window);
            if (signal) {
                publishSignal(*signal);
                handleSignal(*signal);
            } else {
                logger->debug("No trading signal generated");
            }

            managePositions(current_price);

            risk_manager_.updateDrawdown(sink_.getAccountBalance());
            publishRiskMetrics();
            ++completed_cycles_;
            return true;
        } catch (const std::exception& e) {
            logger->error("Trading cycle error: {}", e.what());
            return false;
        }
    }

    void TradingCycle::handleSignal(const core::TradingSignal& signal) {
        auto logger = core::logging::getLogger();
        if (signal.type == core::SignalType::Hold) {
            return;
        }
        if (!deduplicator_.shouldAct(signal)) {
            logger->debug("Ignoring duplicate {} signal", core::toString(signal.type));
            return;
        }

        const core::Decimal balance = sink_.getAccountBalance();
        const core::Decimal position_size = engine_.calculatePositionSize(signal, balance, signal.price);
        risk::TradeValidation validation =
            risk_manager_.validateTrade(signal, position_size, balance, sink_.getOpenPositions());
        if (!validation.allowed) {
            logger->warn("Trade rejected by risk manager: {}", validation.reason);
            return;
        }

        const core::Decimal final_size = validation.adjusted_size ? *validation.adjusted_size : position_size;
        if (!config_.trading.trading_enabled) {
            logger->info("[SIMULATION] Would {} {} at {}", core::toString(signal.type),
                         dec::toString(final_size, 4), dec::toString(signal.price, 2));
            return;
        }

        logger->info("Executing {} trade for {}", core::toString(signal.type), dec::toString(final_size, 4));
        std::optional<core::Trade> trade = sink_.executeTrade(signal, final_size);
        if (!trade) {
            logger->info("No trade executed for {} signal", core::toString(signal.type));
            return;
        }
        publishTrade(*trade);
        if (trade->status != core::TradeStatus::Success) {
            logger->error("Trade execution failed: {}", trade->error.value_or("unknown error"));
            return;
        }
        trackRealizedLoss(*trade);
    }

    void TradingCycle::managePositions(const core::Decimal& current_price) {
        auto logger = core::logging::getLogger();
        sink_.markToMarket(current_price);

        for (const auto& position : sink_.getOpenPositions()) {
            risk::ExitDecision exit = risk_manager_.shouldClosePosition(position);
            if (!exit.should_close) {
                logger->debug("Position {} pnl={} ({}%)", position.id,
                              dec::toString(position.pnl.value_or(0), 2),
                              dec::toString(position.pnl_percent.value_or(0), 2));
                continue;
            }

            logger->info("Closing position {}: {}", position.id, exit.reason);
            std::optional<core::Trade> trade = sink_.closePosition(position.id, current_price, now(), exit.reason);
            if (trade) {
                publishTrade(*trade);
                trackRealizedLoss(*trade);
            }
        }
    }

    void TradingCycle::trackRealizedLoss(const core::Trade& trade) {
        if (trade.side != core::TradeSide::Sell || trade.position_id.empty()) {
            return;
        }
        std::optional<core::Position> closed = sink_.findPosition(trade.position_id);
        if (closed && closed->pnl && *closed->pnl < 0) {
            risk_manager_.updateDailyLoss(dec::abs(*closed->pnl));
        }
    }

    int TradingCycle::shutdown() {
        auto logger = core::logging::getLogger();
        std::vector<core::Position> open = sink_.getOpenPositions();
        logger->info("Shutting down trading cycle, closing {} open position(s)", open.size());

        std::optional<core::Decimal> market_price;
        try {
            market_price = provider_.getCurrentPrice();
        } catch (const core::DataLoadException& e) {
            logger->warn("No current price for shutdown, using last marked prices: {}", e.what());
        }

        int closed = 0;
        for (const auto& position : open) {
            core::Decimal price = market_price ? *market_price
                                               : position.current_price.value_or(position.entry_price);
            try {
                std::optional<core::Trade> trade = sink_.closePosition(position.id, price, now(), "Shutdown");
                if (trade) {
                    publishTrade(*trade);
                    trackRealizedLoss(*trade);
                    ++closed;
                }
            } catch (const core::TradingPlatformException& e) {
                logger->error("Failed to close position {} on shutdown: {}", position.id, e.what());
            }
        }
        return closed;
    }

    void TradingCycle::publishSignal(const core::TradingSignal& signal) {
        if (!metrics_) return;
        try {
            metrics_->onSignal(signal);
        } catch (const std::exception& e) {
            core::logging::getLogger()->warn("Metrics sink failed on signal: {}", e.what());
        }
    }

    void TradingCycle::publishTrade(const core::Trade& trade) {
        if (!metrics_) return;
        try {
            metrics_->onTrade(trade);
        } catch (const std::exception& e) {
            core::logging::getLogger()->warn("Metrics sink failed on trade: {}", e.what());
        }
    }

    void TradingCycle::publishRiskMetrics() {
        if (!metrics_) return;
        try {
            metrics_->onRiskMetrics(risk_manager_.getRiskMetrics());
        } catch (const std::exception& e) {
            core::logging::getLogger()->warn("Metrics sink failed on risk metrics: {}", e.what());
        }
    }

} // namespace live
