#include "risk_manager.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h> // fmt::join
#include <stdexcept>

namespace risk {

    using core::Decimal;
    namespace dec = core::decimal;

    RiskManager::RiskManager(const core::RiskParams& params, Clock clock, int size_precision)
        : params_(params), clock_(std::move(clock)), size_precision_(size_precision)
    {
        if (params_.max_open_positions < 1) {
            throw std::invalid_argument("max_open_positions must be at least 1.");
        }
        if (size_precision_ < 0 || size_precision_ > 18) {
            throw std::invalid_argument("size_precision must be between 0 and 18.");
        }
    }

    core::Timestamp RiskManager::now() const {
        return clock_ ? clock_() : std::chrono::system_clock::now();
    }

    TradeValidation RiskManager::validateTrade(const core::TradingSignal& signal,
                                               const Decimal& proposed_size,
                                               const Decimal& current_balance,
                                               const std::vector<core::Position>& open_positions) {
        TradeValidation result;

        int open_count = 0;
        for (const auto& p : open_positions) {
            if (p.status == core::PositionStatus::Open) ++open_count;
        }
        if (open_count >= params_.max_open_positions) {
            result.reason = fmt::format("Maximum open positions ({}) reached", params_.max_open_positions);
            return result;
        }

        if (isDailyLossLimitExceeded()) {
            result.reason = fmt::format("Daily loss limit ({}) exceeded", dec::toString(params_.max_daily_loss, 2));
            return result;
        }

        if (isDrawdownLimitExceeded(current_balance)) {
            result.reason = fmt::format("Maximum drawdown ({}%) exceeded", dec::toString(params_.max_drawdown * 100, 1));
            return result;
        }

        if (signal.price <= 0 || proposed_size <= 0) {
            result.reason = "Proposed trade has no size or price";
            return result;
        }

        std::vector<std::string> adjustments;
        Decimal size = proposed_size;

        // Exposure cap: shrink to the remaining headroom, reject when there is none
        Decimal current_exposure = calculateTotalExposure(open_positions);
        Decimal max_exposure = current_balance * params_.max_exposure_fraction;
        if (current_exposure + size * signal.price > max_exposure) {
            Decimal headroom = max_exposure - current_exposure;
            if (headroom <= 0) {
                result.reason = "Maximum exposure limit reached";
                return result;
            }
            Decimal fitted = dec::quantizeDown(headroom / signal.price, size_precision_);
            adjustments.push_back(fmt::format("Position size adjusted from {} to {} due to exposure limits",
                                              dec::toString(size, 4), dec::toString(fitted, 4)));
            size = fitted;
        }

        Decimal risk_amount = current_balance * params_.risk_per_trade;
        Decimal stop_loss_distance = signal.price * params_.risk_stop_percent;
        Decimal risk_based_size = risk_amount / stop_loss_distance;
        Decimal capped = dec::quantizeDown(dec::min(size, dec::min(risk_based_size, params_.max_position_size)),
                                           size_precision_);
        if (capped < size) {
            adjustments.push_back(fmt::format("Position size capped from {} to {} for risk management",
                                              dec::toString(size, 4), dec::toString(capped, 4)));
            size = capped;
        }

        Decimal position_value = size * signal.price;
        if (position_value < params_.min_position_value) {
            result.reason = fmt::format("Position value ({}) below minimum ({})",
                                        dec::toString(position_value, 2), dec::toPlainString(params_.min_position_value));
            return result;
        }

        if (signal.strength < params_.min_signal_strength) {
            result.reason = fmt::format("Signal strength ({:.2f}) too weak (minimum: {})",
                                        signal.strength, params_.min_signal_strength);
            return result;
        }

        result.allowed = true;
        if (size != proposed_size) {
            result.adjusted_size = size;
            result.reason = fmt::format("{}", fmt::join(adjustments, "; "));
        }
        return result;
    }

    Decimal RiskManager::calculateTotalExposure(const std::vector<core::Position>& positions) {
        Decimal total = 0;
        for (const auto& p : positions) {
            if (p.status != core::PositionStatus::Open) continue;
            total += p.size * (p.current_price ? *p.current_price : p.entry_price);
        }
        return total;
    }

    void RiskManager::rollDailyLossIfNewDay() {
        core::Timestamp day_start = core::utils::localDayStart(now());
        if (state_.daily_loss_reset_at < day_start) {
            if (state_.daily_loss != 0) {
                core::logging::getLogger()->info("Daily loss counter reset");
            }
            state_.daily_loss = 0;
            state_.daily_loss_reset_at = day_start;
        }
    }

    void RiskManager::updateDailyLoss(const Decimal& loss) {
        rollDailyLossIfNewDay();
        state_.daily_loss += loss;
        core::logging::metric("Daily loss updated: dailyLoss={} limit={}",
                              dec::toString(state_.daily_loss, 2), dec::toString(params_.max_daily_loss, 2));
    }

    bool RiskManager::isDailyLossLimitExceeded() {
        rollDailyLossIfNewDay();
        return state_.daily_loss > params_.max_daily_loss;
    }

    void RiskManager::updateDrawdown(const Decimal& current_balance) {
        if (current_balance > state_.peak_balance) {
            state_.peak_balance = current_balance;
        }

        if (state_.peak_balance > 0) {
            Decimal drawdown = (state_.peak_balance - current_balance) / state_.peak_balance;
            if (drawdown <= state_.max_drawdown_observed) {
                return;
            }
            state_.max_drawdown_observed = drawdown;

            // Logged once per new worst drawdown
            if (drawdown > Decimal("0.05")) {
                core::logging::getLogger()->warn("Significant drawdown detected: current={}% max={}% peak={} balance={}",
                                                 dec::toString(drawdown * 100, 2),
                                                 dec::toString(state_.max_drawdown_observed * 100, 2),
                                                 dec::toString(state_.peak_balance, 2),
                                                 dec::toString(current_balance, 2));
            }
        }
    }

    bool RiskManager::isDrawdownLimitExceeded(const Decimal& current_balance) {
        if (state_.peak_balance == 0) {
            state_.peak_balance = current_balance;
            return false;
        }
        Decimal current_drawdown = (state_.peak_balance - current_balance) / state_.peak_balance;
        return current_drawdown > params_.max_drawdown;
    }

    Decimal RiskManager::calculateStopLoss(const Decimal& entry_price, core::PositionSide side,
                                           const std::optional<Decimal>& atr) const {
        Decimal stop_distance = atr ? *atr * 2 : entry_price * params_.risk_stop_percent;
        return side == core::PositionSide::Long ? entry_price - stop_distance : entry_price + stop_distance;
    }

    Decimal RiskManager::calculateTakeProfit(const Decimal& entry_price, core::PositionSide side,
                                             const std::optional<Decimal>& risk_reward_ratio) const {
        Decimal ratio = risk_reward_ratio ? *risk_reward_ratio : params_.risk_reward_ratio;
        Decimal profit_target = entry_price * params_.risk_stop_percent * ratio;
        return side == core::PositionSide::Long ? entry_price + profit_target : entry_price - profit_target;
    }

    ExitDecision RiskManager::shouldClosePosition(const core::Position& position) const {
        ExitDecision decision;
        if (position.status != core::PositionStatus::Open || !position.current_price) {
            return decision;
        }
        const Decimal& price = *position.current_price;
        bool is_long = position.side == core::PositionSide::Long;

        if (position.stop_loss) {
            if ((is_long && price <= *position.stop_loss) || (!is_long && price >= *position.stop_loss)) {
                decision.should_close = true;
                decision.reason = "Stop loss triggered";
                return decision;
            }
        }

        if (position.take_profit) {
            if ((is_long && price >= *position.take_profit) || (!is_long && price <= *position.take_profit)) {
                decision.should_close = true;
                decision.reason = "Take profit reached";
                return decision;
            }
        }

        if (now() - position.entry_time > params_.max_position_age) {
            decision.should_close = true;
            decision.reason = fmt::format("Position age exceeded {} hours", params_.max_position_age.count() / 3600);
            return decision;
        }

        if (position.pnl_percent && *position.pnl_percent < params_.emergency_stop_percent) {
            decision.should_close = true;
            decision.reason = fmt::format("Emergency stop - loss exceeded {}%",
                                          dec::toPlainString(dec::abs(params_.emergency_stop_percent)));
            return decision;
        }

        return decision;
    }

    RiskMetrics RiskManager::getRiskMetrics() const {
        RiskMetrics metrics;
        metrics.daily_loss = state_.daily_loss;
        metrics.max_drawdown = state_.max_drawdown_observed;
        metrics.peak_balance = state_.peak_balance;
        metrics.limits = params_;
        return metrics;
    }

    void RiskManager::resetMetrics() {
        state_.daily_loss = 0;
        state_.daily_loss_reset_at = now();
        state_.max_drawdown_observed = 0;
        state_.peak_balance = 0;
        core::logging::getLogger()->info("Risk metrics reset");
    }

} // namespace risk
