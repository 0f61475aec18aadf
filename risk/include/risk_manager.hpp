#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace risk {

    // Supplies "now". Backtests pass bar time so age-based exits follow the replay.
    using Clock = std::function<core::Timestamp()>;

    struct TradeValidation {
        bool allowed = false;
        std::string reason;                         // Empty when approved unchanged
        std::optional<core::Decimal> adjusted_size; // Set only when smaller than proposed
    };

    struct ExitDecision {
        bool should_close = false;
        std::string reason;
    };

    // Running counters of one account context. Reset explicitly, never implicitly.
    struct RiskState {
        core::Decimal daily_loss = 0;
        core::Timestamp daily_loss_reset_at{};
        core::Decimal peak_balance = 0;
        core::Decimal max_drawdown_observed = 0; // Fraction, 0.2 means 20%
    };

    struct RiskMetrics {
        core::Decimal daily_loss = 0;
        core::Decimal max_drawdown = 0;
        core::Decimal peak_balance = 0;
        core::RiskParams limits;
    };

    class RiskManager {
    public:
        explicit RiskManager(const core::RiskParams& params, Clock clock = {}, int size_precision = 8);

        // Ordered checks, first failure wins. Never returns a size above proposed_size.
        TradeValidation validateTrade(const core::TradingSignal& signal,
                                      const core::Decimal& proposed_size,
                                      const core::Decimal& current_balance,
                                      const std::vector<core::Position>& open_positions);

        // Adds a realized loss (positive amount). Resets the counter first when
        // the last reset happened before today's local midnight.
        void updateDailyLoss(const core::Decimal& loss);

        // Raises the peak when exceeded and tracks the largest drawdown seen.
        void updateDrawdown(const core::Decimal& current_balance);

        // Percent stop by default, 2x ATR when an ATR is given
        core::Decimal calculateStopLoss(const core::Decimal& entry_price, core::PositionSide side,
                                        const std::optional<core::Decimal>& atr = std::nullopt) const;
        core::Decimal calculateTakeProfit(const core::Decimal& entry_price, core::PositionSide side,
                                          const std::optional<core::Decimal>& risk_reward_ratio = std::nullopt) const;

        // Stop-loss, take-profit, age, emergency stop. First match wins.
        ExitDecision shouldClosePosition(const core::Position& position) const;

        RiskMetrics getRiskMetrics() const;
        const RiskState& getState() const { return state_; }
        const core::RiskParams& getParams() const { return params_; }

        void resetMetrics();

    private:
        core::RiskParams params_;
        Clock clock_;
        int size_precision_;
        RiskState state_;

        core::Timestamp now() const;
        void rollDailyLossIfNewDay();
        bool isDailyLossLimitExceeded();
        bool isDrawdownLimitExceeded(const core::Decimal& current_balance);
        static core::Decimal calculateTotalExposure(const std::vector<core::Position>& positions);
    };

} // namespace risk
