#pragma once

#include "datatypes.hpp"
#include <string>
#include <optional>
#include <chrono>

namespace core {

    // Parameters of the mean-reversion signal logic
    struct StrategyParams {
        int ma_period = 20;
        Decimal std_dev_multiplier = 2;            // Strong-signal z threshold and band width
        Decimal entry_threshold = Decimal("0.5");  // Moderate-signal z threshold
        Decimal exit_threshold = Decimal("0.1");   // Neutral zone half-width
        Decimal stop_loss_percent = Decimal("0.05");
        Decimal take_profit_percent = Decimal("0.1");
        Decimal min_volume = 10000;
        int rsi_period = 14;
        int ema_period = 20;
        int size_precision = 8; // Fractional digits kept on position sizes
    };

    struct RiskParams {
        Decimal max_position_size = 1000;
        int max_open_positions = 3;
        Decimal risk_per_trade = Decimal("0.02");
        Decimal max_daily_loss = 100;
        // While set, the loader keeps max_daily_loss at 10% of max_position_size
        bool daily_loss_follows_position_size = true;
        Decimal max_drawdown = Decimal("0.2");
        Decimal max_exposure_fraction = Decimal("0.5");
        Decimal risk_stop_percent = Decimal("0.05");
        Decimal min_position_value = 10;           // Dust floor, quote currency
        double min_signal_strength = 0.4;
        std::chrono::seconds max_position_age = std::chrono::hours(24);
        Decimal emergency_stop_percent = -10;      // pnl_percent below this closes the position
        Decimal risk_reward_ratio = 2;
    };

    struct BacktestParams {
        Decimal initial_balance = 10000;
        Decimal fee_rate = Decimal("0.0025");
        std::optional<Timestamp> start_time;
        std::optional<Timestamp> end_time;
        std::string instrument = "SOL-USD";
        std::string interval = "1h";
        std::string results_directory = "backtest-results";
    };

    struct TradingParams {
        bool trading_enabled = false;
        bool paper_trading = true;
        Decimal paper_balance = 1000;
        std::chrono::seconds duplicate_signal_window = std::chrono::minutes(5);
    };

    // Read-only inputs to every component, passed by value into constructors.
    struct EngineConfig {
        StrategyParams strategy;
        RiskParams risk;
        BacktestParams backtest;
        TradingParams trading;
    };

    // Throws ConfigException listing every violated rule.
    void validateConfig(const EngineConfig& config);

} // namespace core
