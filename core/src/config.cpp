#include "config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h> // fmt::join
#include <vector>
#include <string>

namespace core {

    void validateConfig(const EngineConfig& config) {
        std::vector<std::string> errors;
        const auto& s = config.strategy;
        const auto& r = config.risk;
        const auto& b = config.backtest;

        if (s.ma_period < 2) {
            errors.push_back("ma_period must be at least 2");
        }
        if (s.std_dev_multiplier <= 0) {
            errors.push_back("std_dev_multiplier must be positive");
        }
        if (s.entry_threshold < 0 || s.exit_threshold < 0) {
            errors.push_back("entry_threshold and exit_threshold must not be negative");
        }
        if (s.entry_threshold > s.std_dev_multiplier) {
            errors.push_back("entry_threshold must not exceed std_dev_multiplier");
        }
        if (s.stop_loss_percent <= 0 || s.stop_loss_percent >= 1) {
            errors.push_back("stop_loss_percent must be in (0, 1)");
        }
        if (s.take_profit_percent <= 0 || s.take_profit_percent >= 1) {
            errors.push_back("take_profit_percent must be in (0, 1)");
        }
        if (s.min_volume < 0) {
            errors.push_back("min_volume must not be negative");
        }
        if (s.rsi_period < 2 || s.ema_period < 2) {
            errors.push_back("rsi_period and ema_period must be at least 2");
        }
        if (s.size_precision < 0 || s.size_precision > 18) {
            errors.push_back("size_precision must be between 0 and 18");
        }

        if (r.risk_per_trade <= 0) {
            errors.push_back("risk_per_trade must be positive");
        }
        if (r.risk_per_trade > Decimal("0.1")) {
            errors.push_back("risk_per_trade should not exceed 10% (0.1)");
        }
        if (r.max_position_size <= 0) {
            errors.push_back("max_position_size must be positive");
        }
        if (r.max_open_positions < 1) {
            errors.push_back("max_open_positions must be at least 1");
        }
        if (r.max_daily_loss < 0) {
            errors.push_back("max_daily_loss must not be negative");
        }
        if (r.max_drawdown <= 0 || r.max_drawdown > 1) {
            errors.push_back("max_drawdown must be in (0, 1]");
        }
        if (r.max_exposure_fraction <= 0 || r.max_exposure_fraction > 1) {
            errors.push_back("max_exposure_fraction must be in (0, 1]");
        }
        if (r.risk_stop_percent <= 0 || r.risk_stop_percent >= 1) {
            errors.push_back("risk_stop_percent must be in (0, 1)");
        }
        if (r.min_signal_strength < 0.0 || r.min_signal_strength > 1.0) {
            errors.push_back("min_signal_strength must be in [0, 1]");
        }

        if (b.initial_balance <= 0) {
            errors.push_back("initial_balance must be positive");
        }
        if (b.fee_rate < 0 || b.fee_rate >= 1) {
            errors.push_back("fee_rate must be in [0, 1)");
        }
        if (b.start_time && b.end_time && *b.end_time < *b.start_time) {
            errors.push_back("end_date must not be before start_date");
        }

        if (!errors.empty()) {
            throw ConfigException(fmt::format("Configuration validation failed:\n{}", fmt::join(errors, "\n")));
        }
    }

} // namespace core
