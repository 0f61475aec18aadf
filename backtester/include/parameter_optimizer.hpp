#pragma once

#include "config.hpp"
#include "datatypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace backtester {

    using json = nlohmann::json;

    struct OptimizationResult {
        int ma_period = 0;
        core::Decimal std_dev_multiplier = 0;
        double total_return_percent = 0.0;
        double win_rate = 0.0;
        double sharpe_ratio = 0.0;
        double max_drawdown = 0.0;
        int total_trades = 0;
        std::optional<std::string> error; // Set for runs that threw
    };

    struct OptimizationReport {
        std::vector<OptimizationResult> results;      // Grid order
        std::vector<OptimizationResult> by_return;    // Descending total return
        std::vector<OptimizationResult> by_sharpe;    // Descending Sharpe
        std::vector<OptimizationResult> balanced;     // Profitable, drawdown < 20%, best return/risk first

        json toJson(size_t top_n = 10) const;
    };

    // Grid sweep of ma_period x std_dev_multiplier over one bar series.
    class ParameterOptimizer {
    public:
        // Failed runs are recorded with these values so they sort last
        static constexpr double kFailedReturn = -999.0;
        static constexpr double kFailedSharpe = -999.0;
        static constexpr double kFailedDrawdown = 1.0;

        explicit ParameterOptimizer(const core::EngineConfig& base_config,
                                    std::vector<int> ma_periods = {10, 15, 20, 25, 30},
                                    std::vector<core::Decimal> multipliers = {core::Decimal("1.5"), core::Decimal(2),
                                                                              core::Decimal("2.5"), core::Decimal(3)});

        OptimizationReport optimize(const core::TimeSeries<core::PriceBar>& bars) const;

    private:
        core::EngineConfig base_config_;
        std::vector<int> ma_periods_;
        std::vector<core::Decimal> multipliers_;
    };

} // namespace backtester
