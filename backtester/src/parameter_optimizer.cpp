#include "parameter_optimizer.hpp"
#include "backtester.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace backtester {

    namespace dec = core::decimal;

    namespace {

        json resultToJson(const OptimizationResult& r) {
            json j = {
                {"maPeriod", r.ma_period},
                {"stdDevMultiplier", dec::toPlainString(r.std_dev_multiplier)},
                {"totalReturn", r.total_return_percent},
                {"winRate", r.win_rate},
                {"sharpeRatio", r.sharpe_ratio},
                {"maxDrawdown", r.max_drawdown},
                {"totalTrades", r.total_trades}
            };
            if (r.error) {
                j["error"] = *r.error;
            }
            return j;
        }

        json listToJson(const std::vector<OptimizationResult>& results, size_t limit) {
            json arr = json::array();
            for (size_t i = 0; i < results.size() && i < limit; ++i) {
                arr.push_back(resultToJson(results[i]));
            }
            return arr;
        }

        double returnToRisk(const OptimizationResult& r) {
            return r.total_return_percent / (r.max_drawdown + 0.01);
        }

    } // end anonymous namespace

    json OptimizationReport::toJson(size_t top_n) const {
        json j;
        j["timestamp"] = core::utils::timestampToString(std::chrono::system_clock::now());
        j["totalCombinations"] = results.size();
        j["results"] = listToJson(results, results.size());
        j["topByReturn"] = listToJson(by_return, top_n);
        j["topBySharpe"] = listToJson(by_sharpe, top_n);
        j["bestBalanced"] = listToJson(balanced, 5);
        return j;
    }

    ParameterOptimizer::ParameterOptimizer(const core::EngineConfig& base_config,
                                           std::vector<int> ma_periods,
                                           std::vector<core::Decimal> multipliers)
        : base_config_(base_config), ma_periods_(std::move(ma_periods)), multipliers_(std::move(multipliers))
    {
        if (ma_periods_.empty() || multipliers_.empty()) {
            throw std::invalid_argument("Optimization grid must not be empty.");
        }
    }

    OptimizationReport ParameterOptimizer::optimize(const core::TimeSeries<core::PriceBar>& bars) const {
        auto logger = core::logging::getLogger();
        const size_t total = ma_periods_.size() * multipliers_.size();
        logger->info("Parameter optimization: {} combinations over {} bars", total, bars.size());

        OptimizationReport report;
        size_t current = 0;
        for (int ma_period : ma_periods_) {
            for (const auto& multiplier : multipliers_) {
                ++current;
                logger->info("[{}/{}] Testing MA:{}, StdDev:{}x", current, total, ma_period, dec::toPlainString(multiplier));

                OptimizationResult entry;
                entry.ma_period = ma_period;
                entry.std_dev_multiplier = multiplier;

                core::EngineConfig config = base_config_;
                config.strategy.ma_period = ma_period;
                config.strategy.std_dev_multiplier = multiplier;

                try {
                    BacktestResult result = BacktestSimulator(config).run(bars);
                    entry.total_return_percent = dec::toDouble(result.total_return_percent);
                    entry.win_rate = dec::toDouble(result.win_rate);
                    entry.sharpe_ratio = dec::toDouble(result.sharpe_ratio);
                    entry.max_drawdown = dec::toDouble(result.max_drawdown);
                    entry.total_trades = result.total_trades;
                } catch (const std::exception& e) {
                    // A failed combination is recorded and the sweep continues
                    logger->warn("Combination MA:{}, StdDev:{}x failed: {}", ma_period, dec::toPlainString(multiplier), e.what());
                    entry.total_return_percent = kFailedReturn;
                    entry.sharpe_ratio = kFailedSharpe;
                    entry.max_drawdown = kFailedDrawdown;
                    entry.error = e.what();
                }
                report.results.push_back(entry);
            }
        }

        report.by_return = report.results;
        std::stable_sort(report.by_return.begin(), report.by_return.end(),
                         [](const OptimizationResult& a, const OptimizationResult& b) {
                             return a.total_return_percent > b.total_return_percent;
                         });

        report.by_sharpe = report.results;
        std::stable_sort(report.by_sharpe.begin(), report.by_sharpe.end(),
                         [](const OptimizationResult& a, const OptimizationResult& b) {
                             return a.sharpe_ratio > b.sharpe_ratio;
                         });

        for (const auto& r : report.results) {
            if (!r.error && r.total_return_percent > 0 && r.max_drawdown < 0.2) {
                report.balanced.push_back(r);
            }
        }
        std::stable_sort(report.balanced.begin(), report.balanced.end(),
                         [](const OptimizationResult& a, const OptimizationResult& b) {
                             return returnToRisk(a) > returnToRisk(b);
                         });

        if (report.balanced.empty()) {
            logger->info("No profitable low-risk combinations found");
        } else {
            const auto& best = report.balanced.front();
            logger->info("Best balanced parameters: MA={}, StdDev={}x, return={:.2f}%, maxDD={:.1f}%",
                         best.ma_period, dec::toPlainString(best.std_dev_multiplier),
                         best.total_return_percent, best.max_drawdown * 100.0);
        }
        return report;
    }

} // namespace backtester
