#include "metrics_sink.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace live {

    namespace dec = core::decimal;

    void LoggingMetricsSink::onSignal(const core::TradingSignal& signal) {
        core::logging::signal("type={} strength={:.2f} price={} at {} reason='{}'",
                              core::toString(signal.type), signal.strength,
                              dec::toPlainString(signal.price),
                              core::utils::timestampToString(signal.timestamp), signal.reason);
    }

    void LoggingMetricsSink::onTrade(const core::Trade& trade) {
        core::logging::trade("id={} side={} size={} price={} fee={} status={}{}",
                             trade.id, core::toString(trade.side), dec::toPlainString(trade.size),
                             dec::toPlainString(trade.price), dec::toString(trade.fee, 4),
                             core::toString(trade.status),
                             trade.error ? " error='" + *trade.error + "'" : std::string());
    }

    void LoggingMetricsSink::onRiskMetrics(const risk::RiskMetrics& metrics) {
        core::logging::metric("dailyLoss={}/{} maxDrawdown={}% (limit {}%) peakBalance={}",
                              dec::toString(metrics.daily_loss, 2),
                              dec::toString(metrics.limits.max_daily_loss, 2),
                              dec::toString(metrics.max_drawdown * 100, 2),
                              dec::toString(metrics.limits.max_drawdown * 100, 2),
                              dec::toString(metrics.peak_balance, 2));
    }

} // namespace live
