#include "signal_engine.hpp"
#include "score_adjustments.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <stdexcept>

namespace strategy_engine {

SignalEngine::SignalEngine(const core::EngineConfig& config)
    : SignalEngine(config, defaultScoreAdjustments()) {}

SignalEngine::SignalEngine(const core::EngineConfig& config,
                           std::vector<std::unique_ptr<IScoreAdjustment>> adjustments)
    : params_(config.strategy),
      max_position_size_(config.risk.max_position_size),
      risk_per_trade_(config.risk.risk_per_trade),
      calculator_(config.strategy),
      adjustments_(std::move(adjustments))
{
    for (const auto& adjustment : adjustments_) {
        if (!adjustment) {
            throw std::invalid_argument("Score adjustment cannot be null.");
        }
    }
    core::logging::getLogger()->debug("SignalEngine created: MA={}, multiplier={}, {} score adjustments",
                                      params_.ma_period, core::decimal::toPlainString(params_.std_dev_multiplier),
                                      adjustments_.size());
}

std::optional<core::TradingSignal> SignalEngine::analyze(const core::TimeSeries<core::PriceBar>& window) {
    auto logger = core::logging::getLogger();
    if (window.size() < static_cast<size_t>(params_.ma_period)) {
        logger->debug("Insufficient data for analysis. Need {} points, have {}", params_.ma_period, window.size());
        return std::nullopt;
    }

    std::optional<core::Indicators> indicators = calculator_.calculate(window);
    if (!indicators) {
        return std::nullopt;
    }

    const core::PriceBar& last = window.back();
    std::optional<core::TradingSignal> signal = generateSignal(last.close, last.volume, last.timestamp, *indicators);

    if (signal) {
        core::logging::signal("Trading signal generated: type={} price={} zScore={} sma={} strength={:.2f}",
                              core::toString(signal->type),
                              core::decimal::toPlainString(signal->price),
                              core::decimal::toString(*signal->indicators.z_score, 4),
                              core::decimal::toString(signal->indicators.sma, 4),
                              signal->strength);
    }
    return signal;
}

std::optional<core::TradingSignal> SignalEngine::generateSignal(const core::Decimal& price,
                                                                const core::Decimal& volume,
                                                                core::Timestamp timestamp,
                                                                const core::Indicators& indicators) const {
    auto logger = core::logging::getLogger();

    if (volume < params_.min_volume) {
        logger->debug("Volume too low for trading signal ({} < {})",
                      core::decimal::toPlainString(volume), core::decimal::toPlainString(params_.min_volume));
        return std::nullopt;
    }
    if (indicators.std_dev <= 0) {
        logger->debug("Zero price variance in window, no z-score");
        return std::nullopt;
    }

    core::Decimal z = (price - indicators.sma) / indicators.std_dev;
    core::Decimal z_abs = core::decimal::abs(z);
    double z_abs_d = core::decimal::toDouble(z_abs);
    std::string z_text = core::decimal::toString(z_abs, 2);

    core::SignalType type = core::SignalType::Hold;
    double strength = 0.0;
    std::string reason;

    if (z <= -params_.std_dev_multiplier) {
        type = core::SignalType::Buy;
        strength = std::min(z_abs_d / 3.0, 1.0);
        reason = fmt::format("Price {} std devs below mean - strong oversold", z_text);
    } else if (z >= params_.std_dev_multiplier) {
        type = core::SignalType::Sell;
        strength = std::min(z_abs_d / 3.0, 1.0);
        reason = fmt::format("Price {} std devs above mean - strong overbought", z_text);
    } else if (z <= -params_.entry_threshold) {
        type = core::SignalType::Buy;
        strength = std::min(z_abs_d / 2.0, 0.7);
        reason = fmt::format("Price {} std devs below mean - moderate oversold", z_text);
    } else if (z >= params_.entry_threshold) {
        type = core::SignalType::Sell;
        strength = std::min(z_abs_d / 2.0, 0.7);
        reason = fmt::format("Price {} std devs above mean - moderate overbought", z_text);
    } else if (z_abs < params_.exit_threshold) {
        strength = 0.1;
        reason = "Price near mean - neutral zone";
    }

    core::Indicators snapshot = indicators;
    snapshot.z_score = z;

    if (type != core::SignalType::Hold) {
        ScoringContext context{type, price, &snapshot};
        for (const auto& adjustment : adjustments_) {
            std::optional<ScoreAdjustment> result = adjustment->evaluate(context);
            if (!result) continue;
            strength = std::min(strength + result->boost, 1.0);
            reason += ", " + result->reason_fragment;
            logger->trace("Score adjustment '{}' applied: +{}", adjustment->describe(), result->boost);
        }
    }

    if (strength < kMinSignalStrength) {
        logger->trace("Signal strength {:.3f} below floor, discarded (z={})", strength, core::decimal::toString(z, 4));
        return std::nullopt;
    }

    core::TradingSignal signal;
    signal.type = type;
    signal.strength = std::clamp(strength, 0.0, 1.0);
    signal.price = price;
    signal.timestamp = timestamp;
    signal.indicators = snapshot;
    signal.reason = reason;
    return signal;
}

core::Decimal SignalEngine::calculatePositionSize(const core::TradingSignal& signal,
                                                  const core::Decimal& available_balance,
                                                  const core::Decimal& current_price) const {
    if (current_price <= 0 || available_balance <= 0) {
        return core::Decimal(0);
    }

    core::Decimal strength_size = max_position_size_ * core::decimal::fromDouble(signal.strength);

    core::Decimal risk_amount = available_balance * risk_per_trade_;
    core::Decimal stop_loss_distance = current_price * params_.stop_loss_percent;
    core::Decimal risk_based_size = risk_amount / stop_loss_distance;

    // Keep a 5% balance buffer
    core::Decimal max_affordable = available_balance / current_price * core::Decimal("0.95");

    core::Decimal size = core::decimal::min(strength_size, core::decimal::min(risk_based_size, max_affordable));
    return core::decimal::quantizeDown(size, params_.size_precision);
}

RiskLevels SignalEngine::calculateRiskLevels(const core::Decimal& entry_price, core::SignalType type) const {
    RiskLevels levels;
    if (type == core::SignalType::Sell) {
        levels.stop_loss = entry_price * (1 + params_.stop_loss_percent);
        levels.take_profit = entry_price * (1 - params_.take_profit_percent);
    } else {
        levels.stop_loss = entry_price * (1 - params_.stop_loss_percent);
        levels.take_profit = entry_price * (1 + params_.take_profit_percent);
    }
    return levels;
}

} // namespace strategy_engine
