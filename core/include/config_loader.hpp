#pragma once

#include "config.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace core {

    using json = nlohmann::json;

    class ConfigLoader {
    public:
        // Starts from defaults and overlays whatever sections the document has:
        // { "strategy": {...}, "risk": {...}, "backtest": {...}, "trading": {...} }
        // Decimal fields accept JSON numbers or strings ("0.0025").
        static EngineConfig fromJson(const json& document);

        // Reads the file, applies environment overrides, validates.
        static EngineConfig fromFile(const std::string& path);

        // MA_PERIOD, STD_DEV_MULTIPLIER, MIN_VOLUME_USD, MAX_POSITION_SIZE, RISK_PER_TRADE,
        // TRADING_ENABLED, PAPER_TRADING
        static void applyEnvironmentOverrides(EngineConfig& config);

        static json toJson(const EngineConfig& config);
    };

} // namespace core
