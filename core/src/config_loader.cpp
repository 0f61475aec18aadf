#include "config_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace core {

    namespace { // File-local parsing helpers

        Decimal readDecimal(const json& section, const char* key, const Decimal& fallback) {
            if (!section.contains(key)) return fallback;
            const json& value = section[key];
            if (value.is_string()) {
                return decimal::fromString(value.get<std::string>());
            }
            if (value.is_number_integer()) {
                return Decimal(value.get<long long>());
            }
            if (value.is_number()) {
                return decimal::fromDouble(value.get<double>());
            }
            throw std::invalid_argument(fmt::format("'{}' must be a number or a decimal string.", key));
        }

        int readInt(const json& section, const char* key, int fallback) {
            if (!section.contains(key)) return fallback;
            if (!section[key].is_number_integer()) {
                throw std::invalid_argument(fmt::format("'{}' must be an integer.", key));
            }
            return section[key].get<int>();
        }

        double readDouble(const json& section, const char* key, double fallback) {
            if (!section.contains(key)) return fallback;
            if (!section[key].is_number()) {
                throw std::invalid_argument(fmt::format("'{}' must be a number.", key));
            }
            return section[key].get<double>();
        }

        bool readBool(const json& section, const char* key, bool fallback) {
            if (!section.contains(key)) return fallback;
            if (!section[key].is_boolean()) {
                throw std::invalid_argument(fmt::format("'{}' must be a boolean.", key));
            }
            return section[key].get<bool>();
        }

        std::string readString(const json& section, const char* key, const std::string& fallback) {
            if (!section.contains(key)) return fallback;
            if (!section[key].is_string()) {
                throw std::invalid_argument(fmt::format("'{}' must be a string.", key));
            }
            return section[key].get<std::string>();
        }

        const json& section(const json& document, const char* name) {
            static const json empty = json::object();
            if (!document.contains(name)) return empty;
            if (!document[name].is_object()) {
                throw std::invalid_argument(fmt::format("Config section '{}' must be an object.", name));
            }
            return document[name];
        }

        void deriveDailyLossCap(RiskParams& risk) {
            if (risk.daily_loss_follows_position_size) {
                risk.max_daily_loss = risk.max_position_size * Decimal("0.1");
            }
        }

        bool envFlag(const std::string& value) {
            std::string lower = value;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                [](unsigned char c) { return std::tolower(c); });
            return lower == "true" || lower == "1" || lower == "yes";
        }

    } // end anonymous namespace

    EngineConfig ConfigLoader::fromJson(const json& document) {
        if (!document.is_object()) {
            throw ConfigException("Config must be a JSON object.");
        }

        EngineConfig config;
        try {
            const json& s = section(document, "strategy");
            config.strategy.ma_period = readInt(s, "ma_period", config.strategy.ma_period);
            config.strategy.std_dev_multiplier = readDecimal(s, "std_dev_multiplier", config.strategy.std_dev_multiplier);
            config.strategy.entry_threshold = readDecimal(s, "entry_threshold", config.strategy.entry_threshold);
            config.strategy.exit_threshold = readDecimal(s, "exit_threshold", config.strategy.exit_threshold);
            config.strategy.stop_loss_percent = readDecimal(s, "stop_loss_percent", config.strategy.stop_loss_percent);
            config.strategy.take_profit_percent = readDecimal(s, "take_profit_percent", config.strategy.take_profit_percent);
            config.strategy.min_volume = readDecimal(s, "min_volume", config.strategy.min_volume);
            config.strategy.rsi_period = readInt(s, "rsi_period", config.strategy.rsi_period);
            config.strategy.ema_period = readInt(s, "ema_period", config.strategy.ema_period);
            config.strategy.size_precision = readInt(s, "size_precision", config.strategy.size_precision);

            const json& r = section(document, "risk");
            config.risk.max_position_size = readDecimal(r, "max_position_size", config.risk.max_position_size);
            config.risk.max_open_positions = readInt(r, "max_open_positions", config.risk.max_open_positions);
            config.risk.risk_per_trade = readDecimal(r, "risk_per_trade", config.risk.risk_per_trade);
            if (r.contains("max_daily_loss")) {
                config.risk.max_daily_loss = readDecimal(r, "max_daily_loss", config.risk.max_daily_loss);
                config.risk.daily_loss_follows_position_size = false;
            }
            config.risk.max_drawdown = readDecimal(r, "max_drawdown", config.risk.max_drawdown);
            config.risk.max_exposure_fraction = readDecimal(r, "max_exposure_fraction", config.risk.max_exposure_fraction);
            config.risk.risk_stop_percent = readDecimal(r, "risk_stop_percent", config.risk.risk_stop_percent);
            config.risk.min_position_value = readDecimal(r, "min_position_value", config.risk.min_position_value);
            config.risk.min_signal_strength = readDouble(r, "min_signal_strength", config.risk.min_signal_strength);
            config.risk.max_position_age = std::chrono::seconds(
                readInt(r, "max_position_age_hours", static_cast<int>(config.risk.max_position_age.count() / 3600)) * 3600LL);
            config.risk.emergency_stop_percent = readDecimal(r, "emergency_stop_percent", config.risk.emergency_stop_percent);
            config.risk.risk_reward_ratio = readDecimal(r, "risk_reward_ratio", config.risk.risk_reward_ratio);

            const json& b = section(document, "backtest");
            config.backtest.initial_balance = readDecimal(b, "initial_balance", config.backtest.initial_balance);
            config.backtest.fee_rate = readDecimal(b, "fee_rate", config.backtest.fee_rate);
            config.backtest.instrument = readString(b, "instrument", config.backtest.instrument);
            config.backtest.interval = readString(b, "interval", config.backtest.interval);
            config.backtest.results_directory = readString(b, "results_directory", config.backtest.results_directory);
            if (b.contains("start_date")) {
                config.backtest.start_time = utils::stringToTimestamp(readString(b, "start_date", ""));
            }
            if (b.contains("end_date")) {
                config.backtest.end_time = utils::stringToTimestamp(readString(b, "end_date", ""));
            }

            const json& t = section(document, "trading");
            config.trading.trading_enabled = readBool(t, "trading_enabled", config.trading.trading_enabled);
            config.trading.paper_trading = readBool(t, "paper_trading", config.trading.paper_trading);
            config.trading.paper_balance = readDecimal(t, "paper_balance", config.trading.paper_balance);
            config.trading.duplicate_signal_window = std::chrono::seconds(
                readInt(t, "duplicate_signal_window_seconds", static_cast<int>(config.trading.duplicate_signal_window.count())));

            deriveDailyLossCap(config.risk);

        } catch (const json::exception& e) {
            throw ConfigException(fmt::format("Invalid JSON structure in config: {}", e.what()));
        } catch (const std::invalid_argument& e) {
            throw ConfigException(fmt::format("Invalid config value: {}", e.what()));
        } catch (const std::runtime_error& e) {
            // Date parsing failures from utils::stringToTimestamp
            throw ConfigException(fmt::format("Invalid config value: {}", e.what()));
        }
        return config;
    }

    EngineConfig ConfigLoader::fromFile(const std::string& path) {
        auto logger = logging::getLogger();
        logger->info("Loading engine config from: {}", path);

        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }

        json document;
        try {
            document = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }

        EngineConfig config = fromJson(document);
        applyEnvironmentOverrides(config);
        validateConfig(config);
        logger->debug("Effective config: {}", toJson(config).dump());
        return config;
    }

    void ConfigLoader::applyEnvironmentOverrides(EngineConfig& config) {
        auto env = [](const char* name) -> const char* { return std::getenv(name); };

        try {
            if (const char* v = env("MA_PERIOD")) config.strategy.ma_period = std::stoi(v);
            if (const char* v = env("STD_DEV_MULTIPLIER")) config.strategy.std_dev_multiplier = decimal::fromString(v);
            if (const char* v = env("MIN_VOLUME_USD")) config.strategy.min_volume = decimal::fromString(v);
            if (const char* v = env("MAX_POSITION_SIZE")) config.risk.max_position_size = decimal::fromString(v);
            if (const char* v = env("RISK_PER_TRADE")) config.risk.risk_per_trade = decimal::fromString(v);
        } catch (const std::logic_error& e) {
            // std::invalid_argument and std::out_of_range from stoi / fromString
            throw ConfigException(fmt::format("Invalid environment override: {}", e.what()));
        }
        deriveDailyLossCap(config.risk);
        if (const char* v = env("TRADING_ENABLED")) config.trading.trading_enabled = envFlag(v);
        // Paper trading stays on unless explicitly disabled
        if (const char* v = env("PAPER_TRADING")) config.trading.paper_trading = std::string(v) != "false";
    }

    json ConfigLoader::toJson(const EngineConfig& config) {
        json j;
        j["strategy"] = {
            {"ma_period", config.strategy.ma_period},
            {"std_dev_multiplier", decimal::toPlainString(config.strategy.std_dev_multiplier)},
            {"entry_threshold", decimal::toPlainString(config.strategy.entry_threshold)},
            {"exit_threshold", decimal::toPlainString(config.strategy.exit_threshold)},
            {"stop_loss_percent", decimal::toPlainString(config.strategy.stop_loss_percent)},
            {"take_profit_percent", decimal::toPlainString(config.strategy.take_profit_percent)},
            {"min_volume", decimal::toPlainString(config.strategy.min_volume)},
            {"rsi_period", config.strategy.rsi_period},
            {"ema_period", config.strategy.ema_period},
            {"size_precision", config.strategy.size_precision}
        };
        j["risk"] = {
            {"max_position_size", decimal::toPlainString(config.risk.max_position_size)},
            {"max_open_positions", config.risk.max_open_positions},
            {"risk_per_trade", decimal::toPlainString(config.risk.risk_per_trade)},
            {"max_drawdown", decimal::toPlainString(config.risk.max_drawdown)},
            {"max_exposure_fraction", decimal::toPlainString(config.risk.max_exposure_fraction)},
            {"risk_stop_percent", decimal::toPlainString(config.risk.risk_stop_percent)},
            {"min_position_value", decimal::toPlainString(config.risk.min_position_value)},
            {"min_signal_strength", config.risk.min_signal_strength},
            {"max_position_age_hours", config.risk.max_position_age.count() / 3600},
            {"emergency_stop_percent", decimal::toPlainString(config.risk.emergency_stop_percent)},
            {"risk_reward_ratio", decimal::toPlainString(config.risk.risk_reward_ratio)}
        };
        if (!config.risk.daily_loss_follows_position_size) {
            j["risk"]["max_daily_loss"] = decimal::toPlainString(config.risk.max_daily_loss);
        }
        j["backtest"] = {
            {"initial_balance", decimal::toPlainString(config.backtest.initial_balance)},
            {"fee_rate", decimal::toPlainString(config.backtest.fee_rate)},
            {"instrument", config.backtest.instrument},
            {"interval", config.backtest.interval},
            {"results_directory", config.backtest.results_directory}
        };
        if (config.backtest.start_time) {
            j["backtest"]["start_date"] = utils::timestampToString(*config.backtest.start_time);
        }
        if (config.backtest.end_time) {
            j["backtest"]["end_date"] = utils::timestampToString(*config.backtest.end_time);
        }
        j["trading"] = {
            {"trading_enabled", config.trading.trading_enabled},
            {"paper_trading", config.trading.paper_trading},
            {"paper_balance", decimal::toPlainString(config.trading.paper_balance)},
            {"duplicate_signal_window_seconds", config.trading.duplicate_signal_window.count()}
        };
        return j;
    }

} // namespace core
