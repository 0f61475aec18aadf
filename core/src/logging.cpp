#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/cfg/env.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/chrono.h>
#include <algorithm>
#include <array>
#include <ctime>
#include <filesystem>
#include <vector>

namespace core {
namespace logging {

    namespace {

        constexpr std::array<Channel, 4> kChannels = {
            Channel::Engine, Channel::Signal, Channel::Trade, Channel::Metric};

        constexpr size_t kMaxFileSize = 1024 * 1024 * 10;
        constexpr size_t kMaxFiles = 5;

        std::array<std::shared_ptr<spdlog::logger>, kChannels.size()> channel_loggers;

        size_t indexOf(Channel channel) {
            return static_cast<size_t>(channel);
        }

        spdlog::level::level_enum defaultLevel(Channel channel, const LogSettings& settings) {
            auto it = settings.channel_levels.find(channel);
            if (it != settings.channel_levels.end()) {
                return it->second;
            }
            if (channel == Channel::Engine) {
                return std::min(settings.console_level, settings.file_level);
            }
            return spdlog::level::info;
        }

        std::filesystem::path logFilePath(const LogSettings& settings) {
            std::filesystem::path dir = settings.directory.empty() ? std::filesystem::path(".")
                                                                  : std::filesystem::path(settings.directory);
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                throw TradingPlatformException(
                    fmt::format("Cannot create log directory '{}': {}", dir.string(), ec.message()));
            }
            return dir / fmt::format("{}_{:%Y%m%d_%H%M%S}Z.log", settings.base_filename,
                                     fmt::gmtime(std::time(nullptr)));
        }

    } // end anonymous namespace

    const char* channelName(Channel channel) {
        switch (channel) {
            case Channel::Engine: return "engine";
            case Channel::Signal: return "signal";
            case Channel::Trade: return "trade";
            case Channel::Metric: return "metric";
        }
        return "engine";
    }

    std::string initialize(const LogSettings& settings) {
        std::filesystem::path path = logFilePath(settings);
        const std::string pattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";

        std::vector<spdlog::sink_ptr> sinks;
        try {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(settings.console_level);
            console_sink->set_pattern(pattern);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), kMaxFileSize, kMaxFiles, true);
            file_sink->set_level(settings.file_level);
            file_sink->set_pattern(pattern);

            sinks = {console_sink, file_sink};
        } catch (const spdlog::spdlog_ex& ex) {
            throw TradingPlatformException(fmt::format("Log initialization failed for '{}': {}",
                                                       path.string(), ex.what()));
        }

        for (Channel channel : kChannels) {
            spdlog::drop(channelName(channel));
        }
        for (Channel channel : kChannels) {
            auto logger = std::make_shared<spdlog::logger>(channelName(channel), sinks.begin(), sinks.end());
            logger->set_level(defaultLevel(channel, settings));
            if (channel == Channel::Engine) {
                spdlog::set_default_logger(logger);
            } else {
                spdlog::register_logger(logger);
            }
            channel_loggers[indexOf(channel)] = logger;
        }
        spdlog::flush_on(spdlog::level::err);
        spdlog::cfg::load_env_levels();

        getLogger()->info("Logging to {} (console {}, file {}; signal {}, trade {}, metric {})",
                          path.string(),
                          spdlog::level::to_string_view(settings.console_level),
                          spdlog::level::to_string_view(settings.file_level),
                          spdlog::level::to_string_view(getChannel(Channel::Signal)->level()),
                          spdlog::level::to_string_view(getChannel(Channel::Trade)->level()),
                          spdlog::level::to_string_view(getChannel(Channel::Metric)->level()));
        return path.string();
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        return getChannel(Channel::Engine);
    }

    std::shared_ptr<spdlog::logger>& getChannel(Channel channel) {
        std::shared_ptr<spdlog::logger>& logger = channel_loggers[indexOf(channel)];
        if (!logger) {
            throw std::runtime_error("Logger accessed before initialization. Call core::logging::initialize() first.");
        }
        return logger;
    }

} // namespace logging
} // namespace core
