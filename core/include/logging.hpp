#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace core {
namespace logging {

    // Named loggers sharing one console sink and one rotating file.
    // The logger name is printed in every line, so channels can be grepped apart.
    enum class Channel { Engine, Signal, Trade, Metric };

    const char* channelName(Channel channel);

    struct LogSettings {
        std::string base_filename = "reversion_engine";
        std::string directory = "logs";
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;
        // Engine defaults to the more verbose sink level, the other channels to info
        std::map<Channel, spdlog::level::level_enum> channel_levels;
    };

    // Builds the channel loggers and returns the log file path
    // (<directory>/<base_filename>_<UTC stamp>.log). SPDLOG_LEVEL, in spdlog's
    // "warn,trade=debug" form, is applied on top of channel_levels.
    // Calling it again replaces every channel. Throws TradingPlatformException
    // when the directory or file cannot be created.
    std::string initialize(const LogSettings& settings = LogSettings());

    // Engine channel
    std::shared_ptr<spdlog::logger>& getLogger();

    std::shared_ptr<spdlog::logger>& getChannel(Channel channel);

    template <typename... Args>
    void signal(spdlog::format_string_t<Args...> fmt_str, Args&&... args) {
        getChannel(Channel::Signal)->info(fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void trade(spdlog::format_string_t<Args...> fmt_str, Args&&... args) {
        getChannel(Channel::Trade)->info(fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void metric(spdlog::format_string_t<Args...> fmt_str, Args&&... args) {
        getChannel(Channel::Metric)->info(fmt_str, std::forward<Args>(args)...);
    }

} // namespace logging
} // namespace core
