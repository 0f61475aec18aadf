#pragma once

#include "datatypes.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace test_helpers {

    // Console quiet, full detail in logs/reversion_tests_*.log
    inline core::logging::LogSettings testLogSettings() {
        core::logging::LogSettings settings;
        settings.base_filename = "reversion_tests";
        settings.console_level = spdlog::level::warn;
        settings.file_level = spdlog::level::debug;
        return settings;
    }

    // 2024-01-01T12:00:00Z, midday so short replays stay on one calendar day
    inline core::Timestamp baseTime() {
        return core::utils::fromUnixMillis(1704110400000LL);
    }

    inline core::PriceBar makeBar(core::Timestamp ts, const core::Decimal& close,
                                  const core::Decimal& volume = core::Decimal(1000000)) {
        core::PriceBar bar;
        bar.timestamp = ts;
        bar.open = close;
        bar.high = close;
        bar.low = close;
        bar.close = close;
        bar.volume = volume;
        bar.source = "test";
        return bar;
    }

    // One bar per close, 'step' apart starting at baseTime()
    inline core::TimeSeries<core::PriceBar> makeSeries(const std::vector<core::Decimal>& closes,
                                                       std::chrono::seconds step = std::chrono::hours(1)) {
        core::TimeSeries<core::PriceBar> bars;
        core::Timestamp ts = baseTime();
        for (const auto& close : closes) {
            bars.push_back(makeBar(ts, close));
            ts += step;
        }
        return bars;
    }

    // 'count' bars at 'flat' followed by one bar at 'last'
    inline core::TimeSeries<core::PriceBar> flatThenDrop(int count, const core::Decimal& flat, const core::Decimal& last,
                                                         std::chrono::seconds step = std::chrono::hours(1)) {
        std::vector<core::Decimal> closes(static_cast<size_t>(count), flat);
        closes.push_back(last);
        return makeSeries(closes, step);
    }

    // Integer-priced oscillation around 100, deterministic
    inline core::TimeSeries<core::PriceBar> oscillatingSeries(int count) {
        std::vector<core::Decimal> closes;
        for (int i = 0; i < count; ++i) {
            int offset = ((i * 7) % 23) - 11;
            closes.push_back(core::Decimal(100 + offset));
        }
        return makeSeries(closes);
    }

} // namespace test_helpers
