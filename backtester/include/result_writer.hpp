#pragma once

#include "backtest_result.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace backtester {

    using json = nlohmann::json;

    // JSON snapshot of a run. Decimals are written as strings to keep them exact.
    class ResultWriter {
    public:
        explicit ResultWriter(std::string results_directory);

        static json toJson(const BacktestResult& result);
        static json toJson(const core::Trade& trade);
        static json toJson(const core::Position& position);

        // Writes <dir>/<prefix>-<UTC timestamp>.json, creating the directory.
        // Returns the path written. Throws TradingPlatformException on I/O failure.
        std::string write(const BacktestResult& result) const;
        std::string writeDocument(const json& document, const std::string& prefix) const;

    private:
        std::string results_directory_;
    };

} // namespace backtester
