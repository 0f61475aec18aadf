#include "result_writer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <chrono>

namespace backtester {

    namespace dec = core::decimal;

    namespace {

        std::string decimalString(const core::Decimal& value) {
            return dec::toPlainString(value);
        }

        json optionalDecimal(const std::optional<core::Decimal>& value) {
            return value ? json(decimalString(*value)) : json(nullptr);
        }

        // 2024-03-01T14-05-09-123Z, safe in file names
        std::string fileTimestamp() {
            auto now = std::chrono::system_clock::now();
            auto itt = std::chrono::system_clock::to_time_t(now);
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
            std::tm utc_tm;
            gmtime_r(&itt, &utc_tm);
            std::ostringstream oss;
            oss << std::put_time(&utc_tm, "%Y-%m-%dT%H-%M-%S") << '-'
                << std::setw(3) << std::setfill('0') << millis << 'Z';
            return oss.str();
        }

    } // end anonymous namespace

    ResultWriter::ResultWriter(std::string results_directory)
        : results_directory_(std::move(results_directory)) {}

    json ResultWriter::toJson(const core::Trade& trade) {
        json j = {
            {"id", trade.id},
            {"timestamp", core::utils::timestampToString(trade.timestamp)},
            {"side", core::toString(trade.side)},
            {"price", decimalString(trade.price)},
            {"size", decimalString(trade.size)},
            {"fee", decimalString(trade.fee)},
            {"status", core::toString(trade.status)},
            {"positionId", trade.position_id}
        };
        if (trade.error) {
            j["error"] = *trade.error;
        }
        return j;
    }

    json ResultWriter::toJson(const core::Position& position) {
        json j = {
            {"id", position.id},
            {"entryPrice", decimalString(position.entry_price)},
            {"entryTime", core::utils::timestampToString(position.entry_time)},
            {"size", decimalString(position.size)},
            {"side", core::toString(position.side)},
            {"stopLoss", optionalDecimal(position.stop_loss)},
            {"takeProfit", optionalDecimal(position.take_profit)},
            {"currentPrice", optionalDecimal(position.current_price)},
            {"pnl", optionalDecimal(position.pnl)},
            {"pnlPercent", optionalDecimal(position.pnl_percent)},
            {"status", core::toString(position.status)}
        };
        j["exitTime"] = position.exit_time ? json(core::utils::timestampToString(*position.exit_time)) : json(nullptr);
        return j;
    }

    json ResultWriter::toJson(const BacktestResult& result) {
        json j;
        j["startDate"] = core::utils::timestampToString(result.start_time);
        j["endDate"] = core::utils::timestampToString(result.end_time);
        j["instrument"] = result.instrument;
        j["interval"] = result.interval;
        j["barsProcessed"] = result.bars_processed;
        j["initialBalance"] = decimalString(result.initial_balance);
        j["finalBalance"] = decimalString(result.final_balance);
        j["totalReturn"] = decimalString(result.total_return);
        j["totalReturnPercent"] = decimalString(result.total_return_percent);
        j["totalFees"] = decimalString(result.total_fees);
        j["totalTrades"] = result.total_trades;
        j["winningTrades"] = result.winning_trades;
        j["losingTrades"] = result.losing_trades;
        j["winRate"] = decimalString(result.win_rate);
        j["averageWin"] = decimalString(result.average_win);
        j["averageLoss"] = decimalString(result.average_loss);
        j["profitFactor"] = decimalString(result.profit_factor);
        j["sharpeRatio"] = decimalString(result.sharpe_ratio);
        j["maxDrawdown"] = decimalString(result.max_drawdown);

        j["trades"] = json::array();
        for (const auto& trade : result.trades) {
            j["trades"].push_back(toJson(trade));
        }
        j["positions"] = json::array();
        for (const auto& position : result.positions) {
            j["positions"].push_back(toJson(position));
        }
        j["equityCurve"] = json::array();
        for (const auto& state : result.equity_curve) {
            j["equityCurve"].push_back({
                {"timestamp", core::utils::timestampToString(state.timestamp)},
                {"cash", decimalString(state.cash)},
                {"positionsValue", decimalString(state.positions_value)},
                {"totalEquity", decimalString(state.total_equity)}
            });
        }
        return j;
    }

    std::string ResultWriter::write(const BacktestResult& result) const {
        return writeDocument(toJson(result), "backtest");
    }

    std::string ResultWriter::writeDocument(const json& document, const std::string& prefix) const {
        try {
            std::filesystem::create_directories(results_directory_);
        } catch (const std::filesystem::filesystem_error& e) {
            throw core::TradingPlatformException(
                fmt::format("Cannot create results directory '{}': {}", results_directory_, e.what()));
        }

        std::filesystem::path path = std::filesystem::path(results_directory_) /
                                     fmt::format("{}-{}.json", prefix, fileTimestamp());
        std::ofstream ofs(path);
        if (!ofs.is_open()) {
            throw core::TradingPlatformException(fmt::format("Cannot open results file '{}'", path.string()));
        }
        ofs << document.dump(2) << '\n';
        if (!ofs) {
            throw core::TradingPlatformException(fmt::format("Failed writing results file '{}'", path.string()));
        }

        core::logging::getLogger()->info("Results saved to: {}", path.string());
        return path.string();
    }

} // namespace backtester
