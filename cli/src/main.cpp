// cli/src/main.cpp

#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <exception>
#include <chrono>

#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "config.hpp"
#include "config_loader.hpp"
#include "database_manager.hpp"
#include "sqlite_price_provider.hpp"
#include "csv_bar_loader.hpp"
#include "price_provider.hpp"
#include "backtester.hpp"
#include "result_writer.hpp"
#include "parameter_optimizer.hpp"
#include "trading_cycle.hpp"
#include "execution_sink.hpp"
#include "metrics_sink.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {

    using Options = std::map<std::string, std::string>;

    void printUsage() {
        std::cerr << "Usage:\n"
                  << "  reversion_cli backtest   [--config <file>] (--db <sqlite> | --csv <file>) [--out <dir>]\n"
                  << "                           [--instrument <key>] [--interval <iv>]\n"
                  << "  reversion_cli optimize   [--config <file>] (--db <sqlite> | --csv <file>) [--out <dir>]\n"
                  << "                           [--instrument <key>] [--interval <iv>]\n"
                  << "  reversion_cli paper      [--config <file>] (--db <sqlite> | --csv <file>)\n"
                  << "  reversion_cli import-csv --db <sqlite> --csv <file> --instrument <key> --interval <iv>\n"
                  << "Every command accepts --log-dir <dir> (default: logs).\n";
    }

    // --name value pairs after the subcommand
    Options parseOptions(int argc, char* argv[]) {
        Options options;
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0 || arg.size() <= 2) {
                throw core::ConfigException("Unexpected argument: " + arg);
            }
            if (i + 1 >= argc) {
                throw core::ConfigException("Missing value for " + arg);
            }
            options[arg.substr(2)] = argv[++i];
        }
        return options;
    }

    std::optional<std::string> option(const Options& options, const std::string& name) {
        auto it = options.find(name);
        if (it == options.end()) return std::nullopt;
        return it->second;
    }

    std::string requireOption(const Options& options, const std::string& name) {
        std::optional<std::string> value = option(options, name);
        if (!value || value->empty()) {
            throw core::ConfigException("Missing required option --" + name);
        }
        return *value;
    }

    core::EngineConfig loadConfig(const Options& options) {
        core::EngineConfig config;
        if (std::optional<std::string> path = option(options, "config")) {
            config = core::ConfigLoader::fromFile(*path);
        } else {
            core::logging::getLogger()->info("No --config given, using defaults and environment overrides");
            core::ConfigLoader::applyEnvironmentOverrides(config);
            core::validateConfig(config);
        }
        if (std::optional<std::string> instrument = option(options, "instrument")) {
            config.backtest.instrument = *instrument;
        }
        if (std::optional<std::string> interval = option(options, "interval")) {
            config.backtest.interval = *interval;
        }
        if (std::optional<std::string> out = option(options, "out")) {
            config.backtest.results_directory = *out;
        }
        return config;
    }

    // Bars from --csv or --db, limited to the configured window
    core::TimeSeries<core::PriceBar> loadBars(const Options& options, const core::EngineConfig& config) {
        std::optional<std::string> csv_path = option(options, "csv");
        std::optional<std::string> db_path = option(options, "db");
        if (csv_path && db_path) {
            throw core::ConfigException("Use either --csv or --db, not both");
        }

        core::TimeSeries<core::PriceBar> history;
        if (csv_path) {
            history = data::CsvBarLoader::load(*csv_path, "csv");
        } else if (db_path) {
            data::DatabaseManager db(*db_path);
            if (!db.connect()) {
                throw core::DataLoadException("Cannot open database: " + *db_path);
            }
            core::Timestamp start = config.backtest.start_time.value_or(core::utils::fromUnixMillis(0));
            core::Timestamp end = config.backtest.end_time.value_or(std::chrono::system_clock::now());
            data::SqlitePriceProvider provider(db, config.backtest.instrument, config.backtest.interval, start, end);
            history = provider.getPriceHistory();
        } else {
            throw core::ConfigException("A price source is required: --csv <file> or --db <sqlite>");
        }

        core::TimeSeries<core::PriceBar> bars;
        for (const auto& bar : history) {
            if (config.backtest.start_time && bar.timestamp < *config.backtest.start_time) continue;
            if (config.backtest.end_time && bar.timestamp > *config.backtest.end_time) continue;
            bars.push_back(bar);
        }
        if (bars.empty()) {
            throw core::DataLoadException("No historical data available for the specified period");
        }
        return bars;
    }

    int runBacktest(const Options& options) {
        core::EngineConfig config = loadConfig(options);
        data::VectorPriceProvider provider(loadBars(options, config));

        backtester::BacktestSimulator simulator(config);
        backtester::BacktestResult result = simulator.run(provider);
        result.logMetrics();
        std::cout << result.generateReport() << std::endl;

        backtester::ResultWriter writer(config.backtest.results_directory);
        std::string path = writer.write(result);
        std::cout << "Results saved to: " << path << std::endl;
        return 0;
    }

    int runOptimize(const Options& options) {
        core::EngineConfig config = loadConfig(options);
        core::TimeSeries<core::PriceBar> bars = loadBars(options, config);

        backtester::ParameterOptimizer optimizer(config);
        backtester::OptimizationReport report = optimizer.optimize(bars);

        std::cout << "Top 5 by return:\n";
        for (size_t i = 0; i < report.by_return.size() && i < 5; ++i) {
            const auto& r = report.by_return[i];
            std::cout << "  MA=" << r.ma_period << " StdDev=" << core::decimal::toPlainString(r.std_dev_multiplier)
                      << "x return=" << fmt::format("{:.2f}", r.total_return_percent) << "%"
                      << " sharpe=" << fmt::format("{:.2f}", r.sharpe_ratio)
                      << " maxDD=" << fmt::format("{:.1f}", r.max_drawdown * 100.0) << "%"
                      << " trades=" << r.total_trades << "\n";
        }
        if (!report.balanced.empty()) {
            const auto& best = report.balanced.front();
            std::cout << "Recommended: MA_PERIOD=" << best.ma_period
                      << " STD_DEV_MULTIPLIER=" << core::decimal::toPlainString(best.std_dev_multiplier) << "\n";
        } else {
            std::cout << "No profitable low-risk combination found\n";
        }

        backtester::ResultWriter writer(config.backtest.results_directory);
        std::string path = writer.writeDocument(report.toJson(), "parameter-optimization");
        std::cout << "Results saved to: " << path << std::endl;
        return 0;
    }

    // Feeds bars one at a time through the live trading cycle with a paper sink
    int runPaperReplay(const Options& options) {
        core::EngineConfig config = loadConfig(options);
        core::TimeSeries<core::PriceBar> bars = loadBars(options, config);

        data::VectorPriceProvider provider(core::TimeSeries<core::PriceBar>{});
        live::PaperExecutionSink sink(config.trading.paper_balance, config.backtest.fee_rate);
        live::LoggingMetricsSink metrics;
        core::Timestamp now = bars.front().timestamp;
        live::TradingCycle cycle(config, provider, sink, &metrics, [&now]() { return now; });

        int failed_cycles = 0;
        for (const auto& bar : bars) {
            now = bar.timestamp;
            provider.append(bar);
            if (!cycle.runOnce()) {
                ++failed_cycles;
            }
        }
        int closed = cycle.shutdown();

        live::PortfolioStats stats = sink.getPortfolioStats();
        std::cout << "Paper replay: " << bars.size() << " cycles, " << failed_cycles << " failed, "
                  << closed << " position(s) closed on shutdown\n"
                  << "Closed trades: " << stats.total_trades << " (win rate " << fmt::format("{:.1f}", stats.win_rate)
                  << "%), total PnL " << core::decimal::toString(stats.total_pnl, 2)
                  << ", balance " << core::decimal::toString(sink.getAccountBalance(), 2) << std::endl;
        return failed_cycles == 0 ? 0 : 1;
    }

    int runImportCsv(const Options& options) {
        std::string db_path = requireOption(options, "db");
        std::string csv_path = requireOption(options, "csv");
        std::string instrument = requireOption(options, "instrument");
        std::string interval = requireOption(options, "interval");

        core::TimeSeries<core::PriceBar> bars = data::CsvBarLoader::load(csv_path, "csv");
        if (bars.empty()) {
            throw core::DataLoadException("No valid rows in " + csv_path);
        }

        data::DatabaseManager db(db_path);
        if (!db.connect()) {
            throw core::DataLoadException("Cannot open database: " + db_path);
        }
        if (!db.initializeSchema()) {
            throw core::DataLoadException("Cannot initialize schema in " + db_path);
        }
        if (!db.saveBars(bars, instrument, interval)) {
            throw core::DataLoadException("Failed to save bars into " + db_path);
        }
        std::cout << "Imported " << bars.size() << " bars for " << instrument << " (" << interval << ")" << std::endl;
        return 0;
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        if (argc < 2) {
            printUsage();
            return 1;
        }
        const std::string command = argv[1];
        if (command == "--help" || command == "-h" || command == "help") {
            printUsage();
            return 0;
        }

        Options options = parseOptions(argc, argv);

        core::logging::LogSettings log_settings;
        log_settings.base_filename = "reversion_cli";
        log_settings.directory = option(options, "log-dir").value_or("logs");
        core::logging::initialize(log_settings);
        logger = core::logging::getLogger();
        logger->info("reversion_cli {} starting", command);

        if (command == "backtest") return runBacktest(options);
        if (command == "optimize") return runOptimize(options);
        if (command == "paper") return runPaperReplay(options);
        if (command == "import-csv") return runImportCsv(options);

        std::cerr << "Unknown command: " << command << "\n";
        printUsage();
        return 1;

    } catch (const core::ConfigException& ex) {
        std::cerr << "Configuration Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Configuration Error: {}", ex.what());
        return 1;
    } catch (const core::TradingPlatformException& ex) {
        std::cerr << "Platform Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Platform Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }
}
