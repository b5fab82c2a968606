// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <exception>   // Needed for std::exception
#include <memory>      // For std::shared_ptr

// Project includes
#include "logging.hpp"          // For logging functionality
#include "exceptions.hpp"       // For custom exception types
#include "datatypes.hpp"
#include "utils.hpp"            // For timestampToString
#include "csv_loader.hpp"       // OHLCV CSV input
#include "strategy_factory.hpp" // JSON config loading
#include "backtester.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <nlohmann/json.hpp>

namespace {

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program << " <prices.csv> [config.json]" << std::endl;
        std::cerr << "  prices.csv   OHLCV file with header Date,Open,High,Low,Close,Volume" << std::endl;
        std::cerr << "  config.json  strategy/backtest parameters (defaults used when omitted)" << std::endl;
    }

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        printUsage(argv[0]);
        return 2;
    }

    // Define logger pointer early in the main scope
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        // --- Initialize Logging ---
        core::logging::initialize("backtest_cli", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Backtest CLI starting...");

        // --- Load Run Configuration ---
        backtester::RunConfig run_config;
        if (argc == 3) {
            const std::string config_path = argv[2];
            logger->info("Loading run config from: {}", config_path);
            run_config = backtester::Backtester::parseRunConfig(
                strategy_engine::StrategyFactory::loadJsonFile(config_path));
        } else {
            logger->info("No config file given, using default parameters.");
        }

        // --- Load Price Data ---
        data::CsvPriceLoader loader(argv[1]);
        core::PriceSeries series = loader.load();

        // --- Run Backtest ---
        backtester::Backtester the_backtester(run_config.backtest);
        backtester::BacktestResult result = the_backtester.run(series, run_config.strategy);

        // --- Report ---
        for (const auto& trade : result.trades) {
            logger->info("Trade: {} @ {:.2f} -> {} @ {:.2f}, {} shares, PnL {:.2f} ({:.2f}%)",
                         core::utils::timestampToString(trade.entry_time), trade.entry_price,
                         core::utils::timestampToString(*trade.exit_time), *trade.exit_price,
                         trade.shares, trade.pnl, trade.return_pct * 100.0);
        }
        if (result.open_trade) {
            logger->info("Open position: {} shares since {} @ {:.2f}",
                         result.open_trade->shares,
                         core::utils::timestampToString(result.open_trade->entry_time),
                         result.open_trade->entry_price);
        }
        result.report.logReport();

        logger->info("Backtest CLI finished.");

    // --- Exception Handling ---
    } catch (const core::InvalidInputException& ex) {
        std::cerr << "Invalid input (" << ex.field() << "): " << ex.what() << std::endl;
        if (logger) logger->critical("Invalid input ({}): {}", ex.field(), ex.what());
        return 1;
    } catch (const core::BacktestEngineException& ex) {
        std::cerr << "Backtest Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Backtest Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
