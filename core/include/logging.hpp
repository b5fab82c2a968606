#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Sets up the shared "BacktestLogger": a colored console sink plus a rotating
    // file sink at logs/<base_log_filename>_<YYYYmmdd_HHMMSSZ>.log.
    // SPDLOG_LEVEL, when set, overrides both levels. Call once from main().
    void initialize(const std::string& base_log_filename = "backtest_engine",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Logger used by every module. Without initialize() (tests, library use)
    // this is a console-only logger at warn, or at SPDLOG_LEVEL if set.
    std::shared_ptr<spdlog::logger>& getLogger();

    // "trace" .. "critical", "off"; case-insensitive, unknown strings give info
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
