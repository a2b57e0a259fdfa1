//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_CLI_SETUP_LOGGING_HPP_INCLUDED
#define DDPRPC_CLI_SETUP_LOGGING_HPP_INCLUDED

#include "config.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/env.h>
#include <spdlog/cfg/helpers.h>  // NOLINT
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace ddprpc
{
namespace cli
{
namespace detail
{

constexpr auto DefaultLogFilePath  = "./ddprpc-cli.log";
constexpr auto FlushLevelArgPrefix = "SPDLOG_FLUSH_LEVEL=";
constexpr auto LogPattern          = "[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v";
constexpr auto MaxLogFiles         = 4U;
constexpr auto MaxLogFileSize      = std::size_t{16U} << 20U;  // 16 MiB
constexpr auto MaxLevelsSpecLength = std::size_t{512};

/// Applies flush levels in the same `level,logger=level,...` form as `SPDLOG_LEVEL` uses for levels.
///
/// Loggers without explicit flush level inherit the one of the default logger.
///
inline void applyFlushLevels(const std::string& spec)
{
    if (spec.empty() || (spec.size() > MaxLevelsSpecLength))
    {
        return;
    }

    const auto name_to_level = spdlog::cfg::helpers::extract_key_vals_(spec);  // NOLINT
    for (const auto& entry : name_to_level)
    {
        auto       level_name = entry.second;
        const auto level      = spdlog::level::from_str(spdlog::cfg::helpers::to_lower_(level_name));  // NOLINT
        if ((level == spdlog::level::off) && (level_name != "off"))
        {
            continue;  // unknown level name
        }

        const auto logger = entry.first.empty() ? spdlog::default_logger() : spdlog::get(entry.first);
        if (logger)
        {
            logger->flush_on(level);
        }
    }

    const auto inherited_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&name_to_level, inherited_level](const common::LoggerPtr& logger) {
        //
        const auto& name = logger->name();
        if (!name.empty() && (name_to_level.count(name) == 0))
        {
            logger->flush_on(inherited_level);
        }
    });
}

/// Finds the last `SPDLOG_FLUSH_LEVEL=...` argument (if any).
///
inline cetl::optional<std::string> findFlushLevelsArg(const int argc, const char** const argv)
{
    const std::string           prefix{FlushLevelArgPrefix};
    cetl::optional<std::string> spec;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg{argv[i]};  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.compare(0, prefix.size(), prefix) == 0)
        {
            spec = arg.substr(prefix.size());
        }
    }
    return spec;
}

}  // namespace detail

/// Sets up logging of the command line tool.
///
/// Everything goes to a rotating log file (Info level by default); the console stays reserved
/// for command results and errors. Log file path, levels and flush levels come from the `[logging]`
/// configuration section. Levels could be overridden by the `SPDLOG_LEVEL` environment variable, and then
/// by `SPDLOG_LEVEL=` and `SPDLOG_FLUSH_LEVEL=` arguments (like `SPDLOG_LEVEL=debug,rpc=trace`).
///
/// Throws `spdlog::spdlog_ex` if the log file can't be opened.
///
inline void setupLogging(const int argc, const char** const argv, const Config& config)
{
    const auto log_file_path = config.getLoggingFile().value_or(detail::DefaultLogFilePath);

    spdlog::drop_all();

    const auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_st>(log_file_path,
                                                                                  detail::MaxLogFileSize,
                                                                                  detail::MaxLogFiles);
    file_sink->set_pattern(detail::LogPattern);

    const auto default_logger = std::make_shared<spdlog::logger>("", file_sink);
    spdlog::set_default_logger(default_logger);
    common::registerSubsystemLoggers(default_logger);

    if (const auto levels = config.getLoggingLevel())
    {
        spdlog::cfg::helpers::load_levels(*levels);
    }
    spdlog::cfg::load_env_levels();
    spdlog::cfg::load_argv_levels(argc, argv);

    if (const auto flush_levels = config.getLoggingFlushLevel())
    {
        detail::applyFlushLevels(*flush_levels);
    }
    if (const auto flush_levels = detail::findFlushLevelsArg(argc, argv))
    {
        detail::applyFlushLevels(*flush_levels);
    }

    // Separates runs in the (shared between runs) log file.
    spdlog::info("--------------------------");
}

}  // namespace cli
}  // namespace ddprpc

#endif  // DDPRPC_CLI_SETUP_LOGGING_HPP_INCLUDED
