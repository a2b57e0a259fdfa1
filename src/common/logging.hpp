//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_COMMON_LOGGING_HPP_INCLUDED
#define DDPRPC_COMMON_LOGGING_HPP_INCLUDED

#include "common_helpers.hpp"

#include <cetl/cetl.hpp>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <array>
#include <memory>
#include <string>

namespace ddprpc
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Names of the subsystem loggers:
/// - `io`  - sockets, descriptors and addresses;
/// - `rpc` - framing, the handshake and call correlation;
/// - `sdk` - the session, job polling and the client facade;
/// - `cli` - the command line tool.
///
constexpr std::array<const char*, 4> SubsystemLoggerNames{"io", "rpc", "sdk", "cli"};

/// Registers all subsystem loggers as clones of the given one (so they share its sinks and pattern).
///
inline void registerSubsystemLoggers(const LoggerPtr& prototype)
{
    for (const auto* const name : SubsystemLoggerNames)
    {
        spdlog::register_logger(prototype->clone(name));
    }
}

/// Gets a named logger; if not registered yet, it's derived from the default one.
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    LoggerPtr logger = spdlog::get(name);
    if (!logger)
    {
        const auto default_logger = spdlog::default_logger();
        CETL_DEBUG_ASSERT(default_logger, "");

        logger = default_logger->clone(name);
        performWithoutThrowing([&logger] {
            //
            spdlog::register_logger(logger);
        });
    }
    return logger;
}

}  // namespace common
}  // namespace ddprpc

#endif  // DDPRPC_COMMON_LOGGING_HPP_INCLUDED
