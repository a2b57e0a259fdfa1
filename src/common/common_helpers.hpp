//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_COMMON_HELPERS_HPP_INCLUDED
#define DDPRPC_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <utility>

namespace ddprpc
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

/// Milliseconds since the Unix epoch (wall clock).
///
inline std::int64_t epochMillis() noexcept
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    return duration_cast<milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

/// Whole milliseconds of the given duration (for logging).
///
template <typename Duration>
std::int64_t toMillis(const Duration duration) noexcept
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

}  // namespace common
}  // namespace ddprpc

#endif  // DDPRPC_COMMON_HELPERS_HPP_INCLUDED
