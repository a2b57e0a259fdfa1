//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_PLATFORM_DEFINES_HPP_INCLUDED
#define DDPRPC_PLATFORM_DEFINES_HPP_INCLUDED

#include "linux/epoll_single_threaded_executor.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstring>

namespace ddprpc
{
namespace platform
{

using SingleThreadedExecutor = Linux::EpollSingleThreadedExecutor;

/// Max time to block on awaitable resources, so that the stop condition is re-checked at least that often.
constexpr libcyphal::Duration MaxPollingBlockTime = std::chrono::milliseconds{250};

/// Spins the executor (its callbacks and awaitable resources) until the condition is met.
///
/// The condition is evaluated after every step, so it may also be used to react on external events
/// (f.e. a termination signal).
///
template <typename Executor, typename Condition>
void spinUntil(Executor& executor, Condition&& condition)
{
    libcyphal::Duration worst_lateness{};
    std::size_t         spins = 0;

    while (!condition())
    {
        ++spins;
        const auto spin_result = executor.spinOnce();
        worst_lateness         = std::max(worst_lateness, spin_result.worst_lateness);
        if (condition())
        {
            break;
        }

        auto block_time = MaxPollingBlockTime;
        if (spin_result.next_exec_time)
        {
            // Nothing to wait for if some callback is already due.
            block_time = std::max(libcyphal::Duration::zero(),
                                  std::min(block_time, *spin_result.next_exec_time - executor.now()));
        }
        if (const int err = executor.pollAwaitableResourcesFor(cetl::make_optional(block_time)))
        {
            spdlog::warn("Polling of awaitable resources has failed: {}.", std::strerror(err));
        }
    }

    if (spins > 0)
    {
        spdlog::trace("Spinning is done (spins={}, worst_lateness={}us).",
                      spins,
                      std::chrono::duration_cast<std::chrono::microseconds>(worst_lateness).count());
    }
}

}  // namespace platform
}  // namespace ddprpc

#endif  // DDPRPC_PLATFORM_DEFINES_HPP_INCLUDED
