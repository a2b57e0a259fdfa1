//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
#define DDPRPC_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED

#include "ddprpc/platform/posix_executor_extension.hpp"
#include "ddprpc/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/platform/single_threaded_executor.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdint>
#include <cstring>
#include <memory>
#include <sys/epoll.h>
#include <unistd.h>
#include <unordered_map>
#include <utility>

namespace ddprpc
{
namespace platform
{
namespace Linux
{

/// Single-threaded executor which awaits its POSIX resources (file descriptors) with `epoll`.
///
/// Time is taken from the monotonic `steady_clock`.
///
class EpollSingleThreadedExecutor final : public libcyphal::platform::SingleThreadedExecutor,
                                          public IPosixExecutorExtension
{
    using Base = SingleThreadedExecutor;
    using Self = EpollSingleThreadedExecutor;

public:
    EpollSingleThreadedExecutor()
        : epollfd_{::epoll_create1(EPOLL_CLOEXEC)}
    {
        if (epollfd_ < 0)
        {
            const int err = errno;
            spdlog::critical("Failed to create epoll instance: {}.", std::strerror(err));
        }
    }

    EpollSingleThreadedExecutor(const EpollSingleThreadedExecutor&)                = delete;
    EpollSingleThreadedExecutor(EpollSingleThreadedExecutor&&) noexcept            = delete;
    EpollSingleThreadedExecutor& operator=(const EpollSingleThreadedExecutor&)     = delete;
    EpollSingleThreadedExecutor& operator=(EpollSingleThreadedExecutor&&) noexcept = delete;

    ~EpollSingleThreadedExecutor()
    {
        if (epollfd_ >= 0)
        {
            ::close(epollfd_);
        }
    }

    /// Waits (up to the given timeout) for any watched descriptor to become ready,
    /// and schedules callbacks of the ready ones for immediate execution.
    ///
    /// @param timeout Maximum time to block; `nullopt` blocks until a descriptor is ready.
    /// @return Zero on success, otherwise `errno` of the failed `epoll_wait`.
    ///
    CETL_NODISCARD int pollAwaitableResourcesFor(const cetl::optional<libcyphal::Duration> timeout)
    {
        if (epollfd_ < 0)
        {
            return EBADF;
        }

        int timeout_ms = -1;
        if (timeout)
        {
            // Round up, so that the poll never wakes up before the next scheduled callback.
            const auto clamped = std::max(timeout.value(), libcyphal::Duration::zero());
            const auto ms      = std::chrono::duration_cast<std::chrono::milliseconds>(  //
                clamped + std::chrono::milliseconds{1} - libcyphal::Duration{1});
            timeout_ms         = static_cast<int>(std::min<std::int64_t>(ms.count(), INT_MAX));
        }

        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
        std::array<epoll_event, MaxEventsPerPoll> events;
        int                                       ready_count = 0;
        if (const int err = posixSyscallResult(ready_count, [this, &events, timeout_ms] {
                //
                return ::epoll_wait(epollfd_, events.data(), static_cast<int>(events.size()), timeout_ms);
            }))
        {
            return err;
        }

        const auto approx_now = now();
        for (int i = 0; i < ready_count; ++i)
        {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-union-access, cppcoreguidelines-pro-bounds-constant-array-index)
            const int  fd    = events[static_cast<std::size_t>(i)].data.fd;
            const auto found = awaitables_.find(fd);
            if (found != awaitables_.end())
            {
                found->second->scheduleAt(approx_now);
            }
        }
        return 0;
    }

    // MARK: IExecutor

    CETL_NODISCARD libcyphal::TimePoint now() const noexcept override
    {
        using std::chrono::duration_cast;

        const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
        return libcyphal::TimePoint{duration_cast<libcyphal::Duration>(since_epoch)};
    }

    // MARK: IPosixExecutorExtension

    CETL_NODISCARD Callback::Any registerAwaitableCallback(Callback::Function&&    function,
                                                           const Trigger::Variant& trigger) override
    {
        auto node = std::make_shared<AwaitableNode>(*this, registerCallback(std::move(function)));

        const int err = cetl::visit(  //
            cetl::make_overloaded(
                [&node](const Trigger::Readable& readable) {
                    //
                    return node->watch(readable.fd, EPOLLIN);
                },
                [&node](const Trigger::Writable& writable) {
                    //
                    return node->watch(writable.fd, EPOLLOUT);
                },
                [&node](const Trigger::ReadableOrWritable& any) {
                    //
                    return node->watch(any.fd, EPOLLIN | EPOLLOUT);
                }),
            trigger);
        if (err != 0)
        {
            spdlog::error("Failed to watch awaitable descriptor: {}.", std::strerror(err));
        }

        // The returned handle is never scheduled itself; it just owns the node,
        // so that releasing the handle also stops watching the descriptor.
        return registerCallback([node](const auto&) {});
    }

protected:
    // MARK: RTTI

    CETL_NODISCARD cetl::void_ptr _cast_(const cetl::type_id& id) & noexcept override
    {
        if (id == IPosixExecutorExtension::_get_type_id_())
        {
            return static_cast<IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

    CETL_NODISCARD cetl::const_void_ptr _cast_(const cetl::type_id& id) const& noexcept override
    {
        if (id == IPosixExecutorExtension::_get_type_id_())
        {
            return static_cast<const IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

private:
    static constexpr std::size_t MaxEventsPerPoll = 16;

    class AwaitableNode final
    {
    public:
        AwaitableNode(Self& executor, Callback::Any&& callback)
            : executor_{executor}
            , callback_{std::move(callback)}
            , fd_{-1}
        {
        }

        AwaitableNode(const AwaitableNode&)                = delete;
        AwaitableNode(AwaitableNode&&) noexcept            = delete;
        AwaitableNode& operator=(const AwaitableNode&)     = delete;
        AwaitableNode& operator=(AwaitableNode&&) noexcept = delete;

        ~AwaitableNode()
        {
            if (fd_ >= 0)
            {
                executor_.unwatch(fd_, *this);
            }
        }

        CETL_NODISCARD int watch(const int fd, const std::uint32_t events)
        {
            const int err = executor_.watch(fd, events, *this);
            if (err == 0)
            {
                fd_ = fd;
            }
            return err;
        }

        void scheduleAt(const libcyphal::TimePoint exec_time)
        {
            (void) callback_.schedule(Callback::Schedule::Once{exec_time});
        }

    private:
        Self&         executor_;
        Callback::Any callback_;
        int           fd_;

    };  // AwaitableNode

    CETL_NODISCARD int watch(const int fd, const std::uint32_t events, AwaitableNode& node)
    {
        epoll_event ev{};
        ev.events  = events;
        ev.data.fd = fd;  // NOLINT(cppcoreguidelines-pro-type-union-access)

        int err = posixSyscallError([this, fd, &ev] {
            //
            return ::epoll_ctl(epollfd_, EPOLL_CTL_ADD, fd, &ev);
        });
        if (err == EEXIST)
        {
            // The previous node of the same descriptor is still alive (f.e. "Writable" is being replaced by
            // "Readable" one) - just modify the interest, and take the descriptor over.
            err = posixSyscallError([this, fd, &ev] {
                //
                return ::epoll_ctl(epollfd_, EPOLL_CTL_MOD, fd, &ev);
            });
        }
        if (err == 0)
        {
            awaitables_[fd] = &node;
        }
        return err;
    }

    void unwatch(const int fd, const AwaitableNode& node)
    {
        const auto found = awaitables_.find(fd);
        if ((found == awaitables_.end()) || (found->second != &node))
        {
            // The descriptor was already taken over by another node.
            return;
        }
        awaitables_.erase(found);

        // `EBADF` is expected if the descriptor has been closed already (and so auto-removed by the kernel).
        const int err = posixSyscallError([this, fd] {
            //
            return ::epoll_ctl(epollfd_, EPOLL_CTL_DEL, fd, nullptr);
        });
        if ((err != 0) && (err != EBADF) && (err != ENOENT))
        {
            spdlog::warn("Failed to unwatch descriptor (fd={}): {}.", fd, std::strerror(err));
        }
    }

    int                                      epollfd_;
    std::unordered_map<int, AwaitableNode*> awaitables_;

};  // EpollSingleThreadedExecutor

}  // namespace Linux
}  // namespace platform
}  // namespace ddprpc

#endif  // DDPRPC_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
