//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_SDK_EXECUTION_HPP_INCLUDED
#define DDPRPC_SDK_EXECUTION_HPP_INCLUDED

#include "ddprpc/platform/defines.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <utility>

namespace ddprpc
{
namespace sdk
{

/// Deferred asynchronous operation, which emits exactly one `Result`.
///
/// Nothing happens until a receiver is submitted; the result is emitted on the executor thread
/// (or right away from within `submit` if the operation could not be started at all).
///
template <typename Result_>
class SenderOf
{
public:
    using Ptr    = std::unique_ptr<SenderOf>;
    using Result = Result_;

    SenderOf(SenderOf&&)                 = delete;
    SenderOf(const SenderOf&)            = delete;
    SenderOf& operator=(SenderOf&&)      = delete;
    SenderOf& operator=(const SenderOf&) = delete;

    virtual ~SenderOf() = default;

    /// Starts the operation. The sender may be destroyed right after this call.
    ///
    template <typename Receiver>
    void submit(Receiver&& receiver)
    {
        submitImpl([receiver = std::forward<Receiver>(receiver)](Result&& result) mutable {
            //
            receiver(std::move(result));
        });
    }

protected:
    SenderOf() = default;

    virtual void submitImpl(std::function<void(Result&&)>&& receiver) = 0;

};  // SenderOf

namespace detail
{

template <typename Result>
class ReadySender final : public SenderOf<Result>
{
public:
    explicit ReadySender(Result&& result)
        : result_{std::move(result)}
    {
    }

protected:
    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        receiver(std::move(result_));
    }

private:
    Result result_;

};  // ReadySender

}  // namespace detail

/// Makes a sender of an already known result (f.e. a failure detected before anything goes to the wire).
///
template <typename Result, typename... Args>
typename SenderOf<Result>::Ptr just(Args&&... args)
{
    return std::make_unique<detail::ReadySender<Result>>(Result{std::forward<Args>(args)...});
}

template <typename Result, typename Receiver>
void submit(std::unique_ptr<SenderOf<Result>>& sender, Receiver&& receiver)
{
    sender->submit(std::forward<Receiver>(receiver));
}

/// Submits the sender, and spins the executor (with its awaitable resources) until the result is emitted.
///
/// `should_interrupt` is checked on every spin; once it returns `true` the `interrupt` action is invoked
/// (only once), and the wait goes on until the operation emits its result. So the `interrupt` action
/// must make the operation complete (f.e. by disconnecting the client).
///
template <typename Result, typename Executor, typename ShouldInterrupt, typename Interrupt>
Result sync_wait(Executor&                      executor,
                 typename SenderOf<Result>::Ptr sender,
                 ShouldInterrupt&&              should_interrupt,
                 Interrupt&&                    interrupt)
{
    // Shared with the receiver, which might be called after an (unexpected) exit from here.
    const auto maybe_result = std::make_shared<cetl::optional<Result>>();
    sender->submit([maybe_result](Result&& result) {
        //
        maybe_result->emplace(std::move(result));
    });
    sender.reset();

    bool is_interrupted = false;
    platform::spinUntil(executor, [&] {
        //
        if (maybe_result->has_value())
        {
            return true;
        }
        if (!is_interrupted && should_interrupt())
        {
            is_interrupted = true;
            interrupt();
        }
        return maybe_result->has_value();
    });

    return std::move(**maybe_result);
}

/// Submits the sender, and spins the executor until the result is emitted.
///
template <typename Result, typename Executor>
Result sync_wait(Executor& executor, typename SenderOf<Result>::Ptr sender)
{
    return sync_wait<Result>(executor, std::move(sender), [] { return false; }, [] {});
}

}  // namespace sdk
}  // namespace ddprpc

#endif  // DDPRPC_SDK_EXECUTION_HPP_INCLUDED
