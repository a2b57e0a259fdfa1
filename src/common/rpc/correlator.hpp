//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_COMMON_RPC_CORRELATOR_HPP_INCLUDED
#define DDPRPC_COMMON_RPC_CORRELATOR_HPP_INCLUDED

#include "pipe/client_pipe.hpp"
#include "rpc/rpc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace ddprpc
{
namespace common
{
namespace rpc
{

/// Multiplexes remote calls over a single client pipe.
///
/// Every call gets a unique request id, and is completed exactly once: by the matching `result`/`error` frame,
/// by its own deadline, or by the connection closure (whichever happens first).
/// Responses may arrive in any order. The correlator also performs the DDP protocol handshake
/// (`connect` -> `connected`/`failed`) on every new connection of the pipe.
///
class Correlator
{
public:
    using Ptr = std::shared_ptr<Correlator>;

    struct Event final
    {
        /// The connection is open and handshaken - calls are allowed.
        struct Connected final
        {};
        struct Disconnected final
        {
            Error reason;
        };

        using Var = cetl::variant<Connected, Disconnected>;

    };  // Event

    using EventHandler = std::function<void(const Event::Var&)>;

    struct Call final
    {
        using Success = Json;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    using Completion = std::function<void(Call::Result&&)>;

    CETL_NODISCARD static Ptr make(libcyphal::IExecutor& executor, pipe::ClientPipe::Ptr client_pipe);

    Correlator(const Correlator&)                = delete;
    Correlator(Correlator&&) noexcept            = delete;
    Correlator& operator=(const Correlator&)     = delete;
    Correlator& operator=(Correlator&&) noexcept = delete;

    virtual ~Correlator() = default;

    /// Starts a new connection (followed by the handshake).
    ///
    /// The event handler receives `Connected` once handshake succeeds,
    /// and `Disconnected` once the connection is closed (for whatever reason).
    ///
    /// @return Zero if connection has been initiated, otherwise `errno` of the pipe failure.
    ///
    CETL_NODISCARD virtual int open(EventHandler event_handler) = 0;

    /// Closes current connection (if any), and fails every pending call with the given reason.
    ///
    virtual void close(Error reason) = 0;

    CETL_NODISCARD virtual ConnectionState connectionState() const = 0;
    CETL_NODISCARD virtual bool            isHandshaken() const    = 0;

    /// Issues a remote method call.
    ///
    /// The completion is always called exactly once, and never from within this method
    /// unless the call could not be sent at all.
    ///
    virtual void call(const std::string&        method,
                      Json                      params,
                      const libcyphal::Duration timeout,
                      Completion                completion) = 0;

    CETL_NODISCARD virtual std::size_t pendingCount() const = 0;

protected:
    Correlator() = default;

};  // Correlator

}  // namespace rpc
}  // namespace common
}  // namespace ddprpc

#endif  // DDPRPC_COMMON_RPC_CORRELATOR_HPP_INCLUDED
