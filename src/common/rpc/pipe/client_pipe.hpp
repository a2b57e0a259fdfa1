//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_COMMON_RPC_PIPE_CLIENT_PIPE_HPP_INCLUDED
#define DDPRPC_COMMON_RPC_PIPE_CLIENT_PIPE_HPP_INCLUDED

#include "rpc/rpc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>

namespace ddprpc
{
namespace common
{
namespace rpc
{
namespace pipe
{

/// Duplex text frame channel to the server.
///
/// The pipe is restartable: once it is `Closed` (either explicitly or because of a connection loss),
/// it could be started again to establish a new connection.
///
class ClientPipe
{
public:
    using Ptr = std::unique_ptr<ClientPipe>;

    struct Event final
    {
        struct Connected final
        {};
        struct Disconnected final
        {
            /// Zero if the pipe was closed explicitly, otherwise `errno` of the connection failure.
            int error_code;
        };
        struct Message final
        {
            Payload payload;

        };  // Message

        using Var = cetl::variant<Message, Connected, Disconnected>;

    };  // Event

    using EventHandler = std::function<int(const Event::Var&)>;

    ClientPipe(const ClientPipe&)                = delete;
    ClientPipe(ClientPipe&&) noexcept            = delete;
    ClientPipe& operator=(const ClientPipe&)     = delete;
    ClientPipe& operator=(ClientPipe&&) noexcept = delete;

    virtual ~ClientPipe() = default;

    /// Starts connecting to the server.
    ///
    /// The `Connected` event is delivered (asynchronously) once connection is established,
    /// or the `Disconnected` one if connection attempt has failed.
    ///
    /// @return Zero if connection attempt has been initiated; `EALREADY` if the pipe is not closed.
    ///
    CETL_NODISCARD virtual int start(EventHandler event_handler) = 0;

    /// Sends a single frame; `ENOTCONN` if the pipe is not open.
    ///
    CETL_NODISCARD virtual int send(const Payload payload) = 0;

    /// Closes the connection (if any), and delivers `Disconnected{0}` event.
    ///
    /// Does nothing if the pipe is already closed.
    ///
    virtual void close() = 0;

    CETL_NODISCARD virtual ConnectionState state() const = 0;

protected:
    ClientPipe() = default;

};  // ClientPipe

}  // namespace pipe
}  // namespace rpc
}  // namespace common
}  // namespace ddprpc

#endif  // DDPRPC_COMMON_RPC_PIPE_CLIENT_PIPE_HPP_INCLUDED
