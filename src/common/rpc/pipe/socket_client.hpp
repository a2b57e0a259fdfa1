//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_COMMON_RPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED
#define DDPRPC_COMMON_RPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED

#include "client_pipe.hpp"
#include "ddprpc/platform/posix_executor_extension.hpp"
#include "io/socket_address.hpp"
#include "rpc/rpc_types.hpp"
#include "socket_base.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

namespace ddprpc
{
namespace common
{
namespace rpc
{
namespace pipe
{

/// Client pipe over a stream socket (TCP or Unix domain).
///
/// Connection is non-blocking: `start` initiates it, and completion is detected by socket writability.
/// Once open, the socket is watched for readability, and also for writability while there is queued output.
///
class SocketClient final : public SocketBase, public ClientPipe
{
public:
    SocketClient(libcyphal::IExecutor& executor, const io::SocketAddress& address);

    SocketClient(const SocketClient&)                = delete;
    SocketClient(SocketClient&&) noexcept            = delete;
    SocketClient& operator=(const SocketClient&)     = delete;
    SocketClient& operator=(SocketClient&&) noexcept = delete;

    ~SocketClient() override = default;

    // ClientPipe
    //
    CETL_NODISCARD int             start(EventHandler event_handler) override;
    CETL_NODISCARD int             send(const Payload payload) override;
    void                           close() override;
    CETL_NODISCARD ConnectionState state() const override
    {
        return state_;
    }

private:
    using Trigger = platform::IPosixExecutorExtension::Trigger;

    CETL_NODISCARD int openSocket();
    void               watch(const Trigger::Variant& trigger, void (SocketClient::*const handler)());
    void               onConnectCompleted();
    void               onDataAvailable();
    void               onReadyToFlush();
    void               shutdown(const int error_code);

    const io::SocketAddress                  address_;
    platform::IPosixExecutorExtension* const posix_executor_ext_;
    ConnectionState                          state_;
    IoState                                  io_state_;
    libcyphal::IExecutor::Callback::Any      fd_callback_;
    EventHandler                             event_handler_;

};  // SocketClient

}  // namespace pipe
}  // namespace rpc
}  // namespace common
}  // namespace ddprpc

#endif  // DDPRPC_COMMON_RPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED
