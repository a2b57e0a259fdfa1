//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_COMMON_RPC_PIPE_SOCKET_BASE_HPP_INCLUDED
#define DDPRPC_COMMON_RPC_PIPE_SOCKET_BASE_HPP_INCLUDED

#include "io/io.hpp"
#include "logging.hpp"
#include "rpc/rpc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <functional>
#include <string>

namespace ddprpc
{
namespace common
{
namespace rpc
{
namespace pipe
{

/// Line framing (NDJSON) of text frames over a stream socket.
///
/// Every frame is a single line terminated by `\n`; an optional `\r` before it is ignored, so as empty lines.
///
class SocketBase
{
public:
    struct IoState final
    {
        io::OwnFd                   fd;
        std::string                 rx_buffer;
        std::string                 tx_queue;
        std::function<int(Payload)> on_rx_frame;

    };  // IoState

    /// Max length of a single frame; a longer line is treated as a broken stream.
    static constexpr std::size_t FrameMaxSize = 1ULL << 20ULL;  // 1 MB

    /// Max size of outgoing bytes waiting for the socket to become writable again.
    static constexpr std::size_t TxQueueMaxSize = 4ULL << 20ULL;  // 4 MB

    SocketBase(const SocketBase&)                = delete;
    SocketBase(SocketBase&&) noexcept            = delete;
    SocketBase& operator=(const SocketBase&)     = delete;
    SocketBase& operator=(SocketBase&&) noexcept = delete;

protected:
    SocketBase()  = default;
    ~SocketBase() = default;

    Logger& logger() const noexcept
    {
        return *logger_;
    }

    /// Sends a single frame (never blocks).
    ///
    /// Whatever the socket can't take right now is queued (`IoState::tx_queue`) in order,
    /// and has to be flushed once the socket becomes writable.
    ///
    /// @return Zero if the frame is sent or queued; `EMSGSIZE` if the frame is too large (nothing is sent);
    ///         `ENOBUFS` if the queue would exceed its limit; otherwise `errno` of the socket failure.
    ///
    CETL_NODISCARD int send(IoState& io_state, const Payload payload) const;

    /// Writes as much of the queued bytes as the socket takes (never blocks).
    ///
    /// @return Zero on success (even if something is still queued), otherwise `errno` of the socket failure.
    ///
    CETL_NODISCARD int flushTxQueue(IoState& io_state) const;

    /// Reads whatever is available at the socket, and delivers every complete line to `on_rx_frame`.
    ///
    /// @return Zero on success (including "nothing to read yet"), `-1` on end of stream,
    ///         otherwise `errno` of the failure.
    ///
    CETL_NODISCARD int receiveData(IoState& io_state) const;

private:
    LoggerPtr logger_{getLogger("io")};

};  // SocketBase

}  // namespace pipe
}  // namespace rpc
}  // namespace common
}  // namespace ddprpc

#endif  // DDPRPC_COMMON_RPC_PIPE_SOCKET_BASE_HPP_INCLUDED
