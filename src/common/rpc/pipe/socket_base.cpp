//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_base.hpp"

#include "ddprpc/platform/posix_utils.hpp"
#include "rpc/rpc_types.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace ddprpc
{
namespace common
{
namespace rpc
{
namespace pipe
{
namespace
{

constexpr std::size_t RxChunkSize = 4096;

}  // namespace

int SocketBase::send(IoState& io_state, const Payload payload) const
{
    if (!io_state.fd.valid())
    {
        return ENOTCONN;
    }
    if (payload.size() >= FrameMaxSize)
    {
        logger_->error("SocketBase: Frame is too large to send (fd={}, size={}).", io_state.fd.get(), payload.size());
        return EMSGSIZE;
    }
    if ((io_state.tx_queue.size() + payload.size() + 1) > TxQueueMaxSize)
    {
        logger_->error("SocketBase: Peer doesn't take data - send queue is full (fd={}, queued={}).",
                       io_state.fd.get(),
                       io_state.tx_queue.size());
        return ENOBUFS;
    }

    // Frames always go through the queue, so that a line is never interleaved with a partially sent one.
    io_state.tx_queue.append(payload.data(), payload.size());
    io_state.tx_queue.push_back('\n');
    logger_->trace("SocketBase: Sending frame (fd={}, size={}).", io_state.fd.get(), payload.size());

    return flushTxQueue(io_state);
}

int SocketBase::flushTxQueue(IoState& io_state) const
{
    auto&       queue   = io_state.tx_queue;
    std::size_t written = 0;
    int         result  = 0;
    while (written < queue.size())
    {
        ssize_t bytes_sent = 0;
        if (const int err = platform::posixSyscallResult(bytes_sent, [&io_state, &queue, written] {
                //
                return ::send(io_state.fd.get(),
                              queue.data() + written,
                              queue.size() - written,
                              MSG_DONTWAIT | MSG_NOSIGNAL);
            }))
        {
            if ((err != EAGAIN) && (err != EWOULDBLOCK))
            {
                logger_->error("SocketBase: Failed to send (fd={}): {}.", io_state.fd.get(), std::strerror(err));
                result = err;
            }
            break;
        }
        written += static_cast<std::size_t>(bytes_sent);
    }
    queue.erase(0, written);

    if ((result == 0) && !queue.empty())
    {
        logger_->trace("SocketBase: Send buffer is full (fd={}, queued={}).", io_state.fd.get(), queue.size());
    }
    return result;
}

int SocketBase::receiveData(IoState& io_state) const
{
    // 1. Read the next chunk of the stream.
    //
    std::array<char, RxChunkSize> chunk{};
    ssize_t                       bytes_read = 0;
    if (const auto err = platform::posixSyscallResult(bytes_read, [&io_state, &chunk] {
            //
            return ::recv(io_state.fd.get(), chunk.data(), chunk.size(), MSG_DONTWAIT);
        }))
    {
        if ((err == EAGAIN) || (err == EWOULDBLOCK))
        {
            // No data available yet - that's ok, the next attempt will try to read again.
            //
            logger_->trace("SocketBase: Read would block (fd={}).", io_state.fd.get());
            return 0;
        }
        logger_->error("SocketBase: Failed to read (fd={}): {}.", io_state.fd.get(), std::strerror(err));
        return err;
    }
    if (bytes_read == 0)
    {
        logger_->debug("SocketBase: Zero bytes read - end of stream (fd={}).", io_state.fd.get());
        return -1;  // EOF
    }
    io_state.rx_buffer.append(chunk.data(), static_cast<std::size_t>(bytes_read));

    // 2. Split complete lines out of the buffer.
    //
    std::vector<std::string> frames;
    std::size_t              line_begin = 0;
    for (auto line_end = io_state.rx_buffer.find('\n'); line_end != std::string::npos;
         line_end      = io_state.rx_buffer.find('\n', line_begin))
    {
        auto line_size = line_end - line_begin;
        if ((line_size > 0) && (io_state.rx_buffer[line_end - 1] == '\r'))
        {
            --line_size;
        }
        if (line_size > 0)
        {
            frames.emplace_back(io_state.rx_buffer, line_begin, line_size);
        }
        line_begin = line_end + 1;
    }
    io_state.rx_buffer.erase(0, line_begin);

    if (io_state.rx_buffer.size() > FrameMaxSize)
    {
        logger_->error("SocketBase: Frame is too large - closing invalid stream (fd={}, buffered={}).",
                       io_state.fd.get(),
                       io_state.rx_buffer.size());
        return EMSGSIZE;
    }

    // 3. Deliver frames one by one.
    //    The handler may close the socket, so stop delivering as soon as it happens.
    //
    for (const auto& frame : frames)
    {
        if (!io_state.fd.valid())
        {
            break;
        }
        if (const int err = io_state.on_rx_frame(Payload{frame.data(), frame.size()}))
        {
            logger_->warn("SocketBase: Failed to handle frame (fd={}): {}.", io_state.fd.get(), std::strerror(err));
        }
    }

    return 0;
}

}  // namespace pipe
}  // namespace rpc
}  // namespace common
}  // namespace ddprpc
