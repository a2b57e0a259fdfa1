//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_client.hpp"

#include "ddprpc/platform/posix_executor_extension.hpp"
#include "ddprpc/platform/posix_utils.hpp"
#include "io/socket_address.hpp"
#include "rpc/rpc_types.hpp"
#include "socket_base.hpp"

#include <cetl/cetl.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <utility>

namespace ddprpc
{
namespace common
{
namespace rpc
{
namespace pipe
{

SocketClient::SocketClient(libcyphal::IExecutor& executor, const io::SocketAddress& address)
    : address_{address}
    , posix_executor_ext_{cetl::rtti_cast<platform::IPosixExecutorExtension*>(&executor)}
    , state_{ConnectionState::Closed}
{
    CETL_DEBUG_ASSERT(posix_executor_ext_ != nullptr, "");

    io_state_.on_rx_frame = [this](const Payload line) {
        //
        return event_handler_(Event::Message{line});
    };
}

int SocketClient::start(EventHandler event_handler)
{
    CETL_DEBUG_ASSERT(event_handler, "");

    if (state_ != ConnectionState::Closed)
    {
        return EALREADY;
    }
    if (posix_executor_ext_ == nullptr)
    {
        logger().error("SocketClient: Executor can't await descriptors.");
        return ENOSYS;
    }

    if (const int err = openSocket())
    {
        return err;
    }
    event_handler_ = std::move(event_handler);
    state_         = ConnectionState::Connecting;
    watch(Trigger::Writable{io_state_.fd.get()}, &SocketClient::onConnectCompleted);

    logger().debug("SocketClient: Connecting to '{}' (fd={})...", address_.toString(), io_state_.fd.get());
    return 0;
}

int SocketClient::send(const Payload payload)
{
    if (state_ != ConnectionState::Open)
    {
        return ENOTCONN;
    }

    const bool was_flushing = !io_state_.tx_queue.empty();
    if (const int err = SocketBase::send(io_state_, payload))
    {
        return err;
    }
    if (!was_flushing && !io_state_.tx_queue.empty())
    {
        watch(Trigger::ReadableOrWritable{io_state_.fd.get()}, &SocketClient::onReadyToFlush);
    }
    return 0;
}

void SocketClient::close()
{
    switch (state_)
    {
    case ConnectionState::Connecting:
    case ConnectionState::Open:
        logger().debug("SocketClient: Closing connection to '{}' (fd={}).", address_.toString(), io_state_.fd.get());
        state_ = ConnectionState::Closing;
        shutdown(0);
        break;
    default:
        break;
    }
}

int SocketClient::openSocket()
{
    using SocketResult = io::SocketAddress::SocketResult;

    auto result = address_.socket(SOCK_STREAM);
    if (const auto* const err = cetl::get_if<SocketResult::Failure>(&result))
    {
        return *err;
    }

    io::OwnFd fd = cetl::get<SocketResult::Success>(std::move(result));
    if (const int err = address_.connect(fd))
    {
        return err;
    }

    io_state_.fd = std::move(fd);
    io_state_.rx_buffer.clear();
    io_state_.tx_queue.clear();
    return 0;
}

void SocketClient::watch(const Trigger::Variant& trigger, void (SocketClient::*const handler)())
{
    fd_callback_ = posix_executor_ext_->registerAwaitableCallback(
        [this, handler](const auto&) {
            //
            (this->*handler)();
        },
        trigger);
}

void SocketClient::onConnectCompleted()
{
    // Outcome of non-blocking `connect` is reported via the pending socket error.
    int       so_error = 0;
    socklen_t so_len   = sizeof(so_error);
    if (const int err = platform::posixSyscallError([this, &so_error, &so_len] {
            //
            return ::getsockopt(io_state_.fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &so_len);
        }))
    {
        so_error = err;
    }
    if (so_error != 0)
    {
        logger().error("SocketClient: Can't connect to '{}': {}.", address_.toString(), std::strerror(so_error));
        shutdown(so_error);
        return;
    }

    state_ = ConnectionState::Open;
    watch(Trigger::Readable{io_state_.fd.get()}, &SocketClient::onDataAvailable);

    logger().info("SocketClient: Connected to '{}' (fd={}).", address_.toString(), io_state_.fd.get());
    (void) event_handler_(Event::Connected{});
}

void SocketClient::onDataAvailable()
{
    const int err = receiveData(io_state_);
    if (err == 0)
    {
        return;
    }

    if (err < 0)
    {
        logger().debug("SocketClient: Server has closed the stream.");
        shutdown(ECONNRESET);
    }
    else
    {
        logger().warn("SocketClient: Broken server stream (err={}): {}.", err, std::strerror(err));
        shutdown(err);
    }
}

void SocketClient::onReadyToFlush()
{
    if (const int err = flushTxQueue(io_state_))
    {
        shutdown(err);
        return;
    }
    if (io_state_.tx_queue.empty())
    {
        logger().trace("SocketClient: Send queue is flushed (fd={}).", io_state_.fd.get());
        watch(Trigger::Readable{io_state_.fd.get()}, &SocketClient::onDataAvailable);
    }

    // The same readiness might be for incoming data as well.
    onDataAvailable();
}

void SocketClient::shutdown(const int error_code)
{
    fd_callback_.reset();
    io_state_.fd.reset();
    io_state_.rx_buffer.clear();
    io_state_.tx_queue.clear();
    state_ = ConnectionState::Closed;

    (void) event_handler_(Event::Disconnected{error_code});
}

}  // namespace pipe
}  // namespace rpc
}  // namespace common
}  // namespace ddprpc
