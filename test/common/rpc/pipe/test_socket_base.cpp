//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "rpc/pipe/socket_base.hpp"

#include "io/io.hpp"
#include "rpc/rpc_types.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace
{

using namespace ddprpc::common;             // NOLINT This our main concern here in the unit tests.
using namespace ddprpc::common::rpc::pipe;  // NOLINT This our main concern here in the unit tests.

using testing::Not;
using testing::IsEmpty;
using testing::ElementsAre;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class SocketUnderTest final : public SocketBase
{
public:
    using SocketBase::flushTxQueue;
    using SocketBase::receiveData;
    using SocketBase::send;
};

class TestSocketBase : public testing::Test
{
protected:
    void SetUp() override
    {
        std::array<int, 2> fds{-1, -1};
        ASSERT_THAT(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0, fds.data()), 0);
        io_state_.fd = io::OwnFd{fds[0]};
        peer_fd_     = io::OwnFd{fds[1]};

        io_state_.on_rx_frame = [this](const ddprpc::common::rpc::Payload payload) {
            //
            rx_frames_.emplace_back(payload.data(), payload.size());
            return 0;
        };
    }

    void peerWrite(const std::string& data) const
    {
        ASSERT_THAT(::write(peer_fd_.get(), data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    std::string peerRead() const
    {
        std::array<char, 4096> buffer{};
        const auto             size = ::read(peer_fd_.get(), buffer.data(), buffer.size());
        return (size > 0) ? std::string(buffer.data(), static_cast<std::size_t>(size)) : std::string{};
    }

    /// Reads whatever the peer has got so far (until the read would block).
    std::string peerDrain() const
    {
        std::string            result;
        std::array<char, 4096> buffer{};
        ssize_t                size = 0;
        while ((size = ::recv(peer_fd_.get(), buffer.data(), buffer.size(), MSG_DONTWAIT)) > 0)
        {
            result.append(buffer.data(), static_cast<std::size_t>(size));
        }
        return result;
    }

    /// Sends numbered frames until the socket buffer is full and the rest stays in the queue.
    std::string fillSocketBuffer(const std::size_t frame_size)
    {
        std::string expected;
        for (int i = 0; (i < 1000) && io_state_.tx_queue.empty(); ++i)
        {
            const std::string frame = std::to_string(i) + std::string(frame_size, 'x');
            EXPECT_THAT(socket_.send(io_state_, frame), 0);
            expected += frame + "\n";
        }
        return expected;
    }

    // MARK: Data members:

    // NOLINTBEGIN
    SocketUnderTest          socket_;
    SocketBase::IoState      io_state_;
    io::OwnFd                peer_fd_;
    std::vector<std::string> rx_frames_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestSocketBase, send_appends_line_delimiter)
{
    const std::string frame = R"({"msg":"ping"})";
    EXPECT_THAT(socket_.send(io_state_, frame), 0);
    EXPECT_THAT(peerRead(), frame + "\n");
}

TEST_F(TestSocketBase, send_not_connected)
{
    io_state_.fd.reset();
    EXPECT_THAT(socket_.send(io_state_, "{}"), ENOTCONN);
}

TEST_F(TestSocketBase, send_too_large)
{
    const std::string frame(SocketBase::FrameMaxSize, 'x');
    EXPECT_THAT(socket_.send(io_state_, frame), EMSGSIZE);
}

TEST_F(TestSocketBase, send_queues_when_peer_is_slow)
{
    const auto expected = fillSocketBuffer(16 * 1024);
    ASSERT_THAT(io_state_.tx_queue, Not(IsEmpty()));

    // More frames still go after the queued ones.
    EXPECT_THAT(socket_.send(io_state_, "tail"), 0);

    std::string received;
    for (int i = 0; (i < 1000) && !io_state_.tx_queue.empty(); ++i)
    {
        received += peerDrain();
        EXPECT_THAT(socket_.flushTxQueue(io_state_), 0);
    }
    received += peerDrain();

    EXPECT_THAT(io_state_.tx_queue, IsEmpty());
    EXPECT_THAT(received, expected + "tail\n");
}

TEST_F(TestSocketBase, send_queue_overflow)
{
    const std::string frame(64 * 1024, 'x');
    int               result = 0;
    for (std::size_t total = 0; (result == 0) && (total <= SocketBase::TxQueueMaxSize * 2); total += frame.size())
    {
        result = socket_.send(io_state_, frame);
    }
    EXPECT_THAT(result, ENOBUFS);
    EXPECT_THAT(io_state_.tx_queue.size(), testing::Le(SocketBase::TxQueueMaxSize));
}

TEST_F(TestSocketBase, flush_to_closed_peer)
{
    fillSocketBuffer(16 * 1024);
    ASSERT_THAT(io_state_.tx_queue, Not(IsEmpty()));

    peer_fd_.reset();
    EXPECT_THAT(socket_.flushTxQueue(io_state_), testing::AnyOf(EPIPE, ECONNRESET));
}

TEST_F(TestSocketBase, receive_splits_lines)
{
    peerWrite("{\"a\":1}\n{\"b\":2}\r\n\n{\"c\":");
    EXPECT_THAT(socket_.receiveData(io_state_), 0);
    EXPECT_THAT(rx_frames_, ElementsAre(R"({"a":1})", R"({"b":2})"));
    EXPECT_THAT(io_state_.rx_buffer, R"({"c":)");

    // The rest of the partial frame arrives later.
    peerWrite("3}\n");
    EXPECT_THAT(socket_.receiveData(io_state_), 0);
    EXPECT_THAT(rx_frames_, ElementsAre(R"({"a":1})", R"({"b":2})", R"({"c":3})"));
    EXPECT_THAT(io_state_.rx_buffer, IsEmpty());
}

TEST_F(TestSocketBase, receive_nothing_yet)
{
    EXPECT_THAT(socket_.receiveData(io_state_), 0);
    EXPECT_THAT(rx_frames_, IsEmpty());
}

TEST_F(TestSocketBase, receive_end_of_stream)
{
    peer_fd_.reset();
    EXPECT_THAT(socket_.receiveData(io_state_), -1);
}

TEST_F(TestSocketBase, receive_stops_when_closed_by_handler)
{
    io_state_.on_rx_frame = [this](const ddprpc::common::rpc::Payload payload) {
        //
        rx_frames_.emplace_back(payload.data(), payload.size());
        io_state_.fd.reset();
        return 0;
    };

    peerWrite("first\nsecond\n");
    EXPECT_THAT(socket_.receiveData(io_state_), 0);
    EXPECT_THAT(rx_frames_, ElementsAre("first"));
}

TEST_F(TestSocketBase, receive_too_large)
{
    // No line delimiter at all - the buffer grows beyond the max frame size.
    const std::string chunk(4096, 'x');
    const std::size_t max_total = SocketBase::FrameMaxSize + chunk.size();
    int               result    = 0;
    for (std::size_t total = 0; (result == 0) && (total <= max_total); total += chunk.size())
    {
        peerWrite(chunk);
        result = socket_.receiveData(io_state_);
    }
    EXPECT_THAT(result, EMSGSIZE);
    EXPECT_THAT(rx_frames_, IsEmpty());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
