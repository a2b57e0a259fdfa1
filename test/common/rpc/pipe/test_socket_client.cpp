//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "rpc/pipe/socket_client.hpp"

#include "io/io.hpp"
#include "io/socket_address.hpp"
#include "rpc/pipe/client_pipe.hpp"
#include "rpc/rpc_types.hpp"

#include <ddprpc/platform/defines.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace
{

using namespace ddprpc::common;             // NOLINT This our main concern here in the unit tests.
using namespace ddprpc::common::rpc::pipe;  // NOLINT This our main concern here in the unit tests.

using testing::Ne;
using testing::AnyOf;
using testing::IsEmpty;
using testing::ElementsAre;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestSocketClient : public testing::Test
{
protected:
    void SetUp() override
    {
        const auto        name       = "unix-abstract:ddprpc-test-socket-client-" + std::to_string(::getpid());
        auto              maybe_addr = io::SocketAddress::parse(name, 0);
        const auto* const addr       = cetl::get_if<io::SocketAddress::ParseResult::Success>(&maybe_addr);
        ASSERT_NE(addr, nullptr);
        address_ = *addr;

        listen_fd_ = io::OwnFd{::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0)};
        ASSERT_TRUE(listen_fd_.valid());
        const auto raw_addr = address_.getRaw();
        ASSERT_THAT(::bind(listen_fd_.get(), raw_addr.first, raw_addr.second), 0);
        ASSERT_THAT(::listen(listen_fd_.get(), 1), 0);

        client_ = std::make_unique<SocketClient>(executor_, address_);
    }

    void TearDown() override
    {
        client_.reset();
    }

    ClientPipe::EventHandler recordEvents()
    {
        return [this](const ClientPipe::Event::Var& event_var) {
            //
            cetl::visit(cetl::make_overloaded(
                            [this](const ClientPipe::Event::Connected&) { events_.emplace_back("connected"); },
                            [this](const ClientPipe::Event::Disconnected& disconnected) {
                                events_.emplace_back("disconnected");
                                disconnect_code_ = disconnected.error_code;
                            },
                            [this](const ClientPipe::Event::Message& message) {
                                messages_.emplace_back(message.payload.data(), message.payload.size());
                            }),
                        event_var);
            return 0;
        };
    }

    /// Spins the executor until the condition is met (or the time is out).
    ///
    template <typename Condition>
    bool spinUntil(Condition&& condition)
    {
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        ddprpc::platform::spinUntil(executor_, [&condition, deadline] {
            //
            return condition() || (std::chrono::steady_clock::now() >= deadline);
        });
        return condition();
    }

    void connectAndAccept()
    {
        ASSERT_THAT(client_->start(recordEvents()), 0);
        ASSERT_TRUE(spinUntil([this] { return !events_.empty(); }));
        ASSERT_THAT(events_, ElementsAre("connected"));
        EXPECT_THAT(client_->state(), ConnectionState::Open);

        server_fd_ = io::OwnFd{::accept4(listen_fd_.get(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC)};
        ASSERT_TRUE(server_fd_.valid());
    }

    void serverWrite(const std::string& data) const
    {
        ASSERT_THAT(::send(server_fd_.get(), data.data(), data.size(), MSG_NOSIGNAL),
                    static_cast<ssize_t>(data.size()));
    }

    /// Reads whatever the server side has got so far.
    std::string serverDrain() const
    {
        std::string            result;
        std::array<char, 4096> buffer{};
        ssize_t                size = 0;
        while ((size = ::recv(server_fd_.get(), buffer.data(), buffer.size(), MSG_DONTWAIT)) > 0)
        {
            result.append(buffer.data(), static_cast<std::size_t>(size));
        }
        return result;
    }

    // MARK: Data members:

    // NOLINTBEGIN
    ddprpc::platform::SingleThreadedExecutor executor_;
    io::SocketAddress                        address_;
    io::OwnFd                                listen_fd_;
    io::OwnFd                                server_fd_;
    std::unique_ptr<SocketClient>            client_;
    std::vector<std::string>                 events_;
    std::vector<std::string>                 messages_;
    int                                      disconnect_code_{0};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestSocketClient, send_and_receive)
{
    EXPECT_THAT(client_->send("{}"), ENOTCONN);

    connectAndAccept();

    EXPECT_THAT(client_->send(R"({"msg":"ping"})"), 0);
    EXPECT_THAT(serverDrain(), "{\"msg\":\"ping\"}\n");

    const std::string reply = "{\"msg\":\"pong\"}\n";
    serverWrite(reply);
    EXPECT_TRUE(spinUntil([this] { return !messages_.empty(); }));
    EXPECT_THAT(messages_, ElementsAre(R"({"msg":"pong"})"));

    client_->close();
    EXPECT_THAT(events_, ElementsAre("connected", "disconnected"));
    EXPECT_THAT(disconnect_code_, 0);
    EXPECT_THAT(client_->state(), ConnectionState::Closed);
}

TEST_F(TestSocketClient, queued_output_is_flushed_in_order)
{
    connectAndAccept();

    // Much more than the socket buffer takes at once (but less than the send queue bound).
    std::string expected;
    for (int i = 0; i < 128; ++i)
    {
        const std::string frame = std::to_string(i) + ":" + std::string(16 * 1024, 'x');
        ASSERT_THAT(client_->send(frame), 0) << i;
        expected += frame + "\n";
    }

    // Meanwhile, the server replies - reading is not blocked by the pending output.
    const std::string reply = "{\"ok\":true}\n";
    serverWrite(reply);

    std::string received;
    EXPECT_TRUE(spinUntil([this, &received, &expected] {
        //
        received += serverDrain();
        return (received.size() >= expected.size()) && !messages_.empty();
    }));
    EXPECT_TRUE(received == expected) << "received=" << received.size() << ", expected=" << expected.size();
    EXPECT_THAT(messages_, ElementsAre(R"({"ok":true})"));
    EXPECT_THAT(events_, ElementsAre("connected"));
}

TEST_F(TestSocketClient, send_queue_overflow)
{
    connectAndAccept();

    // The server never reads.
    const std::string frame(64 * 1024, 'x');
    int               result = 0;
    for (int i = 0; (result == 0) && (i < 1000); ++i)
    {
        result = client_->send(frame);
    }
    EXPECT_THAT(result, ENOBUFS);

    // Overflow is reported to the sender; the connection itself is still there.
    EXPECT_THAT(client_->state(), ConnectionState::Open);
    EXPECT_THAT(events_, ElementsAre("connected"));
}

TEST_F(TestSocketClient, server_gone_while_flushing)
{
    connectAndAccept();

    for (int i = 0; i < 64; ++i)
    {
        ASSERT_THAT(client_->send(std::string(16 * 1024, 'x')), 0) << i;
    }
    server_fd_.reset();

    EXPECT_TRUE(spinUntil([this] { return events_.size() > 1; }));
    EXPECT_THAT(events_, ElementsAre("connected", "disconnected"));
    EXPECT_THAT(disconnect_code_, AnyOf(EPIPE, ECONNRESET));
    EXPECT_THAT(client_->state(), ConnectionState::Closed);

    // Nothing is sent (nor queued) once closed.
    EXPECT_THAT(client_->send("{}"), ENOTCONN);
}

TEST_F(TestSocketClient, connection_refused)
{
    listen_fd_.reset();

    // Unix domain sockets refuse right away.
    EXPECT_THAT(client_->start(recordEvents()), Ne(0));
    EXPECT_THAT(client_->state(), ConnectionState::Closed);
    EXPECT_THAT(events_, IsEmpty());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
