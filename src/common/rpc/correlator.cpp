//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "correlator.hpp"

#include "common_helpers.hpp"
#include "json_helpers.hpp"
#include "logging.hpp"
#include "pipe/client_pipe.hpp"
#include "rpc/frame.hpp"
#include "rpc/rpc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ddprpc
{
namespace common
{
namespace rpc
{
namespace
{

/// Whether the failed send may have left the stream in an unknown state (f.e. a partially written line).
///
/// Only oversized and unserializable frames are rejected before anything goes to the wire.
///
bool isStreamBroken(const int send_error)
{
    return (send_error != EMSGSIZE) && (send_error != EINVAL);
}

class CorrelatorImpl final : public Correlator
{
public:
    CorrelatorImpl(libcyphal::IExecutor& executor, pipe::ClientPipe::Ptr client_pipe)
        : executor_{executor}
        , client_pipe_{std::move(client_pipe)}
        , logger_{getLogger("rpc")}
        , next_request_number_{0}
        , is_handshaken_{false}
    {
        CETL_DEBUG_ASSERT(client_pipe_, "");

        deadline_callback_ = executor_.registerCallback([this](const auto& arg) {
            //
            handleDeadlines(arg.approx_now);
        });
    }

    CorrelatorImpl(const CorrelatorImpl&)                = delete;
    CorrelatorImpl(CorrelatorImpl&&) noexcept            = delete;
    CorrelatorImpl& operator=(const CorrelatorImpl&)     = delete;
    CorrelatorImpl& operator=(CorrelatorImpl&&) noexcept = delete;

    ~CorrelatorImpl() override
    {
        // Nobody is interested in the events anymore, but pending calls still deserve their completion.
        event_handler_ = nullptr;
        performWithoutThrowing([this] {
            //
            close(Error::closed());
        });
    }

    // MARK: Correlator

    CETL_NODISCARD int open(EventHandler event_handler) override
    {
        CETL_DEBUG_ASSERT(event_handler, "");

        if (client_pipe_->state() != ConnectionState::Closed)
        {
            return static_cast<int>(ErrorCode::AlreadyStarted);
        }

        event_handler_ = std::move(event_handler);
        close_reason_.reset();
        last_close_reason_.reset();
        is_handshaken_ = false;

        logger_->debug("Correlator: Opening connection.");
        return client_pipe_->start([this](const auto& pipe_event_var) {
            //
            return cetl::visit(
                [this](const auto& pipe_event) {
                    //
                    return handlePipeEvent(pipe_event);
                },
                pipe_event_var);
        });
    }

    void close(Error reason) override
    {
        if (client_pipe_->state() == ConnectionState::Closed)
        {
            // Nothing to close, but there still could be calls issued
            // while the pipe was starting (and so failed synchronously already).
            failAllPending(reason);
            return;
        }

        logger_->debug("Correlator: Closing connection ({}).", reason);
        close_reason_ = std::move(reason);

        // Causes (synchronous) `Disconnected` pipe event.
        client_pipe_->close();
    }

    CETL_NODISCARD ConnectionState connectionState() const override
    {
        return client_pipe_->state();
    }

    CETL_NODISCARD bool isHandshaken() const override
    {
        return is_handshaken_;
    }

    void call(const std::string&        method,
              Json                      params,
              const libcyphal::Duration timeout,
              Completion                completion) override
    {
        CETL_DEBUG_ASSERT(completion, "");

        if (!is_handshaken_)
        {
            const auto& reason = last_close_reason_ ? *last_close_reason_
                                                    : Error::transport(static_cast<int>(ErrorCode::NotConnected),
                                                                       "Not connected");
            logger_->debug("Correlator: Rejecting call of '{}' - {}.", method, reason);
            completion(reason);
            return;
        }

        auto       request_id = makeRequestId();
        const auto now        = executor_.now();
        const auto deadline   = now + timeout;

        if (const int err = sendFrame(Frame::Method{request_id, method, std::move(params)}))
        {
            logger_->warn("Correlator: Failed to send call (id='{}', method='{}'): {}.",
                          request_id,
                          method,
                          std::strerror(err));
            auto error = Error::transport(err, fmt::format("Failed to send '{}' call", method));
            if (isStreamBroken(err))
            {
                // The rest of pending calls won't be answered either.
                close(error);
            }
            completion(std::move(error));
            return;
        }

        logger_->trace("Correlator: Call sent (id='{}', method='{}', timeout={}ms).",
                       request_id,
                       method,
                       toMillis(timeout));

        pending_requests_.emplace(std::move(request_id), PendingRequest{method, now, deadline, std::move(completion)});
        scheduleEarliestDeadline();
    }

    CETL_NODISCARD std::size_t pendingCount() const override
    {
        return pending_requests_.size();
    }

private:
    struct PendingRequest final
    {
        std::string         method;
        libcyphal::TimePoint created_at;
        libcyphal::TimePoint deadline;
        Completion          completion;

    };  // PendingRequest

    using PendingRequests = std::unordered_map<std::string, PendingRequest>;

    std::string makeRequestId()
    {
        return fmt::format("req_{}_{}", ++next_request_number_, epochMillis());
    }

    int sendFrame(const Frame::Var& frame)
    {
        return tryPerformOnSerialized(frame, [this](const auto payload) {
            //
            return client_pipe_->send(payload);
        });
    }

    void notify(const Event::Var& event) const
    {
        if (event_handler_)
        {
            event_handler_(event);
        }
    }

    /// Removes the request (if still pending) before completing it, so that it is completed exactly once.
    ///
    void complete(const std::string& request_id, Call::Result&& result)
    {
        const auto found = pending_requests_.find(request_id);
        if (found == pending_requests_.end())
        {
            // Could legitimately happen for a response which arrives after its call deadline.
            logger_->debug("Correlator: Ignoring response for unknown request (id='{}').", request_id);
            return;
        }
        auto request = std::move(found->second);
        pending_requests_.erase(found);

        logger_->trace("Correlator: Call completed (id='{}', method='{}', ok={}, elapsed={}ms).",
                       request_id,
                       request.method,
                       cetl::holds_alternative<Call::Success>(result),
                       toMillis(executor_.now() - request.created_at));

        request.completion(std::move(result));
    }

    void failAllPending(const Error& reason)
    {
        if (pending_requests_.empty())
        {
            return;
        }

        // Completions might issue new calls, so the map is swapped out first.
        PendingRequests requests;
        std::swap(requests, pending_requests_);

        logger_->debug("Correlator: Failing {} pending call(s) ({}).", requests.size(), reason);
        for (auto& id_and_request : requests)
        {
            id_and_request.second.completion(reason);
        }
    }

    void scheduleEarliestDeadline()
    {
        if (pending_requests_.empty())
        {
            return;
        }

        auto earliest = pending_requests_.begin()->second.deadline;
        for (const auto& id_and_request : pending_requests_)
        {
            earliest = std::min(earliest, id_and_request.second.deadline);
        }
        (void) deadline_callback_.schedule(libcyphal::IExecutor::Callback::Schedule::Once{earliest});
    }

    void handleDeadlines(const libcyphal::TimePoint now)
    {
        std::vector<std::pair<std::string, PendingRequest>> expired;
        for (auto it = pending_requests_.begin(); it != pending_requests_.end();)
        {
            if (it->second.deadline <= now)
            {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_requests_.erase(it);
            }
            else
            {
                ++it;
            }
        }
        scheduleEarliestDeadline();

        for (auto& id_and_request : expired)
        {
            auto& request = id_and_request.second;
            logger_->warn("Correlator: Call timed out (id='{}', method='{}', after={}ms).",
                          id_and_request.first,
                          request.method,
                          toMillis(now - request.created_at));

            request.completion(Error::timeout(fmt::format("Call '{}' timed out after {}ms",
                                                          request.method,
                                                          toMillis(request.deadline - request.created_at))));
        }
    }

    // MARK: Pipe events

    CETL_NODISCARD int handlePipeEvent(const pipe::ClientPipe::Event::Connected&)
    {
        logger_->debug("Correlator: Pipe is connected - sending handshake.");

        if (const int err = sendFrame(Frame::Connect{}))
        {
            logger_->error("Correlator: Failed to send handshake: {}.", std::strerror(err));
            close(Error::transport(err, "Failed to send handshake"));
            return err;
        }
        return 0;
    }

    CETL_NODISCARD int handlePipeEvent(const pipe::ClientPipe::Event::Disconnected& disconnected)
    {
        Error reason = close_reason_ ? std::move(*close_reason_)
                       : (disconnected.error_code == 0) ? Error::closed()
                                                        : Error::connectionLost(disconnected.error_code);
        close_reason_.reset();
        last_close_reason_ = reason;
        is_handshaken_     = false;

        logger_->debug("Correlator: Pipe is disconnected ({}).", reason);

        notify(Event::Disconnected{reason});
        failAllPending(reason);
        return 0;
    }

    CETL_NODISCARD int handlePipeEvent(const pipe::ClientPipe::Event::Message& message)
    {
        Frame::Var frame{Frame::Other{}};
        if (const int err = tryDeserializeFrame(message.payload, frame))
        {
            logger_->warn("Correlator: Ignoring malformed frame (size={}): {}.",
                          message.payload.size(),
                          std::strerror(err));
            return 0;
        }

        cetl::visit(
            [this](const auto& frame_kind) {
                //
                handleFrame(frame_kind);
            },
            frame);
        return 0;
    }

    // MARK: Frames

    void handleFrame(const Frame::Connected& connected)
    {
        if (is_handshaken_)
        {
            logger_->debug("Correlator: Ignoring repeated 'connected' frame.");
            return;
        }
        logger_->debug("Correlator: Handshake succeeded (session='{}').", connected.session);
        is_handshaken_ = true;
        notify(Event::Connected{});
    }

    void handleFrame(const Frame::Failed& failed)
    {
        logger_->error("Correlator: Handshake rejected by server (version='{}').", failed.version);
        close(Error::handshake(fmt::format("Server rejected protocol handshake (version='{}')", failed.version)));
    }

    void handleFrame(const Frame::Result& result)
    {
        complete(result.id, Call::Result{result.result});
    }

    void handleFrame(const Frame::Error& error)
    {
        if (error.id.empty())
        {
            logger_->warn("Correlator: Ignoring uncorrelated error frame: {}.", toCompactString(error.error));
            return;
        }
        complete(error.id, Error::remote(error.error));
    }

    void handleFrame(const Frame::Ping& ping)
    {
        const int err = sendFrame(Frame::Pong{ping.id});
        if ((err != 0) && isStreamBroken(err))
        {
            logger_->warn("Correlator: Failed to answer ping: {}.", std::strerror(err));
            close(Error::transport(err, "Failed to send pong"));
        }
    }

    void handleFrame(const Frame::Pong&) {}

    void handleFrame(const Frame::Method& method)
    {
        logger_->debug("Correlator: Ignoring server-initiated method call (method='{}').", method.method);
    }

    void handleFrame(const Frame::Connect&)
    {
        logger_->debug("Correlator: Ignoring unexpected 'connect' frame.");
    }

    void handleFrame(const Frame::Other& other)
    {
        logger_->debug("Correlator: Ignoring frame of unknown kind (msg='{}').", other.msg);
    }

    libcyphal::IExecutor&               executor_;
    pipe::ClientPipe::Ptr               client_pipe_;
    LoggerPtr                           logger_;
    std::uint64_t                       next_request_number_;
    bool                                is_handshaken_;
    EventHandler                        event_handler_;
    PendingRequests                     pending_requests_;
    cetl::optional<Error>               close_reason_;
    cetl::optional<Error>               last_close_reason_;
    libcyphal::IExecutor::Callback::Any deadline_callback_;

};  // CorrelatorImpl

}  // namespace

CETL_NODISCARD Correlator::Ptr Correlator::make(libcyphal::IExecutor& executor, pipe::ClientPipe::Ptr client_pipe)
{
    return std::make_shared<CorrelatorImpl>(executor, std::move(client_pipe));
}

}  // namespace rpc
}  // namespace common
}  // namespace ddprpc
