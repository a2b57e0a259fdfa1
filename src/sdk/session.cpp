//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "session.hpp"

#include <ddprpc/sdk/error.hpp>

#include "logging.hpp"
#include "rpc/correlator.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ddprpc
{
namespace sdk
{
namespace
{

class SessionImpl final : public Session, public std::enable_shared_from_this<SessionImpl>
{
public:
    SessionImpl(libcyphal::IExecutor&        executor,
                common::rpc::Correlator::Ptr correlator,
                std::string                  api_key,
                const libcyphal::Duration    login_timeout)
        : executor_{executor}
        , correlator_{std::move(correlator)}
        , api_key_{std::move(api_key)}
        , login_timeout_{login_timeout}
        , logger_{common::getLogger("sdk")}
        , state_{State::Unauthenticated}
        , is_shut_down_{false}
    {
        CETL_DEBUG_ASSERT(correlator_, "");
    }

    SessionImpl(const SessionImpl&)                = delete;
    SessionImpl(SessionImpl&&) noexcept            = delete;
    SessionImpl& operator=(const SessionImpl&)     = delete;
    SessionImpl& operator=(SessionImpl&&) noexcept = delete;

    ~SessionImpl() override = default;

    // MARK: Session

    void ensureAuthenticated(Completion completion) override
    {
        CETL_DEBUG_ASSERT(completion, "");

        if (is_shut_down_)
        {
            completion(Error::closed());
            return;
        }

        switch (state_)
        {
        case State::Authenticated:
            completion(cetl::nullopt);
            return;

        case State::Failed:
            CETL_DEBUG_ASSERT(latched_error_, "");
            completion(latched_error_);
            return;

        case State::Authenticating:
            logger_->trace("Session: Joining in-flight authentication.");
            waiters_.push_back(std::move(completion));
            return;

        case State::Unauthenticated:
            waiters_.push_back(std::move(completion));
            beginAttempt();
            return;
        }
    }

    void shutdown() override
    {
        if (is_shut_down_)
        {
            return;
        }
        logger_->debug("Session: Shutting down (state={}).", toString(state_));

        is_shut_down_ = true;
        correlator_->close(Error::closed());

        // The correlator might have been closed already (and so there was no disconnect event).
        state_ = State::Unauthenticated;
        finishAttempt(Error::closed());
    }

    void setDisconnectHandler(DisconnectHandler handler) override
    {
        disconnect_handler_ = std::move(handler);
    }

    CETL_NODISCARD State state() const override
    {
        return state_;
    }

private:
    void beginAttempt()
    {
        state_ = State::Authenticating;

        if (!correlator_->isHandshaken())
        {
            scheduleConnectDeadline();
        }

        if (correlator_->connectionState() == ConnectionState::Closed)
        {
            logger_->debug("Session: Opening connection.");

            std::weak_ptr<SessionImpl> weak_self{shared_from_this()};
            if (const int err = correlator_->open([weak_self](const auto& event_var) {
                    //
                    if (const auto self = weak_self.lock())
                    {
                        cetl::visit(
                            [&self](const auto& event) {
                                //
                                self->handleEvent(event);
                            },
                            event_var);
                    }
                }))
            {
                logger_->error("Session: Failed to open connection: {}.", std::strerror(err));
                finishAttempt(Error::transport(err, "Failed to open connection"));
            }
            return;
        }

        if (correlator_->isHandshaken())
        {
            login();
        }
        // Otherwise the handshake is in progress; login follows on `Connected` event.
    }

    /// Bounds the connect and handshake phase of the attempt; the login call has its own timeout.
    ///
    void scheduleConnectDeadline()
    {
        std::weak_ptr<SessionImpl> weak_self{shared_from_this()};
        connect_deadline_callback_ = executor_.registerCallback([weak_self](const auto&) {
            //
            if (const auto self = weak_self.lock())
            {
                self->handleConnectDeadline();
            }
        });
        (void) connect_deadline_callback_.schedule(
            libcyphal::IExecutor::Callback::Schedule::Once{executor_.now() + login_timeout_});
    }

    void handleConnectDeadline()
    {
        connect_deadline_callback_.reset();
        if (state_ != State::Authenticating)
        {
            return;
        }

        const auto error = Error::timeout(
            fmt::format("Connection is not established within {} ms",
                        std::chrono::duration_cast<std::chrono::milliseconds>(login_timeout_).count()));
        logger_->error("Session: {}.", error.message);

        // Normally, the close fails the attempt via the `Disconnected` event.
        correlator_->close(error);
        if (state_ == State::Authenticating)
        {
            finishAttempt(error);
        }
    }

    void login()
    {
        connect_deadline_callback_.reset();
        logger_->info("Session: Authenticating with API key.");

        std::weak_ptr<SessionImpl> weak_self{shared_from_this()};
        correlator_->call(LoginMethod,
                          Json::array({api_key_}),
                          login_timeout_,
                          [weak_self](common::rpc::Correlator::Call::Result&& result) {
                              //
                              if (const auto self = weak_self.lock())
                              {
                                  self->handleLoginResult(std::move(result));
                              }
                          });
    }

    void handleLoginResult(common::rpc::Correlator::Call::Result&& result)
    {
        if (state_ != State::Authenticating)
        {
            // F.e. the connection was lost (and so waiters are failed already).
            return;
        }

        if (const auto* const failure = cetl::get_if<common::rpc::Correlator::Call::Failure>(&result))
        {
            if (failure->kind == Error::Kind::Remote)
            {
                failWithAuthentication(Error::authentication(  //
                    fmt::format("Authentication failed: {}", failure->message),
                    failure->payload));
                return;
            }
            logger_->error("Session: Authentication call failed ({}).", *failure);
            finishAttempt(*failure);
            return;
        }

        const auto& success = cetl::get<common::rpc::Correlator::Call::Success>(result);
        const bool is_accepted = success.is_object() || (success.is_boolean() && success.get<bool>());
        if (!is_accepted)
        {
            failWithAuthentication(Error::authentication("Invalid API key", success));
            return;
        }

        logger_->info("Session: Authentication successful.");
        finishAttempt(cetl::nullopt);
    }

    void failWithAuthentication(const Error& error)
    {
        logger_->error("Session: {}.", error.message);

        // Authentication failure is fatal to the whole connection (and so to all its pending calls).
        finishAttempt(error);
        correlator_->close(error);
    }

    void finishAttempt(const cetl::optional<Error>& error)
    {
        connect_deadline_callback_.reset();
        if (error)
        {
            if ((error->kind == Error::Kind::Handshake) || (error->kind == Error::Kind::Authentication))
            {
                latched_error_ = error;
                state_         = State::Failed;
            }
            else if (state_ != State::Failed)
            {
                state_ = State::Unauthenticated;
            }
        }
        else
        {
            state_ = State::Authenticated;
        }

        std::vector<Completion> waiters;
        std::swap(waiters, waiters_);
        for (const auto& waiter : waiters)
        {
            waiter(error);
        }
    }

    // MARK: Correlator events

    void handleEvent(const common::rpc::Correlator::Event::Connected&)
    {
        if (state_ == State::Authenticating)
        {
            login();
        }
    }

    void handleEvent(const common::rpc::Correlator::Event::Disconnected& disconnected)
    {
        const auto prev_state = state_;
        logger_->debug("Session: Connection closed (state={}, reason={}).", toString(prev_state), disconnected.reason);

        if (prev_state == State::Authenticating)
        {
            finishAttempt(disconnected.reason);
        }
        else if (prev_state == State::Authenticated)
        {
            state_ = State::Unauthenticated;
        }

        if (disconnect_handler_)
        {
            disconnect_handler_(disconnected.reason);
        }
    }

    libcyphal::IExecutor&               executor_;
    common::rpc::Correlator::Ptr        correlator_;
    const std::string                   api_key_;
    const libcyphal::Duration           login_timeout_;
    common::LoggerPtr                   logger_;
    State                               state_;
    bool                                is_shut_down_;
    cetl::optional<Error>               latched_error_;
    std::vector<Completion>             waiters_;
    DisconnectHandler                   disconnect_handler_;
    libcyphal::IExecutor::Callback::Any connect_deadline_callback_;

};  // SessionImpl

}  // namespace

CETL_NODISCARD Session::Ptr Session::make(libcyphal::IExecutor&        executor,
                                          common::rpc::Correlator::Ptr correlator,
                                          std::string                  api_key,
                                          const libcyphal::Duration    login_timeout)
{
    return std::make_shared<SessionImpl>(executor, std::move(correlator), std::move(api_key), login_timeout);
}

}  // namespace sdk
}  // namespace ddprpc
