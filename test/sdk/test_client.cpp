//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <ddprpc/sdk/client.hpp>

#include "common/rpc/pipe/client_pipe_mock.hpp"
#include "common/rpc/rpc_gtest_helpers.hpp"
#include "sdk_factory.hpp"
#include "virtual_time_executor.hpp"

#include <ddprpc/sdk/error.hpp>
#include <ddprpc/sdk/execution.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace
{

using namespace ddprpc::sdk;  // NOLINT This our main concern here in the unit tests.
using ddprpc::common::rpc::ServerEmulator;
using ddprpc::common::rpc::pipe::ClientPipeMock;

using testing::_;
using testing::Eq;
using testing::AllOf;
using testing::Field;
using testing::Optional;
using testing::StrictMock;
using testing::VariantWith;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestClient : public testing::Test
{
protected:
    using CallOutcome   = cetl::optional<Client::Call::Result>;
    using LookupOutcome = cetl::optional<Client::Lookup::Result>;

    static constexpr auto LoginMethod = "auth.login_with_api_key";
    static constexpr auto JobsMethod  = "core.get_jobs";

    void SetUp() override
    {
        server_.captureSentFrames();
        server_.allowClose();

        Client::Options options;
        options.address           = "127.0.0.1";
        options.api_key           = "key-123";
        options.call_timeout      = 5000ms;
        options.job_poll_interval = 2000ms;

        EXPECT_CALL(pipe_mock_, deinit()).Times(1);
        client_ = Factory::makeClient(executor_, std::make_unique<ClientPipeMock::Wrapper>(pipe_mock_), options);
        ASSERT_TRUE(client_);
    }

    void TearDown() override
    {
        client_.reset();
    }

    template <typename Result>
    static void submitTo(std::unique_ptr<SenderOf<Result>> sender, cetl::optional<Result>& outcome)
    {
        submit(sender, [&outcome](Result&& result) {
            //
            EXPECT_FALSE(outcome.has_value()) << "Completed more than once.";
            outcome = std::move(result);
        });
    }

    /// Accepts the connection (with its handshake), and the API key.
    ///
    void acceptAndLogin()
    {
        server_.acceptConnection();
        ASSERT_THAT(server_.lastCall(LoginMethod)->at("params"), Eq(Json::array({"key-123"})));
        server_.reply(server_.lastCallId(LoginMethod), true);
    }

    static auto isFailure(const Error::Kind kind, const int code)
    {
        return Optional(VariantWith<Error>(AllOf(Field(&Error::kind, kind), Field(&Error::code, code))));
    }

    static auto isSuccess(const Json& json)
    {
        return Optional(VariantWith<Json>(Eq(json)));
    }

    // MARK: Data members:

    // NOLINTBEGIN
    ddprpc::VirtualTimeExecutor  executor_;
    StrictMock<ClientPipeMock>   pipe_mock_;
    ServerEmulator               server_{pipe_mock_};
    Client::Ptr                  client_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestClient, make_with_invalid_address)
{
    Client::Options options;
    options.address = "10.0.0.1:http";
    EXPECT_FALSE(Client::make(executor_, options));
}

TEST_F(TestClient, nothing_is_sent_until_submitted)
{
    auto sender = client_->testConnection();
    EXPECT_THAT(client_->connectionState(), ConnectionState::Closed);
    EXPECT_FALSE(client_->isAuthenticated());

    CallOutcome outcome;
    server_.expectStart();
    submitTo(std::move(sender), outcome);
    EXPECT_THAT(client_->connectionState(), ConnectionState::Connecting);

    acceptAndLogin();
    ASSERT_THAT(server_.callCount("system.info"), 1);
    server_.reply(server_.lastCallId("system.info"), {{"version", "25.04.0"}});
    EXPECT_THAT(outcome, isSuccess({{"version", "25.04.0"}}));
    EXPECT_TRUE(client_->isAuthenticated());
    EXPECT_THAT(client_->connectionState(), ConnectionState::Open);
}

TEST_F(TestClient, create_waits_for_job)
{
    const Json spec{{"app_name", "my-app"}, {"custom_app", true}};

    CallOutcome outcome;
    server_.expectStart();
    submitTo(client_->create(spec), outcome);
    acceptAndLogin();

    ASSERT_THAT(server_.callCount("app.create"), 1);
    EXPECT_THAT(server_.lastCall("app.create")->at("params"), Eq(Json::array({spec})));
    server_.reply(server_.lastCallId("app.create"), 42);

    // The job is polled right away, and then every poll interval.
    ASSERT_THAT(server_.callCount(JobsMethod), 1);
    server_.reply(server_.lastCallId(JobsMethod), Json::array({Json{{"id", 42}, {"state", "RUNNING"}}}));
    executor_.spinFor(2s);
    ASSERT_THAT(server_.callCount(JobsMethod), 2);
    EXPECT_FALSE(outcome.has_value());

    const Json job{{"id", 42}, {"state", "SUCCESS"}, {"result", {{"ok", true}}}};
    server_.reply(server_.lastCallId(JobsMethod), Json::array({job}));
    EXPECT_THAT(outcome, isSuccess({{"ok", true}}));

    // The session is reused by the next operation.
    LookupOutcome lookup;
    submitTo(client_->getByName("my-app"), lookup);
    ASSERT_THAT(server_.callCount("app.get_instance"), 1);
    server_.reply(server_.lastCallId("app.get_instance"), {{"name", "my-app"}, {"state", "RUNNING"}});
    ASSERT_THAT(lookup, Optional(VariantWith<Client::Lookup::Success>(Optional(_))));
    EXPECT_THAT(parseAppState(*cetl::get<Client::Lookup::Success>(*lookup)), AppState::Running);
    EXPECT_THAT(server_.callCount(LoginMethod), 1);
}

TEST_F(TestClient, update_and_pull_params)
{
    server_.expectStart();

    CallOutcome update_outcome;
    submitTo(client_->update("my-app", {{"values", {{"replicas", 2}}}}), update_outcome);
    acceptAndLogin();
    ASSERT_THAT(server_.callCount("app.update"), 1);
    EXPECT_THAT(server_.lastCall("app.update")->at("params"),
                Eq(Json::array({"my-app", Json{{"values", {{"replicas", 2}}}}})));

    CallOutcome pull_outcome;
    submitTo(client_->pullAndRedeploy("my-app"), pull_outcome);
    ASSERT_THAT(server_.callCount("app.pull_images"), 1);
    EXPECT_THAT(server_.lastCall("app.pull_images")->at("params"),
                Eq(Json::array({"my-app", Json{{"redeploy", true}}})));

    // Pull job fails.
    server_.reply(server_.lastCallId("app.pull_images"), 7);
    const Json failed_job{{"id", 7}, {"state", "FAILED"}, {"error", "Registry is unreachable"}};
    server_.reply(server_.lastCallId(JobsMethod), Json::array({failed_job}));
    ASSERT_THAT(pull_outcome, isFailure(Error::Kind::JobFailed, EREMOTEIO));
    EXPECT_THAT(cetl::get<Error>(*pull_outcome).message, "Job 7 failed: Registry is unreachable");

    // Update job is still in progress.
    EXPECT_FALSE(update_outcome.has_value());
    client_->disconnect();
    EXPECT_THAT(update_outcome, isFailure(Error::Kind::Transport, ESHUTDOWN));
}

TEST_F(TestClient, start_and_stop_are_not_awaited)
{
    server_.expectStart();

    CallOutcome start_outcome;
    submitTo(client_->start("my-app"), start_outcome);
    acceptAndLogin();
    server_.reply(server_.lastCallId("app.start"), 5);
    EXPECT_THAT(start_outcome, isSuccess(5));

    CallOutcome stop_outcome;
    submitTo(client_->stop("my-app"), stop_outcome);
    EXPECT_THAT(server_.lastCall("app.stop")->at("params"), Eq(Json::array({"my-app"})));
    server_.reply(server_.lastCallId("app.stop"), 6);
    EXPECT_THAT(stop_outcome, isSuccess(6));

    EXPECT_THAT(server_.callCount(JobsMethod), 0);
}

TEST_F(TestClient, results_in_any_order)
{
    server_.expectStart();

    CallOutcome info_outcome;
    CallOutcome status_outcome;
    submitTo(client_->testConnection(), info_outcome);
    submitTo(client_->getStatus("my-app"), status_outcome);
    acceptAndLogin();
    EXPECT_THAT(server_.callCount(LoginMethod), 1);

    server_.reply(server_.lastCallId("app.get_instance"), {{"state", "STOPPED"}});
    EXPECT_FALSE(info_outcome.has_value());
    ASSERT_THAT(status_outcome, isSuccess({{"state", "STOPPED"}}));

    server_.reply(server_.lastCallId("system.info"), {{"version", "1"}});
    EXPECT_THAT(info_outcome, isSuccess({{"version", "1"}}));
}

TEST_F(TestClient, get_by_name_not_found)
{
    server_.expectStart();

    LookupOutcome lookup;
    submitTo(client_->getByName("ghost"), lookup);
    acceptAndLogin();
    server_.replyError(server_.lastCallId("app.get_instance"), {{"reason", "ghost: app does not exist"}});
    ASSERT_THAT(lookup, Optional(VariantWith<Client::Lookup::Success>(_)));
    EXPECT_FALSE(cetl::get<Client::Lookup::Success>(*lookup).has_value());
}

TEST_F(TestClient, get_by_name_transport_failure)
{
    server_.expectStart(ECONNREFUSED);

    LookupOutcome lookup;
    submitTo(client_->getByName("my-app"), lookup);
    EXPECT_THAT(lookup, isFailure(Error::Kind::Transport, ECONNREFUSED));
}

TEST_F(TestClient, invalid_arguments)
{
    // None of these reaches the server (so not even starts the connection).
    CallOutcome outcome;
    submitTo(client_->getStatus(""), outcome);
    EXPECT_THAT(outcome, isFailure(Error::Kind::InvalidArgument, EINVAL));

    for (auto* const make : {+[](Client& client) { return client.start(""); },
                             +[](Client& client) { return client.stop(""); },
                             +[](Client& client) { return client.update("", Json::object()); },
                             +[](Client& client) { return client.pullAndRedeploy(""); },
                             +[](Client& client) { return client.call("", Json::array()); },
                             +[](Client& client) { return client.callJob("", Json::array()); }})
    {
        CallOutcome invalid_outcome;
        submitTo(make(*client_), invalid_outcome);
        EXPECT_THAT(invalid_outcome, isFailure(Error::Kind::InvalidArgument, EINVAL));
    }

    LookupOutcome lookup;
    submitTo(client_->getByName(""), lookup);
    EXPECT_THAT(lookup, isFailure(Error::Kind::InvalidArgument, EINVAL));

    EXPECT_THAT(client_->connectionState(), ConnectionState::Closed);
}

TEST_F(TestClient, call_job_without_job_id)
{
    server_.expectStart();

    CallOutcome outcome;
    submitTo(client_->callJob("app.create", Json::array({Json{{"app_name", "x"}}})), outcome);
    acceptAndLogin();
    server_.reply(server_.lastCallId("app.create"), {{"unexpected", true}});
    EXPECT_THAT(outcome, isFailure(Error::Kind::JobFailed, EPROTO));
    EXPECT_THAT(server_.callCount(JobsMethod), 0);
}

TEST_F(TestClient, call_timeout)
{
    server_.expectStart();

    CallOutcome outcome;
    submitTo(client_->call("system.info", Json::array()), outcome);
    acceptAndLogin();

    executor_.spinFor(4s);
    EXPECT_FALSE(outcome.has_value());
    executor_.spinFor(1s);
    EXPECT_THAT(outcome, isFailure(Error::Kind::Timeout, ETIMEDOUT));
}

TEST_F(TestClient, authentication_failure)
{
    server_.expectStart();

    CallOutcome outcome;
    submitTo(client_->getStatus("my-app"), outcome);
    server_.acceptConnection();
    server_.reply(server_.lastCallId(LoginMethod), false);
    EXPECT_THAT(outcome, isFailure(Error::Kind::Authentication, EACCES));
    EXPECT_THAT(server_.callCount("app.get_instance"), 0);

    // No reconnection (nor relogin) with the same key.
    CallOutcome outcome2;
    submitTo(client_->testConnection(), outcome2);
    EXPECT_THAT(outcome2, isFailure(Error::Kind::Authentication, EACCES));
    EXPECT_THAT(server_.callCount(LoginMethod), 1);
}

TEST_F(TestClient, connection_lost_fails_job_waits)
{
    server_.expectStart();

    CallOutcome job_outcome;
    submitTo(client_->create({{"app_name", "my-app"}}), job_outcome);
    acceptAndLogin();
    server_.reply(server_.lastCallId("app.create"), 42);
    server_.reply(server_.lastCallId(JobsMethod), Json::array({Json{{"id", 42}, {"state", "RUNNING"}}}));

    // Between polls - there is no call in flight.
    pipe_mock_.emulateDisconnected(ECONNRESET);
    EXPECT_THAT(job_outcome, isFailure(Error::Kind::Transport, ECONNRESET));
    EXPECT_FALSE(client_->isAuthenticated());

    executor_.spinFor(10s);
    EXPECT_THAT(server_.callCount(JobsMethod), 1);

    // The next operation reconnects, and logs in again.
    CallOutcome outcome;
    server_.expectStart();
    submitTo(client_->testConnection(), outcome);
    acceptAndLogin();
    server_.reply(server_.lastCallId("system.info"), {{"version", "1"}});
    EXPECT_THAT(outcome, isSuccess({{"version", "1"}}));
    EXPECT_THAT(server_.callCount(LoginMethod), 2);
}

TEST_F(TestClient, disconnect)
{
    server_.expectStart();

    CallOutcome job_outcome;
    CallOutcome status_outcome;
    submitTo(client_->create({{"app_name", "my-app"}}), job_outcome);
    acceptAndLogin();
    server_.reply(server_.lastCallId("app.create"), 42);
    submitTo(client_->getStatus("my-app"), status_outcome);
    ASSERT_THAT(server_.callCount(JobsMethod), 1);
    ASSERT_THAT(server_.callCount("app.get_instance"), 1);

    client_->disconnect();
    EXPECT_THAT(job_outcome, isFailure(Error::Kind::Transport, ESHUTDOWN));
    EXPECT_THAT(status_outcome, isFailure(Error::Kind::Transport, ESHUTDOWN));
    EXPECT_THAT(client_->connectionState(), ConnectionState::Closed);

    // Late responses are ignored.
    server_.reply(server_.lastCallId("app.get_instance"), {{"state", "RUNNING"}});

    CallOutcome late_outcome;
    submitTo(client_->testConnection(), late_outcome);
    EXPECT_THAT(late_outcome, isFailure(Error::Kind::Transport, ESHUTDOWN));

    client_->disconnect();
}

TEST_F(TestClient, sender_outliving_client)
{
    auto sender = client_->testConnection();
    client_.reset();

    CallOutcome outcome;
    submitTo(std::move(sender), outcome);
    EXPECT_THAT(outcome, isFailure(Error::Kind::Transport, ESHUTDOWN));
}

TEST_F(TestClient, app_state)
{
    EXPECT_THAT(parseAppState({{"state", "RUNNING"}}), AppState::Running);
    EXPECT_THAT(parseAppState({{"state", "DEPLOYING"}}), AppState::Deploying);
    EXPECT_THAT(parseAppState({{"state", "CRASHED"}}), AppState::Crashed);
    EXPECT_THAT(parseAppState({{"state", "STOPPED"}}), AppState::Stopped);
    EXPECT_THAT(parseAppState({{"state", "STOPPING"}}), AppState::Stopping);
    EXPECT_THAT(parseAppState({{"state", "EXPLODED"}}), AppState::Unknown);
    EXPECT_THAT(parseAppState({{"state", 1}}), AppState::Unknown);
    EXPECT_THAT(parseAppState(nullptr), AppState::Unknown);

    EXPECT_STREQ(toString(AppState::Running), "RUNNING");
    EXPECT_STREQ(toString(AppState::Unknown), "UNKNOWN");
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
