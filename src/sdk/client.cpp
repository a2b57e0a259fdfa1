//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <ddprpc/sdk/client.hpp>

#include "as_sender.hpp"
#include "common_helpers.hpp"
#include "io/socket_address.hpp"
#include "job_poller.hpp"
#include "json_helpers.hpp"
#include "logging.hpp"
#include "rpc/correlator.hpp"
#include "rpc/pipe/client_pipe.hpp"
#include "rpc/pipe/socket_client.hpp"
#include "sdk_factory.hpp"
#include "session.hpp"

#include <ddprpc/sdk/error.hpp>
#include <ddprpc/sdk/execution.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cerrno>
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

class ClientImpl final : public Client, public std::enable_shared_from_this<ClientImpl>
{
public:
    ClientImpl(libcyphal::IExecutor& executor, common::rpc::pipe::ClientPipe::Ptr client_pipe, const Options& options)
        : executor_{executor}
        , options_{options}
        , logger_{common::getLogger("sdk")}
        , correlator_{common::rpc::Correlator::make(executor, std::move(client_pipe))}
        , session_{Session::make(executor, correlator_, options.api_key, options.call_timeout)}
        , is_disconnected_{false}
    {
        // Job waits can't outlive the connection they poll through.
        session_->setDisconnectHandler([this](const Error& reason) {
            //
            failJobWaits(reason);
        });
    }

    ClientImpl(const ClientImpl&)                = delete;
    ClientImpl(ClientImpl&&) noexcept            = delete;
    ClientImpl& operator=(const ClientImpl&)     = delete;
    ClientImpl& operator=(ClientImpl&&) noexcept = delete;

    ~ClientImpl() override
    {
        common::performWithoutThrowing([this] {
            //
            disconnect();
        });
    }

    // MARK: Client

    SenderOf<Call::Result>::Ptr call(std::string method, Json params) override
    {
        if (method.empty())
        {
            return just<Call::Result>(Error::invalidArgument("Method name must not be empty"));
        }
        return makeCallSender(std::move(method), std::move(params));
    }

    SenderOf<Call::Result>::Ptr callJob(std::string method, Json params) override
    {
        if (method.empty())
        {
            return just<Call::Result>(Error::invalidArgument("Method name must not be empty"));
        }
        return makeJobSender(std::move(method), std::move(params));
    }

    SenderOf<Call::Result>::Ptr testConnection() override
    {
        return makeSender<Call::Result>("system.info", [this](Receiver<Call::Result>&& receiver) {
            //
            performCall("system.info",
                        Json::array(),
                        [logger = logger_, receiver = std::move(receiver)](Call::Result&& result) mutable {
                            //
                            if (const auto* const info = cetl::get_if<Call::Success>(&result))
                            {
                                logger->info("Connected to server {}.", common::getStringOr(*info, "version", "?"));
                            }
                            else
                            {
                                logger->error("Connection test failed ({}).", cetl::get<Call::Failure>(result));
                            }
                            receiver(std::move(result));
                        });
        });
    }

    SenderOf<Lookup::Result>::Ptr getByName(std::string name) override
    {
        if (name.empty())
        {
            return just<Lookup::Result>(Error::invalidArgument("Application name must not be empty"));
        }

        return makeSender<Lookup::Result>("app.get_instance", [this, name](Receiver<Lookup::Result>&& receiver) {
            //
            logger_->info("Getting app by name: {}.", name);
            performCall("app.get_instance",
                        Json::array({name}),
                        [logger = logger_, name, receiver = std::move(receiver)](Call::Result&& result) mutable {
                            //
                            if (auto* const failure = cetl::get_if<Call::Failure>(&result))
                            {
                                if (failure->kind != Error::Kind::Remote)
                                {
                                    receiver(std::move(*failure));
                                    return;
                                }
                                logger->warn("Could not get app '{}': {}.", name, failure->message);
                                receiver(Lookup::Success{});
                                return;
                            }
                            receiver(Lookup::Success{cetl::get<Call::Success>(std::move(result))});
                        });
        });
    }

    SenderOf<Call::Result>::Ptr getStatus(std::string id) override
    {
        if (id.empty())
        {
            return just<Call::Result>(Error::invalidArgument("Application id must not be empty"));
        }
        return makeCallSender("app.get_instance", Json::array({std::move(id)}));
    }

    SenderOf<Call::Result>::Ptr create(Json spec) override
    {
        logger_->info("Creating app: {}.", common::getStringOr(spec, "app_name", "?"));
        return makeJobSender("app.create", Json::array({std::move(spec)}));
    }

    SenderOf<Call::Result>::Ptr update(std::string name, Json spec) override
    {
        if (name.empty())
        {
            return just<Call::Result>(Error::invalidArgument("Application name must not be empty"));
        }
        logger_->info("Updating app: {}.", name);
        return makeJobSender("app.update", Json::array({std::move(name), std::move(spec)}));
    }

    SenderOf<Call::Result>::Ptr start(std::string id) override
    {
        if (id.empty())
        {
            return just<Call::Result>(Error::invalidArgument("Application id must not be empty"));
        }
        logger_->info("Starting app: {}.", id);
        return makeCallSender("app.start", Json::array({std::move(id)}));
    }

    SenderOf<Call::Result>::Ptr stop(std::string id) override
    {
        if (id.empty())
        {
            return just<Call::Result>(Error::invalidArgument("Application id must not be empty"));
        }
        logger_->info("Stopping app: {}.", id);
        return makeCallSender("app.stop", Json::array({std::move(id)}));
    }

    SenderOf<Call::Result>::Ptr pullAndRedeploy(std::string name) override
    {
        if (name.empty())
        {
            return just<Call::Result>(Error::invalidArgument("Application name must not be empty"));
        }
        logger_->info("Pulling images for app: {}.", name);
        return makeJobSender("app.pull_images", Json::array({std::move(name), Json{{"redeploy", true}}}));
    }

    void disconnect() override
    {
        if (is_disconnected_)
        {
            return;
        }
        is_disconnected_ = true;

        logger_->info("Disconnecting (pending calls={}, job waits={}).",
                      correlator_->pendingCount(),
                      pollers_.size());

        // Fails pending calls, and (through the disconnect handler) job waits.
        session_->shutdown();

        // There might be no connection at all at the moment (f.e. jobs which are between polls of a lost one).
        failJobWaits(Error::closed());
        pollers_.clear();
    }

    CETL_NODISCARD bool isAuthenticated() const override
    {
        return session_->isAuthenticated();
    }

    CETL_NODISCARD ConnectionState connectionState() const override
    {
        return correlator_->connectionState();
    }

private:
    template <typename Result>
    using Receiver = typename AsSender<Result>::Receiver;

    template <typename Result>
    typename SenderOf<Result>::Ptr makeSender(std::string op_name, typename AsSender<Result>::Operation&& operation)
    {
        // The sender might outlive the client.
        std::weak_ptr<ClientImpl> weak_self{shared_from_this()};
        return std::make_unique<AsSender<Result>>(  //
            std::move(op_name),
            [weak_self, operation = std::move(operation)](Receiver<Result>&& receiver) {
                //
                if (const auto self = weak_self.lock())
                {
                    operation(std::move(receiver));
                    return;
                }
                receiver(Error::closed());
            },
            logger_);
    }

    SenderOf<Call::Result>::Ptr makeCallSender(std::string method, Json params)
    {
        auto op_name = method;
        return makeSender<Call::Result>(std::move(op_name),
                                        [this, method = std::move(method), params = std::move(params)](
                                            Receiver<Call::Result>&& receiver) {
                                            //
                                            performCall(method, params, std::move(receiver));
                                        });
    }

    SenderOf<Call::Result>::Ptr makeJobSender(std::string method, Json params)
    {
        auto op_name = method;
        return makeSender<Call::Result>(std::move(op_name),
                                        [this, method = std::move(method), params = std::move(params)](
                                            Receiver<Call::Result>&& receiver) {
                                            //
                                            performJob(method, params, std::move(receiver));
                                        });
    }

    /// Dispatches the call once the session is authenticated.
    ///
    void performCall(const std::string& method, const Json& params, Receiver<Call::Result>&& receiver)
    {
        if (is_disconnected_)
        {
            receiver(Error::closed());
            return;
        }

        logger_->debug("Calling '{}'.", method);

        std::weak_ptr<ClientImpl> weak_self{shared_from_this()};
        session_->ensureAuthenticated(
            [weak_self, method, params, receiver = std::move(receiver)](const cetl::optional<Error>& error) mutable {
                //
                if (error)
                {
                    receiver(*error);
                    return;
                }
                const auto self = weak_self.lock();
                if (!self)
                {
                    receiver(Error::closed());
                    return;
                }
                self->correlator_->call(method,
                                        std::move(params),
                                        self->options_.call_timeout,
                                        [receiver = std::move(receiver)](Call::Result&& result) mutable {
                                            //
                                            receiver(std::move(result));
                                        });
            });
    }

    /// Dispatches the call, and then waits for the job which the call has started.
    ///
    void performJob(const std::string& method, const Json& params, Receiver<Call::Result>&& receiver)
    {
        std::weak_ptr<ClientImpl> weak_self{shared_from_this()};
        performCall(method,
                    params,
                    [weak_self, method, receiver = std::move(receiver)](Call::Result&& result) mutable {
                        //
                        if (cetl::holds_alternative<Call::Failure>(result))
                        {
                            receiver(std::move(result));
                            return;
                        }
                        auto job_id = cetl::get<Call::Success>(std::move(result));
                        if (!job_id.is_number() && !job_id.is_string())
                        {
                            receiver(Error::jobFailed(EPROTO,
                                                      fmt::format("Method '{}' returned no job id", method),
                                                      job_id));
                            return;
                        }
                        const auto self = weak_self.lock();
                        if (!self)
                        {
                            receiver(Error::closed());
                            return;
                        }
                        self->awaitJob(method, std::move(job_id), std::move(receiver));
                    });
    }

    void awaitJob(const std::string& method, Json job_id, Receiver<Call::Result>&& receiver)
    {
        logger_->info("Job {} of '{}' started.", jobIdToString(job_id), method);

        JobPoller::Options poller_options;
        poller_options.poll_interval = options_.job_poll_interval;
        poller_options.call_timeout  = options_.call_timeout;
        if (options_.job_max_wait)
        {
            poller_options.max_wait = *options_.job_max_wait;
        }

        auto poller = JobPoller::make(executor_, correlator_, std::move(job_id), poller_options);
        pollers_.push_back(poller);

        std::weak_ptr<ClientImpl> weak_self{shared_from_this()};
        poller->start([weak_self, receiver = std::move(receiver)](JobPoller::Wait::Result&& result) mutable {
            //
            if (const auto self = weak_self.lock())
            {
                self->sweepDonePollers();
            }
            receiver(std::move(result));
        });
    }

    void failJobWaits(const Error& reason)
    {
        // Completions might start new job waits, so iterate over a copy.
        const auto pollers = pollers_;
        for (const auto& poller : pollers)
        {
            poller->fail(reason);
        }
        sweepDonePollers();
    }

    void sweepDonePollers()
    {
        pollers_.erase(std::remove_if(pollers_.begin(),
                                      pollers_.end(),
                                      [](const JobPoller::Ptr& poller) { return poller->isDone(); }),
                       pollers_.end());
    }

    libcyphal::IExecutor&        executor_;
    const Options                options_;
    common::LoggerPtr            logger_;
    common::rpc::Correlator::Ptr correlator_;
    Session::Ptr                 session_;
    std::vector<JobPoller::Ptr>  pollers_;
    bool                         is_disconnected_;

};  // ClientImpl

}  // namespace

CETL_NODISCARD Client::Ptr Client::make(libcyphal::IExecutor& executor, const Options& options)
{
    using ParseResult = common::io::SocketAddress::ParseResult;

    auto logger = common::getLogger("sdk");
    logger->info("Making client of '{}'...", options.address);

    auto maybe_socket_address = common::io::SocketAddress::parse(options.address, DefaultPort);
    if (const auto* const err = cetl::get_if<ParseResult::Failure>(&maybe_socket_address))
    {
        logger->error("Failed to parse server address ('{}'): {}.", options.address, std::strerror(*err));
        return nullptr;
    }
    const auto socket_address = cetl::get<ParseResult::Success>(maybe_socket_address);

    auto client_pipe = std::make_unique<common::rpc::pipe::SocketClient>(executor, socket_address);
    return Factory::makeClient(executor, std::move(client_pipe), options);
}

CETL_NODISCARD Client::Ptr Factory::makeClient(libcyphal::IExecutor&              executor,
                                               common::rpc::pipe::ClientPipe::Ptr client_pipe,
                                               const Client::Options&             options)
{
    return std::make_shared<ClientImpl>(executor, std::move(client_pipe), options);
}

AppState parseAppState(const Json& app_record)
{
    const auto state = common::getStringOr(app_record, "state", "");
    if (state == "CRASHED")
    {
        return AppState::Crashed;
    }
    if (state == "DEPLOYING")
    {
        return AppState::Deploying;
    }
    if (state == "RUNNING")
    {
        return AppState::Running;
    }
    if (state == "STOPPED")
    {
        return AppState::Stopped;
    }
    if (state == "STOPPING")
    {
        return AppState::Stopping;
    }
    return AppState::Unknown;
}

const char* toString(const AppState state) noexcept
{
    switch (state)
    {
    case AppState::Unknown:
        return "UNKNOWN";
    case AppState::Crashed:
        return "CRASHED";
    case AppState::Deploying:
        return "DEPLOYING";
    case AppState::Running:
        return "RUNNING";
    case AppState::Stopped:
        return "STOPPED";
    case AppState::Stopping:
        return "STOPPING";
    }
    return "?";
}

}  // namespace sdk
}  // namespace ddprpc
