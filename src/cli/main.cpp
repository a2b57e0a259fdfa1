//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"
#include "setup_logging.hpp"

#include <ddprpc/platform/defines.hpp>
#include <ddprpc/sdk/client.hpp>
#include <ddprpc/sdk/error.hpp>
#include <ddprpc/sdk/execution.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <signal.h>  // NOLINT
#include <string>
#include <utility>
#include <vector>

namespace
{

using ddprpc::sdk::Client;
using ddprpc::sdk::Error;
using ddprpc::sdk::Json;
using Executor = ddprpc::platform::SingleThreadedExecutor;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

void signalHandler(const int sig)
{
    switch (sig)
    {
    case SIGINT:
    case SIGTERM:
        g_running = 0;
        break;
    default:
        break;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
}

constexpr auto ConfigFileArgPrefix = "CONFIG_FILE=";
constexpr auto ConfigFileEnvVar    = "DDPRPC_CONFIG";

bool hasPrefix(const std::string& str, const std::string& prefix)
{
    return 0 == str.compare(0, prefix.size(), prefix);
}

/// Splits arguments into the command ones, and finds the configuration file path.
///
/// `KEY=value` arguments of logging (`SPDLOG_...`) and of the configuration are not command arguments.
///
std::vector<std::string> parseArgs(const int argc, const char** const argv, std::string& config_file_path)
{
    config_file_path = ddprpc::cli::Config::DefaultFilePath;
    if (const auto* const env_config_file = std::getenv(ConfigFileEnvVar))
    {
        config_file_path = env_config_file;
    }

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (hasPrefix(arg, ConfigFileArgPrefix))
        {
            config_file_path = arg.substr(std::strlen(ConfigFileArgPrefix));
        }
        else if (!hasPrefix(arg, "SPDLOG_LEVEL=") && !hasPrefix(arg, "SPDLOG_FLUSH_LEVEL="))
        {
            args.push_back(std::move(arg));
        }
    }
    return args;
}

void printUsage()
{
    std::cerr << "Usage: ddprpc-cli <command> [args...] [CONFIG_FILE=<path>] [SPDLOG_LEVEL=<levels>]\n"
                 "Commands:\n"
                 "  test                          Check connection and authentication\n"
                 "  get <name>                    Get application by name (null if not found)\n"
                 "  status <id>                   Get application record\n"
                 "  create <json-spec>            Create application, and wait for its job\n"
                 "  update <name> <json-spec>     Update application, and wait for its job\n"
                 "  start <id>                    Start application\n"
                 "  stop <id>                     Stop application\n"
                 "  redeploy <name>               Pull images and redeploy application\n"
                 "  verify <name>                 Verify that application is running (or deploying)\n"
                 "  call <method> [json-params]   Call arbitrary remote method\n"
                 "  call-job <method> [json-params]\n"
                 "                                Call remote method, and wait for the job it starts\n";
}

/// Waits for the result of the given sender.
///
/// Termination signal disconnects the client, which in turn fails the operation.
///
template <typename Result>
Result waitForResult(Executor& executor, Client& client, typename ddprpc::sdk::SenderOf<Result>::Ptr sender)
{
    return ddprpc::sdk::sync_wait<Result>(
        executor,
        std::move(sender),
        [] { return g_running == 0; },
        [&client] {
            //
            spdlog::debug("Received termination signal.");
            client.disconnect();
        });
}

int reportFailure(const Error& error)
{
    spdlog::error("Command failed ({}).", error);
    std::cerr << fmt::format("{}", error) << '\n';
    if (!error.payload.is_null())
    {
        std::cerr << error.payload.dump(2, ' ', false, Json::error_handler_t::replace) << '\n';
    }
    return EXIT_FAILURE;
}

int reportCallResult(Client::Call::Result&& result)
{
    if (const auto* const failure = cetl::get_if<Client::Call::Failure>(&result))
    {
        return reportFailure(*failure);
    }
    const auto& success = cetl::get<Client::Call::Success>(result);
    std::cout << success.dump(2, ' ', false, Json::error_handler_t::replace) << '\n';
    return EXIT_SUCCESS;
}

/// Parses a JSON command argument; missing optional argument is an empty array of params.
///
bool parseJsonArg(const std::vector<std::string>& args, const std::size_t index, Json& out_json)
{
    if (index >= args.size())
    {
        out_json = Json::array();
        return true;
    }
    out_json = Json::parse(args[index], nullptr, false);
    if (out_json.is_discarded())
    {
        std::cerr << "Invalid JSON argument: " << args[index] << '\n';
        return false;
    }
    return true;
}

int runVerify(Executor& executor, Client& client, const std::string& name)
{
    using ddprpc::sdk::AppState;

    auto result = waitForResult<Client::Call::Result>(executor, client, client.getStatus(name));
    if (const auto* const failure = cetl::get_if<Client::Call::Failure>(&result))
    {
        return reportFailure(*failure);
    }

    const auto state = ddprpc::sdk::parseAppState(cetl::get<Client::Call::Success>(result));
    spdlog::info("App '{}' status: {}.", name, toString(state));
    switch (state)
    {
    case AppState::Running:
        std::cout << "App '" << name << "' is running.\n";
        return EXIT_SUCCESS;
    case AppState::Deploying:
        std::cout << "App '" << name << "' is still deploying.\n";
        return EXIT_SUCCESS;
    default:
        std::cerr << "App '" << name << "' is in " << toString(state) << " state.\n";
        return EXIT_FAILURE;
    }
}

int runCommand(Executor& executor, Client& client, const std::vector<std::string>& args)
{
    using CallResult = Client::Call::Result;

    const auto& command = args.front();
    const auto  arg_at  = [&args](const std::size_t index) { return (index < args.size()) ? args[index] : ""; };

    if (command == "test")
    {
        return reportCallResult(waitForResult<CallResult>(executor, client, client.testConnection()));
    }
    if (command == "get")
    {
        using Lookup = Client::Lookup;

        auto result = waitForResult<Lookup::Result>(executor, client, client.getByName(arg_at(1)));
        if (const auto* const failure = cetl::get_if<Lookup::Failure>(&result))
        {
            return reportFailure(*failure);
        }
        const auto& maybe_app = cetl::get<Lookup::Success>(result);
        std::cout << (maybe_app ? maybe_app->dump(2, ' ', false, Json::error_handler_t::replace) : "null") << '\n';
        return EXIT_SUCCESS;
    }
    if (command == "status")
    {
        return reportCallResult(waitForResult<CallResult>(executor, client, client.getStatus(arg_at(1))));
    }
    if (command == "create")
    {
        Json spec;
        if (!parseJsonArg(args, 1, spec))
        {
            return EXIT_FAILURE;
        }
        return reportCallResult(waitForResult<CallResult>(executor, client, client.create(std::move(spec))));
    }
    if (command == "update")
    {
        Json spec;
        if (!parseJsonArg(args, 2, spec))
        {
            return EXIT_FAILURE;
        }
        return reportCallResult(waitForResult<CallResult>(executor, client, client.update(arg_at(1), std::move(spec))));
    }
    if (command == "start")
    {
        return reportCallResult(waitForResult<CallResult>(executor, client, client.start(arg_at(1))));
    }
    if (command == "stop")
    {
        return reportCallResult(waitForResult<CallResult>(executor, client, client.stop(arg_at(1))));
    }
    if (command == "redeploy")
    {
        return reportCallResult(waitForResult<CallResult>(executor, client, client.pullAndRedeploy(arg_at(1))));
    }
    if (command == "verify")
    {
        return runVerify(executor, client, arg_at(1));
    }
    if ((command == "call") || (command == "call-job"))
    {
        Json params;
        if (!parseJsonArg(args, 2, params))
        {
            return EXIT_FAILURE;
        }
        auto sender = (command == "call") ? client.call(arg_at(1), std::move(params))
                                          : client.callJob(arg_at(1), std::move(params));
        return reportCallResult(waitForResult<CallResult>(executor, client, std::move(sender)));
    }

    std::cerr << "Unknown command: " << command << '\n';
    printUsage();
    return EXIT_FAILURE;
}

}  // namespace

int main(const int argc, const char** const argv)
{
    setupSignalHandlers();

    std::string config_file_path;
    const auto  args = parseArgs(argc, argv, config_file_path);
    if (args.empty())
    {
        printUsage();
        return EXIT_FAILURE;
    }

    ddprpc::cli::Config::Ptr config;
    try
    {
        config = ddprpc::cli::Config::make(config_file_path);

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to load configuration '" << config_file_path << "': " << ex.what() << '\n';
        return EXIT_FAILURE;
    }
    try
    {
        ddprpc::cli::setupLogging(argc, argv, *config);

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        return EXIT_FAILURE;
    }

    spdlog::info("ddprpc client started (ver='{}.{}', cmd='{}').", VERSION_MAJOR, VERSION_MINOR, args.front());
    int result = EXIT_SUCCESS;
    try
    {
        Client::Options options;
        if (const auto address = config->getServerAddress())
        {
            options.address = *address;
        }
        else
        {
            std::cerr << "Missing `server.address` in configuration '" << config_file_path << "'.\n";
            return EXIT_FAILURE;
        }
        options.api_key           = config->getServerApiKey();
        options.call_timeout      = config->getCallTimeout();
        options.job_poll_interval = config->getJobPollInterval();
        options.job_max_wait      = config->getJobMaxWait();
        if (options.api_key.empty())
        {
            spdlog::warn("API key is empty (neither `server.api_key` nor `{}` is set).",
                         ddprpc::cli::Config::ApiKeyEnvVar);
        }

        Executor executor;

        const auto client = Client::make(executor, options);
        if (!client)
        {
            spdlog::critical("Failed to create client.");
            std::cerr << "Failed to create client of '" << options.address << "'.\n";
            return EXIT_FAILURE;
        }

        result = runCommand(executor, *client, args);
        client->disconnect();

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("ddprpc client terminated (result={}).", result);

    return result;
}
