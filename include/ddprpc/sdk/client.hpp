//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_SDK_CLIENT_HPP_INCLUDED
#define DDPRPC_SDK_CLIENT_HPP_INCLUDED

#include "error.hpp"
#include "execution.hpp"
#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ddprpc
{
namespace sdk
{

/// Defines client side interface of the remote application management API.
///
/// The client owns a single duplex connection to the server, which is opened lazily on the first call
/// (followed by the protocol handshake and the API key authentication). Any number of calls could be
/// in flight at the same time; their results are emitted independently, in whatever order the server responds.
///
/// Every operation returns a sender, which does nothing until it is submitted (see `submit` and `sync_wait`).
/// All results are emitted on the executor thread.
///
class Client
{
public:
    /// Defines the shared pointer type for the interface.
    ///
    using Ptr = std::shared_ptr<Client>;

    struct Options final
    {
        /// Server address, f.e. `nas.local:6000`, `[::1]:6000` or `unix:/run/middleware.sock`.
        std::string address;

        std::string api_key;

        /// Deadline of every single remote call (including job status queries).
        std::chrono::milliseconds call_timeout{30000};

        /// Interval between job status queries.
        std::chrono::milliseconds job_poll_interval{2000};

        /// Max total time to wait for a job; `nullopt` means unlimited.
        cetl::optional<std::chrono::milliseconds> job_max_wait;

    };  // Options

    /// Default TCP port of the server (used if the address has none).
    static constexpr std::uint16_t DefaultPort = 6000;

    /// Defines the result type of a remote call (or of an awaited job).
    ///
    struct Call final
    {
        using Success = Json;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;

    };  // Call

    /// Defines the result type of a lookup operation; `nullopt` means "not found".
    ///
    struct Lookup final
    {
        using Success = cetl::optional<Json>;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;

    };  // Lookup

    /// Makes a new client.
    ///
    /// No connection is made until the first operation is submitted.
    ///
    /// @param executor The executor to run on; must support POSIX awaitable resources
    ///                 (f.e. `platform::SingleThreadedExecutor`).
    /// @param options Connection and timing options.
    /// @return Shared pointer to the client, or `nullptr` if the address is invalid (or could not be resolved).
    ///
    CETL_NODISCARD static Ptr make(libcyphal::IExecutor& executor, const Options& options);

    Client(Client&&)                 = delete;
    Client(const Client&)            = delete;
    Client& operator=(Client&&)      = delete;
    Client& operator=(const Client&) = delete;

    virtual ~Client() = default;

    /// Calls an arbitrary remote method.
    ///
    virtual SenderOf<Call::Result>::Ptr call(std::string method, Json params) = 0;

    /// Calls a remote method which returns a job id, and waits for the job to complete.
    ///
    /// @return Sender of the job result, or of `JobFailed` error with the job reported error payload.
    ///
    virtual SenderOf<Call::Result>::Ptr callJob(std::string method, Json params) = 0;

    /// Checks the connection (and authentication) by querying `system.info`.
    ///
    virtual SenderOf<Call::Result>::Ptr testConnection() = 0;

    /// Gets an application by its name; any remote error is treated as "not found".
    ///
    virtual SenderOf<Lookup::Result>::Ptr getByName(std::string name) = 0;

    /// Gets an application record (including its `state`).
    ///
    virtual SenderOf<Call::Result>::Ptr getStatus(std::string id) = 0;

    /// Creates an application, and waits for the creation job.
    ///
    /// @param spec Application specification (forwarded to the server as is).
    ///
    virtual SenderOf<Call::Result>::Ptr create(Json spec) = 0;

    /// Updates an application, and waits for the update job.
    ///
    virtual SenderOf<Call::Result>::Ptr update(std::string name, Json spec) = 0;

    /// Starts an application. The start job is not awaited.
    virtual SenderOf<Call::Result>::Ptr start(std::string id) = 0;

    /// Stops an application. The stop job is not awaited.
    virtual SenderOf<Call::Result>::Ptr stop(std::string id) = 0;

    /// Pulls fresh images of an application and redeploys it; waits for the job.
    ///
    virtual SenderOf<Call::Result>::Ptr pullAndRedeploy(std::string name) = 0;

    /// Closes the connection for good.
    ///
    /// Every outstanding call (and job wait) fails with `Error::closed()`, so as any further operation.
    /// Safe to call more than once.
    ///
    virtual void disconnect() = 0;

    CETL_NODISCARD virtual bool            isAuthenticated() const = 0;
    CETL_NODISCARD virtual ConnectionState connectionState() const = 0;

protected:
    Client() = default;

};  // Client

/// State of a remote application (as reported in its `state` field).
///
enum class AppState : std::uint8_t
{
    Unknown,
    Crashed,
    Deploying,
    Running,
    Stopped,
    Stopping,

};  // AppState

/// Parses the `state` field of an application record; anything unexpected is `Unknown`.
///
AppState parseAppState(const Json& app_record);

const char* toString(const AppState state) noexcept;

}  // namespace sdk
}  // namespace ddprpc

#endif  // DDPRPC_SDK_CLIENT_HPP_INCLUDED
