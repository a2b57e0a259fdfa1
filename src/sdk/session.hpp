//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_SDK_SESSION_HPP_INCLUDED
#define DDPRPC_SDK_SESSION_HPP_INCLUDED

#include <ddprpc/sdk/error.hpp>

#include "rpc/correlator.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ddprpc
{
namespace sdk
{

/// Authentication gate of the connection.
///
/// Lazily opens the connection (and so the protocol handshake), and logs in with the API key.
/// Concurrent `ensureAuthenticated` requests share a single in-flight attempt.
///
class Session
{
public:
    using Ptr = std::shared_ptr<Session>;

    enum class State : std::uint8_t
    {
        Unauthenticated,
        Authenticating,
        Authenticated,
        Failed,  // handshake or authentication failure (latched)

    };  // State

    /// Receives `nullopt` once the session is authenticated, otherwise the failure.
    using Completion = std::function<void(const cetl::optional<Error>&)>;

    /// Called whenever the (previously opened) connection is closed.
    using DisconnectHandler = std::function<void(const Error&)>;

    static constexpr auto LoginMethod = "auth.login_with_api_key";

    /// `login_timeout` bounds both the connect (with handshake) phase and the login call.
    ///
    CETL_NODISCARD static Ptr make(libcyphal::IExecutor&        executor,
                                   common::rpc::Correlator::Ptr correlator,
                                   std::string                  api_key,
                                   const libcyphal::Duration    login_timeout);

    Session(const Session&)                = delete;
    Session(Session&&) noexcept            = delete;
    Session& operator=(const Session&)     = delete;
    Session& operator=(Session&&) noexcept = delete;

    virtual ~Session() = default;

    /// Completes immediately if already authenticated; otherwise joins (or initiates) the authentication attempt.
    ///
    virtual void ensureAuthenticated(Completion completion) = 0;

    /// Closes the connection for good; pending and further requests fail with `Error::closed()`.
    ///
    virtual void shutdown() = 0;

    virtual void setDisconnectHandler(DisconnectHandler handler) = 0;

    CETL_NODISCARD virtual State state() const = 0;

    CETL_NODISCARD bool isAuthenticated() const
    {
        return state() == State::Authenticated;
    }

protected:
    Session() = default;

};  // Session

inline const char* toString(const Session::State state) noexcept
{
    switch (state)
    {
    case Session::State::Unauthenticated:
        return "Unauthenticated";
    case Session::State::Authenticating:
        return "Authenticating";
    case Session::State::Authenticated:
        return "Authenticated";
    case Session::State::Failed:
        return "Failed";
    }
    return "?";
}

}  // namespace sdk
}  // namespace ddprpc

#endif  // DDPRPC_SDK_SESSION_HPP_INCLUDED
