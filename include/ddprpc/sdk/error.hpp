//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_SDK_ERROR_HPP_INCLUDED
#define DDPRPC_SDK_ERROR_HPP_INCLUDED

#include "types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>

namespace ddprpc
{
namespace sdk
{

/// Typed failure of a remote call (or of the connection which carries it).
///
/// `Transport`, `Handshake` and `Authentication` failures are fatal to the connection,
/// and so reject every pending call; the rest are scoped to a single call.
///
struct Error final
{
    enum class Kind : std::uint8_t
    {
        Transport,
        Handshake,
        Authentication,
        Remote,
        Timeout,
        JobFailed,
        Cancelled,
        InvalidArgument,

    };  // Kind

    Kind        kind;
    int         code;  // aka errno
    std::string message;
    Json        payload;

    CETL_NODISCARD bool isFatalToConnection() const noexcept
    {
        return (kind == Kind::Transport) || (kind == Kind::Handshake) || (kind == Kind::Authentication);
    }

    // MARK: Factories

    static Error transport(const int code, std::string message)
    {
        return Error{Kind::Transport, code, std::move(message), nullptr};
    }

    /// Error of explicitly disconnected client (or of a call issued after that).
    static Error closed()
    {
        return transport(ESHUTDOWN, "Client is disconnected");
    }

    static Error connectionLost(const int code = ECONNRESET)
    {
        return transport(code, "Connection lost");
    }

    static Error handshake(std::string message)
    {
        return Error{Kind::Handshake, EPROTO, std::move(message), nullptr};
    }

    static Error authentication(std::string message, Json payload = nullptr)
    {
        return Error{Kind::Authentication, EACCES, std::move(message), std::move(payload)};
    }

    /// Makes an application-level error out of the remote error payload.
    ///
    /// The message is taken from `reason` (or `error`) field of the payload if any.
    ///
    static Error remote(Json payload)
    {
        std::string message;
        if (payload.is_string())
        {
            message = payload.get<std::string>();
        }
        else if (payload.is_object())
        {
            for (const auto* const key : {"reason", "error", "message"})
            {
                const auto found = payload.find(key);
                if ((found != payload.end()) && found->is_string())
                {
                    message = found->get<std::string>();
                    break;
                }
            }
        }
        if (message.empty())
        {
            message = payload.dump(-1, ' ', false, Json::error_handler_t::replace);
        }
        return Error{Kind::Remote, EREMOTEIO, std::move(message), std::move(payload)};
    }

    static Error timeout(std::string message)
    {
        return Error{Kind::Timeout, ETIMEDOUT, std::move(message), nullptr};
    }

    static Error jobFailed(const int code, std::string message, Json payload = nullptr)
    {
        return Error{Kind::JobFailed, code, std::move(message), std::move(payload)};
    }

    static Error cancelled(std::string message)
    {
        return Error{Kind::Cancelled, ECANCELED, std::move(message), nullptr};
    }

    static Error invalidArgument(std::string message)
    {
        return Error{Kind::InvalidArgument, EINVAL, std::move(message), nullptr};
    }

};  // Error

inline const char* toString(const Error::Kind kind) noexcept
{
    switch (kind)
    {
    case Error::Kind::Transport:
        return "Transport";
    case Error::Kind::Handshake:
        return "Handshake";
    case Error::Kind::Authentication:
        return "Authentication";
    case Error::Kind::Remote:
        return "Remote";
    case Error::Kind::Timeout:
        return "Timeout";
    case Error::Kind::JobFailed:
        return "JobFailed";
    case Error::Kind::Cancelled:
        return "Cancelled";
    case Error::Kind::InvalidArgument:
        return "InvalidArgument";
    }
    return "?";
}

}  // namespace sdk
}  // namespace ddprpc

template <>
struct fmt::formatter<ddprpc::sdk::Error> : formatter<string_view>
{
    auto format(const ddprpc::sdk::Error& error, format_context& ctx) const
    {
        return fmt::format_to(ctx.out(), "{} error (code={}): {}", toString(error.kind), error.code, error.message);
    }
};

#endif  // DDPRPC_SDK_ERROR_HPP_INCLUDED
