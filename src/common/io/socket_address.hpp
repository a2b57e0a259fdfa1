//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
#define DDPRPC_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED

#include "io.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <sys/socket.h>
#include <utility>

namespace ddprpc
{
namespace common
{
namespace io
{

/// Address of the RPC server.
///
/// Supported formats:
/// - `unix:/path/to/socket` - Unix domain socket;
/// - `unix-abstract:name` - Linux abstract Unix domain socket;
/// - `1.2.3.4[:port]`, `[::1][:port]` or `::1` - numeric IPv4/IPv6 address;
/// - `host.name[:port]` - DNS name, resolved with `getaddrinfo` (the first stream address wins).
///
class SocketAddress final
{
public:
    struct ParseResult
    {
        using Failure = int;  // aka errno
        using Success = SocketAddress;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Parses the address; `default_port` is used if there is no port in the string.
    static ParseResult::Var parse(const std::string& str, const std::uint16_t default_port);

    SocketAddress() noexcept;

    std::pair<const sockaddr*, socklen_t> getRaw() const noexcept
    {
        return {&as<sockaddr>(), length_};
    }

    sa_family_t family() const noexcept
    {
        return as<sockaddr>().sa_family;
    }

    bool isUnix() const noexcept
    {
        return family() == AF_UNIX;
    }

    bool isAnyInet() const noexcept
    {
        return (family() == AF_INET) || (family() == AF_INET6);
    }

    /// Canonical form of the address (for logging); parsing it gives the same address.
    std::string toString() const;

    struct SocketResult
    {
        using Failure = int;  // aka errno
        using Success = OwnFd;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Makes a new non-blocking (and close-on-exec) socket of the address family.
    SocketResult::Var socket(const int type) const;

    /// Initiates connection; `EINPROGRESS` is reported as success (completion is awaited by writability).
    int connect(const OwnFd& socket_fd) const;

private:
    struct Endpoint
    {
        int           family;
        std::string   host;
        std::uint16_t port;
    };

    static ParseResult::Var        makeUnix(const std::string& path, const bool is_abstract);
    static cetl::optional<Endpoint> splitEndpoint(const std::string& str, const std::uint16_t default_port);
    static ParseResult::Var        makeInet(const Endpoint& endpoint);
    static ParseResult::Var        resolve(const Endpoint& endpoint);

    template <typename Addr>
    const Addr& as() const noexcept
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const Addr&>(storage_);
    }

    template <typename Addr>
    Addr& as() noexcept
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<Addr&>(storage_);
    }

    socklen_t        length_;
    sockaddr_storage storage_;

};  // SocketAddress

}  // namespace io
}  // namespace common
}  // namespace ddprpc

#endif  // DDPRPC_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
