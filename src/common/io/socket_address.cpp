//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_address.hpp"

#include "io.hpp"
#include "logging.hpp"

#include <ddprpc/platform/posix_utils.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <utility>

namespace ddprpc
{
namespace common
{
namespace io
{
namespace
{

constexpr auto UnixPrefix         = "unix:";
constexpr auto AbstractUnixPrefix = "unix-abstract:";

bool startsWith(const std::string& str, const char* const prefix)
{
    return str.compare(0, std::strlen(prefix), prefix) == 0;
}

/// Parses decimal port number in [1, 65535] range.
///
cetl::optional<std::uint16_t> parsePort(const std::string& str)
{
    if (str.empty() || (str.find_first_not_of("0123456789") != std::string::npos))
    {
        getLogger("io")->error("Invalid port number (port='{}').", str);
        return cetl::nullopt;
    }

    constexpr int       Base  = 10;
    const std::uint64_t value = std::strtoull(str.c_str(), nullptr, Base);
    if ((value == 0) || (value > std::numeric_limits<std::uint16_t>::max()))
    {
        getLogger("io")->error("Port number is out of range (port='{}').", str);
        return cetl::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

}  // namespace

SocketAddress::SocketAddress() noexcept
    : length_{0}
    , storage_{}
{
}

SocketAddress::ParseResult::Var SocketAddress::parse(const std::string& str, const std::uint16_t default_port)
{
    if (startsWith(str, AbstractUnixPrefix))
    {
        return makeUnix(str.substr(std::strlen(AbstractUnixPrefix)), true);
    }
    if (startsWith(str, UnixPrefix))
    {
        return makeUnix(str.substr(std::strlen(UnixPrefix)), false);
    }

    const auto endpoint = splitEndpoint(str, default_port);
    if (!endpoint)
    {
        getLogger("io")->error("Invalid address (addr='{}').", str);
        return EINVAL;
    }
    return makeInet(*endpoint);
}

SocketAddress::ParseResult::Var SocketAddress::makeUnix(const std::string& path, const bool is_abstract)
{
    SocketAddress result{};
    auto&         addr_un = result.as<sockaddr_un>();
    addr_un.sun_family    = AF_UNIX;

    // Abstract name goes after the leading null byte.
    const std::size_t offset = is_abstract ? 1 : 0;
    if (path.empty() || ((offset + path.size() + 1) > sizeof(addr_un.sun_path)))
    {
        getLogger("io")->error("Invalid Unix domain path (path='{}', abstract={}).", path, is_abstract);
        return EINVAL;
    }

    // NOLINTNEXTLINE(*-array-to-pointer-decay, *-no-array-decay, *-pointer-arithmetic)
    std::memcpy(addr_un.sun_path + offset, path.c_str(), path.size() + 1);
    // Either the leading null byte (abstract), or the terminating one.
    result.length_ = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + path.size() + 1);
    return result;
}

/// Splits `host[:port]`, `[ipv6][:port]` or bare `ipv6` into its parts.
///
/// Only the form of the address is checked here; host itself is validated (or resolved) later.
///
cetl::optional<SocketAddress::Endpoint> SocketAddress::splitEndpoint(const std::string& str,
                                                                     const std::uint16_t default_port)
{
    Endpoint    endpoint{AF_INET, {}, default_port};
    std::string port_str;
    bool        has_port = false;

    if (!str.empty() && (str.front() == '['))
    {
        const auto closing = str.find(']');
        if (closing == std::string::npos)
        {
            return cetl::nullopt;
        }
        endpoint.family = AF_INET6;
        endpoint.host   = str.substr(1, closing - 1);

        const auto rest = str.substr(closing + 1);
        if (!rest.empty())
        {
            if (rest.front() != ':')
            {
                return cetl::nullopt;
            }
            has_port = true;
            port_str = rest.substr(1);
        }
    }
    else
    {
        const auto first_colon = str.find(':');
        const auto last_colon  = str.rfind(':');
        if (first_colon == std::string::npos)
        {
            endpoint.host = str;
        }
        else if (first_colon != last_colon)
        {
            // Several colons without brackets could only be an IPv6 address (without port).
            endpoint.family = AF_INET6;
            endpoint.host   = str;
        }
        else
        {
            has_port      = true;
            endpoint.host = str.substr(0, first_colon);
            port_str      = str.substr(first_colon + 1);
        }
    }

    if (endpoint.host.empty())
    {
        return cetl::nullopt;
    }
    if (has_port)
    {
        const auto port = parsePort(port_str);
        if (!port)
        {
            return cetl::nullopt;
        }
        endpoint.port = *port;
    }
    return endpoint;
}

SocketAddress::ParseResult::Var SocketAddress::makeInet(const Endpoint& endpoint)
{
    SocketAddress result{};
    void*         binary_addr = nullptr;
    if (endpoint.family == AF_INET6)
    {
        auto& addr_in6       = result.as<sockaddr_in6>();
        addr_in6.sin6_family = AF_INET6;
        addr_in6.sin6_port   = htons(endpoint.port);
        binary_addr          = &addr_in6.sin6_addr;
        result.length_       = sizeof(addr_in6);
    }
    else
    {
        auto& addr_in      = result.as<sockaddr_in>();
        addr_in.sin_family = AF_INET;
        addr_in.sin_port   = htons(endpoint.port);
        binary_addr        = &addr_in.sin_addr;
        result.length_     = sizeof(addr_in);
    }

    const int converted = ::inet_pton(endpoint.family, endpoint.host.c_str(), binary_addr);
    if (converted == 1)
    {
        return result;
    }
    if (converted < 0)
    {
        const int err = errno;
        getLogger("io")->error("Failed to parse address (host='{}'): {}.", endpoint.host, std::strerror(err));
        return err;
    }

    // Not a numeric address. Bracketed (or multi-colon) ones must be numeric IPv6;
    // anything else is a host name to resolve.
    if (endpoint.family == AF_INET6)
    {
        getLogger("io")->error("Invalid IPv6 address (host='{}').", endpoint.host);
        return EINVAL;
    }
    return resolve(endpoint);
}

SocketAddress::ParseResult::Var SocketAddress::resolve(const Endpoint& endpoint)
{
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo*  raw_list = nullptr;
    const auto service  = std::to_string(endpoint.port);
    const int  gai_err  = ::getaddrinfo(endpoint.host.c_str(), service.c_str(), &hints, &raw_list);
    const std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> list{raw_list, &::freeaddrinfo};
    if (gai_err != 0)
    {
        getLogger("io")->error("Failed to resolve host name (host='{}'): {}.", endpoint.host, ::gai_strerror(gai_err));
        return EHOSTUNREACH;
    }

    for (const addrinfo* info = list.get(); info != nullptr; info = info->ai_next)
    {
        const bool is_inet = (info->ai_family == AF_INET) || (info->ai_family == AF_INET6);
        if (is_inet && (info->ai_addrlen <= sizeof(sockaddr_storage)))
        {
            SocketAddress result{};
            std::memcpy(&result.storage_, info->ai_addr, info->ai_addrlen);
            result.length_ = info->ai_addrlen;

            getLogger("io")->debug("Host name '{}' is resolved to '{}'.", endpoint.host, result.toString());
            return result;
        }
    }

    getLogger("io")->error("No stream address found for host name (host='{}').", endpoint.host);
    return EHOSTUNREACH;
}

std::string SocketAddress::toString() const
{
    switch (family())
    {
    case AF_UNIX: {
        const auto&       addr_un  = as<sockaddr_un>();
        const std::size_t path_len = length_ - offsetof(sockaddr_un, sun_path);
        if ((path_len > 1) && (addr_un.sun_path[0] == '\0'))
        {
            // NOLINTNEXTLINE(*-pointer-arithmetic)
            return AbstractUnixPrefix + std::string{addr_un.sun_path + 1, path_len - 1};
        }
        return UnixPrefix + std::string{static_cast<const char*>(addr_un.sun_path)};
    }
    case AF_INET: {
        std::array<char, INET_ADDRSTRLEN> text{};
        const auto&                       addr_in = as<sockaddr_in>();
        ::inet_ntop(AF_INET, &addr_in.sin_addr, text.data(), text.size());
        return fmt::format("{}:{}", text.data(), ntohs(addr_in.sin_port));
    }
    case AF_INET6: {
        std::array<char, INET6_ADDRSTRLEN> text{};
        const auto&                        addr_in6 = as<sockaddr_in6>();
        ::inet_ntop(AF_INET6, &addr_in6.sin6_addr, text.data(), text.size());
        return fmt::format("[{}]:{}", text.data(), ntohs(addr_in6.sin6_port));
    }
    default:
        return "<unspecified>";
    }
}

SocketAddress::SocketResult::Var SocketAddress::socket(const int type) const
{
    const auto flags = static_cast<unsigned>(type) | static_cast<unsigned>(SOCK_NONBLOCK | SOCK_CLOEXEC);

    int        raw_fd = -1;
    const auto family = this->family();
    if (const int err = platform::posixSyscallResult(raw_fd, [family, flags] {
            //
            return ::socket(family, static_cast<int>(flags), 0);
        }))
    {
        getLogger("io")->error("Failed to create socket (family={}): {}.", family, std::strerror(err));
        return err;
    }
    OwnFd fd{raw_fd};

    // Frames are small request/response lines, so don't let Nagle's algorithm hold them back.
    if ((type == SOCK_STREAM) && isAnyInet())
    {
        constexpr int on = 1;
        if (const int err = platform::posixSyscallError([&fd] {
                //
                return ::setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));
            }))
        {
            getLogger("io")->warn("Failed to set TCP_NODELAY (fd={}): {}.", fd.get(), std::strerror(err));
        }
    }

    return fd;
}

int SocketAddress::connect(const OwnFd& socket_fd) const
{
    CETL_DEBUG_ASSERT(socket_fd.valid(), "");

    const int err = platform::posixSyscallError([this, &socket_fd] {
        //
        return ::connect(socket_fd.get(), &as<sockaddr>(), length_);
    });
    if ((err == 0) || (err == EINPROGRESS))
    {
        return 0;
    }

    getLogger("io")->error("Failed to connect to '{}': {}.", toString(), std::strerror(err));
    return err;
}

}  // namespace io
}  // namespace common
}  // namespace ddprpc
