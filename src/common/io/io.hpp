//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_COMMON_IO_HPP_INCLUDED
#define DDPRPC_COMMON_IO_HPP_INCLUDED

#include <cstddef>
#include <utility>

namespace ddprpc
{
namespace common
{
namespace io
{

/// RAII owner of a file descriptor (socket).
///
/// Negative value means "no descriptor".
///
class OwnFd final
{
public:
    OwnFd() noexcept
        : fd_{-1}
    {
    }

    explicit OwnFd(const int fd) noexcept
        : fd_{fd}
    {
    }

    OwnFd(OwnFd&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
    {
    }

    OwnFd& operator=(OwnFd&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    OwnFd& operator=(std::nullptr_t) noexcept
    {
        reset();
        return *this;
    }

    // Disallow copy.
    OwnFd(const OwnFd&)            = delete;
    OwnFd& operator=(const OwnFd&) = delete;

    ~OwnFd();

    int get() const noexcept
    {
        return fd_;
    }

    bool valid() const noexcept
    {
        return fd_ >= 0;
    }

    /// Closes the owned descriptor (if any).
    ///
    void reset() noexcept;

    /// Gives up ownership without closing the descriptor.
    ///
    int release() noexcept
    {
        return std::exchange(fd_, -1);
    }

private:
    int fd_;

};  // OwnFd

}  // namespace io
}  // namespace common
}  // namespace ddprpc

#endif  // DDPRPC_COMMON_IO_HPP_INCLUDED
