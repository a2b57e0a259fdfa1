//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io.hpp"

#include "logging.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace ddprpc
{
namespace common
{
namespace io
{

OwnFd::~OwnFd()
{
    reset();
}

void OwnFd::reset() noexcept
{
    const int fd = std::exchange(fd_, -1);
    if (fd < 0)
    {
        return;
    }

    // Not via `posixSyscallError` b/c `close` must not be repeated on `EINTR` (the descriptor is released anyway).
    if (::close(fd) < 0)
    {
        const int err = errno;
        getLogger("io")->warn("Failed to close descriptor (fd={}): {}.", fd, std::strerror(err));
    }
}

}  // namespace io
}  // namespace common
}  // namespace ddprpc
