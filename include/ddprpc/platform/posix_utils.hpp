//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_PLATFORM_POSIX_UTILS_HPP_INCLUDED
#define DDPRPC_PLATFORM_POSIX_UTILS_HPP_INCLUDED

#include <cerrno>

namespace ddprpc
{
namespace platform
{

/// Wraps a POSIX syscall and retries it if it was interrupted by a signal.
///
/// @return Zero on success, otherwise the `errno` value of the last failed attempt.
///
template <typename Call>
int posixSyscallError(const Call& call)
{
    while (call() < 0)
    {
        const int error_num = errno;
        if (error_num != EINTR)
        {
            return error_num;
        }
    }
    return 0;
}

/// Same as `posixSyscallError`, but also stores the (non-negative) result of the syscall.
///
/// Handy for `send`/`recv`/`epoll_wait` like calls where the result is a count.
///
template <typename Result, typename Call>
int posixSyscallResult(Result& out_result, const Call& call)
{
    return posixSyscallError([&out_result, &call] {
        //
        out_result = call();
        return out_result;
    });
}

}  // namespace platform
}  // namespace ddprpc

#endif  // DDPRPC_PLATFORM_POSIX_UTILS_HPP_INCLUDED
