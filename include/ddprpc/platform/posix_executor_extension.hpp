//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
#define DDPRPC_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

namespace ddprpc
{
namespace platform
{

/// Extension of an executor which is able to await POSIX file descriptors.
///
/// Obtained from an `libcyphal::IExecutor` instance via `cetl::rtti_cast`.
///
class IPosixExecutorExtension
{
    // 6B1D3A0E-5C4F-4E21-9A7B-2D8C41F0E593
    using TypeIdType = cetl::
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        type_id_type<0x6B, 0x1D, 0x3A, 0x0E, 0x5C, 0x4F, 0x4E, 0x21, 0x9A, 0x7B, 0x2D, 0x8C, 0x41, 0xF0, 0xE5, 0x93>;

public:
    IPosixExecutorExtension(const IPosixExecutorExtension&)                = delete;
    IPosixExecutorExtension(IPosixExecutorExtension&&) noexcept            = delete;
    IPosixExecutorExtension& operator=(const IPosixExecutorExtension&)     = delete;
    IPosixExecutorExtension& operator=(IPosixExecutorExtension&&) noexcept = delete;

    struct Trigger
    {
        struct Readable
        {
            int fd;
        };
        struct Writable
        {
            int fd;
        };
        /// Either of the above (f.e. a socket which has both incoming data and pending output).
        struct ReadableOrWritable
        {
            int fd;
        };

        using Variant = cetl::variant<Readable, Writable, ReadableOrWritable>;
    };

    /// Registers a callback which is executed (by the executor's spin) each time the trigger condition is met.
    ///
    /// The file descriptor stays watched for as long as the returned callback handle is alive.
    /// Re-registering the same descriptor replaces its previous trigger.
    ///
    CETL_NODISCARD virtual libcyphal::IExecutor::Callback::Any registerAwaitableCallback(
        libcyphal::IExecutor::Callback::Function&& function,
        const Trigger::Variant&                    trigger) = 0;

    // MARK: RTTI

    static constexpr cetl::type_id _get_type_id_() noexcept
    {
        return cetl::type_id_type_value<TypeIdType>();
    }

protected:
    IPosixExecutorExtension()  = default;
    ~IPosixExecutorExtension() = default;

};  // IPosixExecutorExtension

}  // namespace platform
}  // namespace ddprpc

#endif  // DDPRPC_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
