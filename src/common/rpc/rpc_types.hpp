//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_COMMON_RPC_TYPES_HPP_INCLUDED
#define DDPRPC_COMMON_RPC_TYPES_HPP_INCLUDED

#include <ddprpc/sdk/error.hpp>
#include <ddprpc/sdk/types.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <chrono>

namespace ddprpc
{
namespace common
{
namespace rpc
{

using Json            = sdk::Json;
using Error           = sdk::Error;
using ConnectionState = sdk::ConnectionState;

/// Text of a single frame (one JSON object, without the line terminator).
///
using Payload = cetl::string_view;

/// Defines some common error codes of RPC transport operations.
///
/// Maps to `errno` values, hence `int` inheritance and zero on success.
///
enum class ErrorCode : int  // NOLINT
{
    Success         = 0,
    NotConnected    = ENOTCONN,
    AlreadyStarted  = EALREADY,
    FrameTooLarge   = EMSGSIZE,
    SendTimedOut    = ETIMEDOUT,
    ConnectionReset = ECONNRESET,

};  // ErrorCode

/// Default deadline of a single remote call.
///
constexpr std::chrono::seconds DefaultCallTimeout{30};

}  // namespace rpc
}  // namespace common
}  // namespace ddprpc

#endif  // DDPRPC_COMMON_RPC_TYPES_HPP_INCLUDED
