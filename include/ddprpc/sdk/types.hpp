//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_SDK_TYPES_HPP_INCLUDED
#define DDPRPC_SDK_TYPES_HPP_INCLUDED

#include <nlohmann/json.hpp>

#include <cstdint>

namespace ddprpc
{
namespace sdk
{

/// Opaque structured payload of remote calls (parameters, results and error details).
///
using Json = nlohmann::json;

/// State of the single duplex connection to the remote peer.
///
enum class ConnectionState : std::uint8_t
{
    Connecting,
    Open,
    Closing,
    Closed,

};  // ConnectionState

inline const char* toString(const ConnectionState state) noexcept
{
    switch (state)
    {
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::Open:
        return "Open";
    case ConnectionState::Closing:
        return "Closing";
    case ConnectionState::Closed:
        return "Closed";
    }
    return "?";
}

}  // namespace sdk
}  // namespace ddprpc

#endif  // DDPRPC_SDK_TYPES_HPP_INCLUDED
