//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_COMMON_RPC_FRAME_HPP_INCLUDED
#define DDPRPC_COMMON_RPC_FRAME_HPP_INCLUDED

#include "rpc/rpc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <utility>
#include <vector>

namespace ddprpc
{
namespace common
{
namespace rpc
{

/// DDP frames, one per `msg` kind.
///
struct Frame final
{
    struct Connect final
    {
        std::string              version{"1"};
        std::vector<std::string> support{"1"};
    };
    struct Connected final
    {
        std::string session;
    };
    struct Failed final
    {
        std::string version;
    };
    struct Method final
    {
        std::string id;
        std::string method;
        Json        params;
    };
    struct Result final
    {
        std::string id;
        Json        result;
    };
    struct Error final
    {
        std::string id;  // empty if the peer has not correlated the error with a call
        Json        error;
    };
    struct Ping final
    {
        cetl::optional<std::string> id;
    };
    struct Pong final
    {
        cetl::optional<std::string> id;
    };
    /// Any other well-formed frame (kept for logging only).
    struct Other final
    {
        std::string msg;
    };

    using Var = cetl::variant<Connect, Connected, Failed, Method, Result, Error, Ping, Pong, Other>;

};  // Frame

/// Parses a single frame text.
///
/// @return Zero on success; `EINVAL` if the text is not a JSON object, or `EPROTO` if there is no `msg` field,
///         or fields required by the frame kind are missing (f.e. `result` frame without `id`).
///
CETL_NODISCARD int tryDeserializeFrame(const Payload payload, Frame::Var& out_frame);

/// Serializes the frame to its single line JSON text (without the line terminator).
///
CETL_NODISCARD std::string serializeFrame(const Frame::Var& frame);

/// Serializes the frame, and performs the given action on the resulting text.
///
template <typename Action>
static int tryPerformOnSerialized(const Frame::Var& frame, Action&& action)
{
    const auto text = serializeFrame(frame);
    if (text.empty())
    {
        return EINVAL;
    }
    return std::forward<Action>(action)(Payload{text.data(), text.size()});
}

}  // namespace rpc
}  // namespace common
}  // namespace ddprpc

#endif  // DDPRPC_COMMON_RPC_FRAME_HPP_INCLUDED
