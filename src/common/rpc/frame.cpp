//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "frame.hpp"

#include "json_helpers.hpp"
#include "rpc/rpc_types.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <cerrno>
#include <string>
#include <utility>

namespace ddprpc
{
namespace common
{
namespace rpc
{
namespace
{

constexpr auto FieldMsg     = "msg";
constexpr auto FieldId      = "id";
constexpr auto FieldVersion = "version";

/// Ids of requests are strings, but some servers echo them back as numbers.
///
cetl::optional<std::string> tryGetId(const Json& json)
{
    const auto found = json.find(FieldId);
    if (found == json.end())
    {
        return cetl::nullopt;
    }
    if (found->is_string())
    {
        return found->get<std::string>();
    }
    if (found->is_number())
    {
        return found->dump();
    }
    return cetl::nullopt;
}

Json getOr(const Json& json, const char* const key, Json default_value)
{
    const auto found = json.find(key);
    return (found != json.end()) ? *found : std::move(default_value);
}

}  // namespace

int tryDeserializeFrame(const Payload payload, Frame::Var& out_frame)
{
    const auto json = Json::parse(payload.begin(), payload.end(), nullptr, false);
    if (json.is_discarded() || !json.is_object())
    {
        return EINVAL;
    }

    const auto msg = getStringOr(json, FieldMsg, "");
    if (msg.empty())
    {
        return EPROTO;
    }

    if (msg == "result")
    {
        auto id = tryGetId(json);
        if (!id)
        {
            return EPROTO;
        }
        out_frame = Frame::Result{std::move(*id), getOr(json, "result", nullptr)};
        return 0;
    }
    if (msg == "error")
    {
        // An error frame could be uncorrelated (f.e. a malformed request report).
        out_frame = Frame::Error{tryGetId(json).value_or(""), getOr(json, "error", nullptr)};
        return 0;
    }
    if (msg == "ping")
    {
        out_frame = Frame::Ping{tryGetId(json)};
        return 0;
    }
    if (msg == "pong")
    {
        out_frame = Frame::Pong{tryGetId(json)};
        return 0;
    }
    if (msg == "connected")
    {
        out_frame = Frame::Connected{getStringOr(json, "session", "")};
        return 0;
    }
    if (msg == "failed")
    {
        out_frame = Frame::Failed{getStringOr(json, FieldVersion, "")};
        return 0;
    }
    if (msg == "method")
    {
        auto id = tryGetId(json);
        if (!id)
        {
            return EPROTO;
        }
        out_frame = Frame::Method{std::move(*id),  //
                                  getStringOr(json, "method", ""),
                                  getOr(json, "params", Json::array())};
        return 0;
    }
    if (msg == "connect")
    {
        Frame::Connect connect{getStringOr(json, FieldVersion, "1"), {}};
        const auto     support = json.find("support");
        if ((support != json.end()) && support->is_array())
        {
            for (const auto& version : *support)
            {
                if (version.is_string())
                {
                    connect.support.push_back(version.get<std::string>());
                }
            }
        }
        out_frame = std::move(connect);
        return 0;
    }

    out_frame = Frame::Other{msg};
    return 0;
}

std::string serializeFrame(const Frame::Var& frame)
{
    Json json = cetl::visit(  //
        cetl::make_overloaded(
            [](const Frame::Connect& connect) {
                //
                return Json{{FieldMsg, "connect"}, {FieldVersion, connect.version}, {"support", connect.support}};
            },
            [](const Frame::Connected& connected) {
                //
                return Json{{FieldMsg, "connected"}, {"session", connected.session}};
            },
            [](const Frame::Failed& failed) {
                //
                return Json{{FieldMsg, "failed"}, {FieldVersion, failed.version}};
            },
            [](const Frame::Method& method) {
                //
                return Json{{FieldMsg, "method"},
                            {FieldId, method.id},
                            {"method", method.method},
                            {"params", method.params.is_null() ? Json::array() : method.params}};
            },
            [](const Frame::Result& result) {
                //
                return Json{{FieldMsg, "result"}, {FieldId, result.id}, {"result", result.result}};
            },
            [](const Frame::Error& error) {
                //
                return Json{{FieldMsg, "error"}, {FieldId, error.id}, {"error", error.error}};
            },
            [](const Frame::Ping& ping) {
                //
                Json json{{FieldMsg, "ping"}};
                if (ping.id)
                {
                    json[FieldId] = *ping.id;
                }
                return json;
            },
            [](const Frame::Pong& pong) {
                //
                Json json{{FieldMsg, "pong"}};
                if (pong.id)
                {
                    json[FieldId] = *pong.id;
                }
                return json;
            },
            [](const Frame::Other& other) {
                //
                return Json{{FieldMsg, other.msg}};
            }),
        frame);

    return toCompactString(json);
}

}  // namespace rpc
}  // namespace common
}  // namespace ddprpc
