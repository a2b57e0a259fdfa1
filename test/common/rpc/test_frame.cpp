//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "rpc/frame.hpp"

#include "rpc/rpc_types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <string>

namespace
{

using namespace ddprpc::common::rpc;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::Eq;
using testing::Field;
using testing::Optional;
using testing::ElementsAre;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestFrame : public testing::Test
{
protected:
    static int deserialize(const std::string& text, Frame::Var& out_frame)
    {
        return tryDeserializeFrame(Payload{text.data(), text.size()}, out_frame);
    }

    static Json serialized(const Frame::Var& frame)
    {
        return Json::parse(serializeFrame(frame));
    }
};

// MARK: - Tests:

TEST_F(TestFrame, serialize_connect)
{
    const auto json = serialized(Frame::Connect{});
    EXPECT_THAT(json, Eq(Json{{"msg", "connect"}, {"version", "1"}, {"support", Json::array({"1"})}}));
}

TEST_F(TestFrame, serialize_method)
{
    const auto json = serialized(Frame::Method{"req_1_1700000000000", "app.start", Json::array({"my-app"})});
    EXPECT_THAT(json["msg"], "method");
    EXPECT_THAT(json["id"], "req_1_1700000000000");
    EXPECT_THAT(json["method"], "app.start");
    EXPECT_THAT(json["params"], Eq(Json::array({"my-app"})));

    // Absent parameters are sent as an empty list.
    const auto no_params = serialized(Frame::Method{"req_2", "system.info", nullptr});
    EXPECT_THAT(no_params["params"], Eq(Json::array()));
}

TEST_F(TestFrame, serialize_pong)
{
    EXPECT_THAT(serialized(Frame::Pong{}), Eq(Json{{"msg", "pong"}}));
    EXPECT_THAT(serialized(Frame::Pong{std::string{"p1"}}), Eq(Json{{"msg", "pong"}, {"id", "p1"}}));
}

TEST_F(TestFrame, deserialize_result)
{
    Frame::Var frame{Frame::Other{}};

    EXPECT_THAT(deserialize(R"({"msg":"result","id":"req_7","result":{"state":"RUNNING"}})", frame), 0);
    ASSERT_THAT(frame, VariantWith<Frame::Result>(Field(&Frame::Result::id, "req_7")));
    EXPECT_THAT(cetl::get<Frame::Result>(frame).result, Eq(Json{{"state", "RUNNING"}}));

    // Missing result is a `null` one.
    EXPECT_THAT(deserialize(R"({"msg":"result","id":"req_8"})", frame), 0);
    ASSERT_THAT(frame, VariantWith<Frame::Result>(_));
    EXPECT_TRUE(cetl::get<Frame::Result>(frame).result.is_null());

    // Numeric ids are accepted.
    EXPECT_THAT(deserialize(R"({"msg":"result","id":42,"result":true})", frame), 0);
    EXPECT_THAT(frame, VariantWith<Frame::Result>(Field(&Frame::Result::id, "42")));

    // But id is mandatory.
    EXPECT_THAT(deserialize(R"({"msg":"result","result":true})", frame), EPROTO);
}

TEST_F(TestFrame, deserialize_error)
{
    Frame::Var frame{Frame::Other{}};

    EXPECT_THAT(deserialize(R"({"msg":"error","id":"req_3","error":{"reason":"Not found"}})", frame), 0);
    ASSERT_THAT(frame, VariantWith<Frame::Error>(Field(&Frame::Error::id, "req_3")));
    EXPECT_THAT(cetl::get<Frame::Error>(frame).error, Eq(Json{{"reason", "Not found"}}));

    EXPECT_THAT(deserialize(R"({"msg":"error","error":"Malformed request"})", frame), 0);
    EXPECT_THAT(frame, VariantWith<Frame::Error>(Field(&Frame::Error::id, "")));
}

TEST_F(TestFrame, deserialize_handshake)
{
    Frame::Var frame{Frame::Other{}};

    EXPECT_THAT(deserialize(R"({"msg":"connected","session":"abc"})", frame), 0);
    EXPECT_THAT(frame, VariantWith<Frame::Connected>(Field(&Frame::Connected::session, "abc")));

    EXPECT_THAT(deserialize(R"({"msg":"failed","version":"2"})", frame), 0);
    EXPECT_THAT(frame, VariantWith<Frame::Failed>(Field(&Frame::Failed::version, "2")));

    EXPECT_THAT(deserialize(R"({"msg":"connect","version":"1","support":["1","pre2"]})", frame), 0);
    EXPECT_THAT(frame, VariantWith<Frame::Connect>(Field(&Frame::Connect::support, ElementsAre("1", "pre2"))));
}

TEST_F(TestFrame, deserialize_ping)
{
    Frame::Var frame{Frame::Other{}};

    EXPECT_THAT(deserialize(R"({"msg":"ping"})", frame), 0);
    ASSERT_THAT(frame, VariantWith<Frame::Ping>(_));
    EXPECT_FALSE(cetl::get<Frame::Ping>(frame).id.has_value());

    EXPECT_THAT(deserialize(R"({"msg":"ping","id":"p5"})", frame), 0);
    EXPECT_THAT(frame, VariantWith<Frame::Ping>(Field(&Frame::Ping::id, Optional(std::string{"p5"}))));
}

TEST_F(TestFrame, deserialize_unknown_kind)
{
    Frame::Var frame{Frame::Ping{}};

    EXPECT_THAT(deserialize(R"({"msg":"added","collection":"apps"})", frame), 0);
    EXPECT_THAT(frame, VariantWith<Frame::Other>(Field(&Frame::Other::msg, "added")));
}

TEST_F(TestFrame, deserialize_malformed)
{
    Frame::Var frame{Frame::Other{}};

    EXPECT_THAT(deserialize("", frame), EINVAL);
    EXPECT_THAT(deserialize("{not a json", frame), EINVAL);
    EXPECT_THAT(deserialize(R"(["msg","result"])", frame), EINVAL);
    EXPECT_THAT(deserialize(R"({"id":"req_1"})", frame), EPROTO);
    EXPECT_THAT(deserialize(R"({"msg":13})", frame), EPROTO);
    EXPECT_THAT(deserialize(R"({"msg":"method","method":"x"})", frame), EPROTO);
}

TEST_F(TestFrame, tryPerformOnSerialized)
{
    std::string sent;
    const int   result = tryPerformOnSerialized(Frame::Ping{std::string{"x"}}, [&sent](const Payload payload) {
        //
        sent.assign(payload.data(), payload.size());
        return 0;
    });
    EXPECT_THAT(result, 0);
    EXPECT_THAT(Json::parse(sent), Eq(Json{{"msg", "ping"}, {"id", "x"}}));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
