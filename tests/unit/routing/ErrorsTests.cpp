//------------------------------------------------------------------------------
/*
    This file is part of chainrelay.
    Copyright (c) 2024, the chainrelay developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include "routing/Errors.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>

using namespace routing;

struct RoutingErrorStatusBundle {
    std::string testName;
    RoutingError error;
    unsigned int expectedStatus;
    std::int64_t expectedCode;
};

struct RoutingErrorStatusTests : testing::TestWithParam<RoutingErrorStatusBundle> {};

INSTANTIATE_TEST_SUITE_P(
    RoutingErrorStatusGroup,
    RoutingErrorStatusTests,
    testing::Values(
        RoutingErrorStatusBundle{"InvalidRequest", RoutingError::invalidRequest("bad"), 400, -32600},
        RoutingErrorStatusBundle{"UnknownProject", RoutingError::unknownProject("p"), 404, -32001},
        RoutingErrorStatusBundle{"UnsupportedChain", RoutingError::unsupportedChain("p", 1), 404, -32002},
        RoutingErrorStatusBundle{
            "UpstreamRpcError",
            RoutingError::upstreamRpcError(-32000, "header not found", std::nullopt),
            502,
            -32000
        },
        RoutingErrorStatusBundle{"UpstreamUnreachable", RoutingError::upstreamUnreachable("down"), 503, -32003},
        RoutingErrorStatusBundle{"UpstreamTimeout", RoutingError::upstreamUnreachable("slow", true), 504, -32003}
    ),
    [](auto const& info) { return info.param.testName; }
);

TEST_P(RoutingErrorStatusTests, StatusAndCode)
{
    EXPECT_EQ(GetParam().error.httpStatus(), GetParam().expectedStatus);
    EXPECT_EQ(GetParam().error.code, GetParam().expectedCode);
}

TEST(RoutingErrorTests, Messages)
{
    EXPECT_EQ(RoutingError::unknownProject("main").message, "unknown project 'main'");
    EXPECT_EQ(RoutingError::unsupportedChain("main", 10).message, "chain 10 is not supported by project 'main'");
}

TEST(RoutingErrorTests, EnvelopeWithNullId)
{
    auto const json = RoutingError::unknownProject("main").toJson(nullptr);
    EXPECT_EQ(
        boost::json::value(json),
        boost::json::parse(R"json({
            "jsonrpc": "2.0",
            "id": null,
            "error": {"code": -32001, "message": "unknown project 'main'"}
        })json")
    );
}

TEST(RoutingErrorTests, EnvelopeEchoesClientIdAndData)
{
    auto const error = RoutingError::upstreamRpcError(3, "execution reverted", boost::json::parse(R"("0x08c379a0")"));
    auto const json = error.toJson(boost::json::value("request-7"));
    EXPECT_EQ(
        boost::json::value(json),
        boost::json::parse(R"json({
            "jsonrpc": "2.0",
            "id": "request-7",
            "error": {"code": 3, "message": "execution reverted", "data": "0x08c379a0"}
        })json")
    );
}
