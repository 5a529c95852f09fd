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
#include "routing/RequestRouter.hpp"
#include "routing/RoutingIndex.hpp"
#include "routing/UpstreamRegistry.hpp"
#include "upstream/Endpoint.hpp"
#include "upstream/Upstream.hpp"
#include "upstream/UpstreamDescriptor.hpp"
#include "util/AsioContextTestFixture.hpp"
#include "util/TestHttpServer.hpp"

#include <boost/asio/spawn.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>

using namespace routing;
using namespace upstream;
namespace http = boost::beast::http;
namespace json = boost::json;

namespace {

std::shared_ptr<Upstream const>
makeUpstream(std::string id, std::string const& port, ChainId chainId)
{
    UpstreamDescriptor descriptor{
        .id = std::move(id), .endpoint = Endpoint::parse("http://127.0.0.1:" + port + "/").value()
    };
    descriptor.resolvedChainId = chainId;
    return std::make_shared<Upstream const>(std::move(descriptor));
}

}  // namespace

struct RequestRouterTests : SyncAsioContextTest {
    TestHttpServer server{ctx, "127.0.0.1"};
    std::shared_ptr<UpstreamRegistry> registry = std::make_shared<UpstreamRegistry>();
    RequestRouter router{registry, std::chrono::milliseconds{1000}};

    RequestRouterTests()
    {
        RoutingIndex::BucketsType buckets;
        buckets["main"][1] = {makeUpstream("node-a", server.port(), 1)};
        registry->publish(RoutingIndex{{"main", "idle"}, std::move(buckets)});
    }

    static RequestContext
    makeContext(std::string projectId, ChainId chainId, std::optional<json::value> params = json::parse("[]"))
    {
        return RequestContext{
            .projectId = std::move(projectId),
            .chainId = chainId,
            .method = "eth_getBlockByNumber",
            .params = std::move(params),
            .clientId = json::value(42)
        };
    }

    void
    respondWith(http::status status, std::string body)
    {
        server.handleRequest([status, body = std::move(body)](TestHttpServer::RequestType) {
            return std::make_optional(TestHttpServer::makeJsonResponse(status, body));
        });
    }

    std::expected<json::value, RoutingError>
    route(RequestContext const& context, RequestRouter const& selectedRouter)
    {
        std::optional<std::expected<json::value, RoutingError>> result;
        runSpawn([&](boost::asio::yield_context yield) { result = selectedRouter.route(context, yield); });
        return std::move(result).value();
    }

    std::expected<json::value, RoutingError>
    route(RequestContext const& context)
    {
        return route(context, router);
    }
};

TEST_F(RequestRouterTests, ResultIsUnwrapped)
{
    respondWith(http::status::ok, R"json({"jsonrpc":"2.0","id":1,"result":{"hash":"0xabc"}})json");

    auto const result = route(makeContext("main", 1));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, json::parse(R"json({"hash":"0xabc"})json"));
}

TEST_F(RequestRouterTests, NullResultIsASuccess)
{
    respondWith(http::status::ok, R"json({"jsonrpc":"2.0","id":1,"result":null})json");

    auto const result = route(makeContext("main", 1));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->is_null());
}

TEST_F(RequestRouterTests, LargeResultIsRelayed)
{
    std::string const blob(9 * 1024 * 1024, 'a');
    respondWith(http::status::ok, R"json({"jsonrpc":"2.0","id":1,"result":")json" + blob + "\"}");

    auto const result = route(makeContext("main", 1));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_TRUE(result->is_string());
    EXPECT_EQ(result->as_string().size(), blob.size());
}

TEST_F(RequestRouterTests, ResultOverSizeLimitIsUnreachable)
{
    RequestRouter const smallRouter{registry, std::chrono::milliseconds{1000}, 1024};
    server.handleRequest(
        [](TestHttpServer::RequestType) {
            return std::make_optional(TestHttpServer::makeJsonResponse(
                http::status::ok, R"json({"jsonrpc":"2.0","id":1,"result":")json" + std::string(2048, 'a') + "\"}"
            ));
        },
        true
    );

    auto const result = route(makeContext("main", 1), smallRouter);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UpstreamUnreachable);
    EXPECT_FALSE(result.error().timedOut);
}

TEST_F(RequestRouterTests, UpstreamRpcErrorIsPreserved)
{
    respondWith(
        http::status::ok,
        R"json({"jsonrpc":"2.0","id":1,"error":{"code":3,"message":"execution reverted","data":"0x08c379a0"}})json"
    );

    auto const result = route(makeContext("main", 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UpstreamRpcError);
    EXPECT_EQ(result.error().code, 3);
    EXPECT_EQ(result.error().message, "execution reverted");
    ASSERT_TRUE(result.error().data.has_value());
    EXPECT_EQ(*result.error().data, json::value("0x08c379a0"));
    EXPECT_EQ(result.error().httpStatus(), 502);
}

TEST_F(RequestRouterTests, NonJsonBodyIsUnreachable)
{
    respondWith(http::status::ok, "<html>bad gateway</html>");

    auto const result = route(makeContext("main", 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UpstreamUnreachable);
    EXPECT_EQ(result.error().httpStatus(), 503);
    EXPECT_EQ(result.error().code, -32003);
}

TEST_F(RequestRouterTests, ServerErrorStatusIsUnreachable)
{
    respondWith(http::status::internal_server_error, R"json({"jsonrpc":"2.0","id":1,"result":"0x1"})json");

    auto const result = route(makeContext("main", 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UpstreamUnreachable);
    EXPECT_FALSE(result.error().timedOut);
    EXPECT_EQ(result.error().message, "upstream 'node-a' is unreachable");
}

TEST_F(RequestRouterTests, TimeoutIsReportedAsGatewayTimeout)
{
    RequestRouter const impatientRouter{registry, std::chrono::milliseconds{50}};

    auto const result = route(makeContext("main", 1), impatientRouter);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UpstreamUnreachable);
    EXPECT_TRUE(result.error().timedOut);
    EXPECT_EQ(result.error().httpStatus(), 504);
    EXPECT_EQ(result.error().message, "upstream 'node-a' timed out");
}

TEST_F(RequestRouterTests, UnknownProject)
{
    auto const result = route(makeContext("nope", 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UnknownProject);
    EXPECT_EQ(result.error().httpStatus(), 404);
    EXPECT_EQ(result.error().code, -32001);
}

TEST_F(RequestRouterTests, UnsupportedChain)
{
    auto const result = route(makeContext("main", 137));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UnsupportedChain);
    EXPECT_EQ(result.error().code, -32002);
}

TEST_F(RequestRouterTests, ProjectWithoutUpstreamsIsUnsupportedChain)
{
    auto const result = route(makeContext("idle", 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UnsupportedChain);
}

TEST_F(RequestRouterTests, WireRequestCopiesMethodAndParams)
{
    server.handleRequest([](TestHttpServer::RequestType request) {
        [&]() {
            auto const body = json::parse(request.body()).as_object();
            EXPECT_EQ(body.at("jsonrpc").as_string(), "2.0");
            EXPECT_EQ(body.at("id").to_number<std::uint64_t>(), 1u);
            EXPECT_EQ(body.at("method").as_string(), "eth_getBlockByNumber");
            EXPECT_EQ(body.at("params"), json::parse(R"(["latest", false])"));
        }();
        return std::make_optional(
            TestHttpServer::makeJsonResponse(http::status::ok, R"json({"jsonrpc":"2.0","id":1,"result":"0x1"})json")
        );
    });

    auto const result = route(makeContext("main", 1, json::parse(R"(["latest", false])")));
    ASSERT_TRUE(result.has_value()) << result.error().message;
}

TEST_F(RequestRouterTests, WireRequestOmitsAbsentParamsAndCountsIds)
{
    respondWith(http::status::ok, R"json({"jsonrpc":"2.0","id":1,"result":"0x1"})json");
    ASSERT_TRUE(route(makeContext("main", 1)).has_value());

    server.handleRequest([](TestHttpServer::RequestType request) {
        [&]() {
            auto const body = json::parse(request.body()).as_object();
            EXPECT_EQ(body.at("id").to_number<std::uint64_t>(), 2u);
            EXPECT_FALSE(body.contains("params"));
        }();
        return std::make_optional(
            TestHttpServer::makeJsonResponse(http::status::ok, R"json({"jsonrpc":"2.0","id":2,"result":"0x2"})json")
        );
    });

    auto const result = route(makeContext("main", 1, std::nullopt));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, json::value("0x2"));
}

TEST_F(RequestRouterTests, FirstUpstreamIsAlwaysSelected)
{
    // the second upstream points to a port nobody listens on
    RoutingIndex::BucketsType buckets;
    buckets["main"][1] = {makeUpstream("node-a", server.port(), 1), makeUpstream("node-b", "1", 1)};
    registry->publish(RoutingIndex{{"main"}, std::move(buckets)});

    for (auto i = 0; i < 3; ++i) {
        respondWith(http::status::ok, R"json({"jsonrpc":"2.0","id":1,"result":"0x1"})json");
        auto const result = route(makeContext("main", 1));
        ASSERT_TRUE(result.has_value()) << result.error().message;
    }
}

TEST(RequestRouterNormalizeTests, Result)
{
    auto const result = RequestRouter::normalizeResponse(R"json({"jsonrpc":"2.0","id":9,"result":[1,2]})json");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, json::parse("[1,2]"));
}

TEST(RequestRouterNormalizeTests, ErrorWinsOverResult)
{
    auto const result =
        RequestRouter::normalizeResponse(R"json({"result":"0x1","error":{"code":-32000,"message":"oops"}})json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UpstreamRpcError);
    EXPECT_EQ(result.error().code, -32000);
}

TEST(RequestRouterNormalizeTests, ErrorDefaults)
{
    auto const result = RequestRouter::normalizeResponse(R"json({"error":42})json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UpstreamRpcError);
    EXPECT_EQ(result.error().code, -32603);
    EXPECT_EQ(result.error().message, "upstream error");
    EXPECT_FALSE(result.error().data.has_value());
}

TEST(RequestRouterNormalizeTests, StringErrorBecomesMessage)
{
    auto const result = RequestRouter::normalizeResponse(R"json({"jsonrpc":"2.0","id":1,"error":"rate limited"})json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UpstreamRpcError);
    EXPECT_EQ(result.error().code, -32603);
    EXPECT_EQ(result.error().message, "rate limited");
}

TEST(RequestRouterNormalizeTests, NullErrorIsIgnored)
{
    auto const result =
        RequestRouter::normalizeResponse(R"json({"jsonrpc":"2.0","id":1,"result":"0x1","error":null})json");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, json::value("0x1"));
}

TEST(RequestRouterNormalizeTests, NullErrorWithoutResultIsUnreachable)
{
    auto const result = RequestRouter::normalizeResponse(R"json({"jsonrpc":"2.0","id":1,"error":null})json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UpstreamUnreachable);
}

TEST(RequestRouterNormalizeTests, NeitherResultNorError)
{
    auto const result = RequestRouter::normalizeResponse(R"json({"jsonrpc":"2.0","id":1})json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UpstreamUnreachable);
    EXPECT_FALSE(result.error().timedOut);
}

TEST(RequestRouterNormalizeTests, NotAnObject)
{
    auto const result = RequestRouter::normalizeResponse("[]");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RoutingError::Kind::UpstreamUnreachable);
}
