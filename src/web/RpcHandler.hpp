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

#pragma once

#include "routing/Errors.hpp"
#include "routing/RequestRouter.hpp"
#include "upstream/UpstreamDescriptor.hpp"
#include "util/log/Logger.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/spawn.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>

#include <charconv>
#include <chrono>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace web {

/**
 * @brief Project and chain addressed by the path of an inbound request.
 */
struct RouteTarget {
    std::string projectId;
    upstream::ChainId chainId;
};

/**
 * @brief Parse a request target of the form `/{projectId}/{chainId}`.
 *
 * A trailing slash and a query string are ignored. The chain id must be a decimal unsigned integer.
 *
 * @param target The HTTP request target
 * @return The parsed target or std::nullopt if the path does not have the expected shape
 */
inline std::optional<RouteTarget>
parseRouteTarget(std::string_view target)
{
    if (auto const query = target.find('?'); query != std::string_view::npos)
        target = target.substr(0, query);

    if (not target.starts_with('/'))
        return std::nullopt;
    target.remove_prefix(1);

    if (target.ends_with('/'))
        target.remove_suffix(1);

    auto const separator = target.find('/');
    if (separator == std::string_view::npos or separator == 0)
        return std::nullopt;

    auto const project = target.substr(0, separator);
    auto const chain = target.substr(separator + 1);
    if (chain.empty() or chain.find('/') != std::string_view::npos)
        return std::nullopt;

    upstream::ChainId chainId = 0;
    auto const [ptr, ec] = std::from_chars(chain.data(), chain.data() + chain.size(), chainId);
    if (ec != std::errc{} or ptr != chain.data() + chain.size())
        return std::nullopt;

    return RouteTarget{.projectId = std::string{project}, .chainId = chainId};
}

/**
 * @brief The handler for JSON-RPC requests called by the web server.
 *
 * Turns an HTTP request into a @ref routing::RequestContext, routes it and renders the outcome: the upstream's
 * `result` on success or a JSON-RPC error envelope otherwise.
 *
 * @tparam RouterType The router; see @ref routing::RequestRouter
 */
template <typename RouterType>
class RpcHandler {
    std::shared_ptr<RouterType const> const router_;

    util::Logger log_{"WebServer"};

public:
    /**
     * @brief Create a new RPC handler.
     *
     * @param router The router to dispatch requests to
     */
    explicit RpcHandler(std::shared_ptr<RouterType const> router) : router_(std::move(router))
    {
    }

    /**
     * @brief The callback when server receives a request.
     *
     * @param request The request
     * @param yield The coroutine context of the connection
     * @return The response to send
     */
    Response
    operator()(Request const& request, boost::asio::yield_context yield) const
    {
        if (request.method() != Request::Method::POST)
            return makeError(routing::RoutingError::invalidRequest("only POST is supported"), {}, request);

        auto const target = parseRouteTarget(request.target());
        if (not target.has_value()) {
            LOG(log_.debug()) << "Malformed request target: " << request.target();
            return makeError(
                routing::RoutingError::invalidRequest("request path must be /{projectId}/{chainId}"), {}, request
            );
        }

        boost::json::value clientId;
        auto context = makeContext(*target, request.message(), clientId);
        if (not context.has_value())
            return makeError(context.error(), clientId, request);

        auto const startedAt = std::chrono::steady_clock::now();
        auto result = router_->route(*context, yield);
        auto const elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startedAt);

        if (not result.has_value()) {
            LOG(log_.info()) << context->method << " on " << target->projectId << "/" << target->chainId
                             << " failed after " << elapsed.count() << "ms: " << result.error().message;
            return makeError(result.error(), context->clientId, request);
        }

        LOG(log_.debug()) << context->method << " on " << target->projectId << "/" << target->chainId << " took "
                          << elapsed.count() << "ms";
        return Response{boost::beast::http::status::ok, *result, request};
    }

private:
    std::expected<routing::RequestContext, routing::RoutingError>
    makeContext(RouteTarget const& target, std::string_view body, boost::json::value& clientId) const
    {
        boost::json::value parsed;
        try {
            parsed = boost::json::parse(body);
        } catch (std::exception const& e) {
            LOG(log_.debug()) << "Error parsing JSON: " << e.what();
            return std::unexpected{routing::RoutingError::invalidRequest("request body is not valid JSON")};
        }

        if (not parsed.is_object())
            return std::unexpected{routing::RoutingError::invalidRequest("request body must be a JSON object")};

        auto& object = parsed.as_object();
        routing::RequestContext context{.projectId = target.projectId, .chainId = target.chainId};

        if (auto* id = object.if_contains("id"); id != nullptr) {
            clientId = *id;
            context.clientId = *id;
        }

        auto const* method = object.if_contains("method");
        if (method == nullptr or not method->is_string() or method->as_string().empty())
            return std::unexpected{routing::RoutingError::invalidRequest("`method` must be a non-empty string")};
        context.method = std::string{method->as_string()};

        if (auto* params = object.if_contains("params"); params != nullptr)
            context.params = std::move(*params);

        return context;
    }

    static Response
    makeError(routing::RoutingError const& error, boost::json::value const& clientId, Request const& request)
    {
        return Response{
            static_cast<boost::beast::http::status>(error.httpStatus()),
            boost::json::value(error.toJson(clientId)),
            request
        };
    }
};

}  // namespace web
