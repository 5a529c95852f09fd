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

#include "routing/RequestRouter.hpp"

#include "routing/Errors.hpp"
#include "routing/UpstreamRegistry.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/spawn.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace routing {

RequestRouter::RequestRouter(
    std::shared_ptr<UpstreamRegistry const> registry,
    std::chrono::milliseconds requestTimeout,
    std::uint64_t maxResponseSize
)
    : registry_(std::move(registry)), requestTimeout_(requestTimeout), maxResponseSize_(maxResponseSize)
{
}

std::expected<boost::json::value, RoutingError>
RequestRouter::route(RequestContext const& context, boost::asio::yield_context yield) const
{
    auto const index = registry_->snapshot();

    if (not index->exists(context.projectId)) {
        LOG(log_.debug()) << "Unknown project '" << context.projectId << "'";
        return std::unexpected{RoutingError::unknownProject(context.projectId)};
    }

    auto const& upstreams = index->lookup(context.projectId, context.chainId);
    if (upstreams.empty()) {
        LOG(log_.debug()) << "Project '" << context.projectId << "' has no upstream for chain " << context.chainId;
        return std::unexpected{RoutingError::unsupportedChain(context.projectId, context.chainId)};
    }

    auto const& selected = upstreams.front();
    auto const request = makeWireRequest(context);
    LOG(log_.trace()) << "Forwarding " << context.method << " for " << context.projectId << "/" << context.chainId
                      << " to '" << selected->id() << "': " << boost::json::serialize(request);

    auto const startedAt = std::chrono::steady_clock::now();
    auto const response = selected->send(boost::json::serialize(request), requestTimeout_, maxResponseSize_, yield);
    auto const elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startedAt);

    if (not response.has_value()) {
        LOG(log_.warn()) << "Upstream '" << selected->id() << "' unreachable after " << elapsed.count()
                         << "ms: " << response.error().cause;
        auto const message = response.error().timedOut
            ? fmt::format("upstream '{}' timed out", selected->id())
            : fmt::format("upstream '{}' is unreachable", selected->id());
        return std::unexpected{RoutingError::upstreamUnreachable(message, response.error().timedOut)};
    }

    LOG(log_.debug()) << context.method << " served by '" << selected->id() << "' in " << elapsed.count() << "ms";
    return normalizeResponse(*response);
}

std::expected<boost::json::value, RoutingError>
RequestRouter::normalizeResponse(std::string_view body)
{
    boost::json::value parsed;
    try {
        parsed = boost::json::parse(body);
    } catch (std::exception const& e) {
        return std::unexpected{
            RoutingError::upstreamUnreachable(fmt::format("malformed upstream response: {}", e.what()))
        };
    }

    if (not parsed.is_object())
        return std::unexpected{RoutingError::upstreamUnreachable("upstream response is not a JSON object")};

    auto& object = parsed.as_object();
    if (auto it = object.find("error"); it != object.end() and not it->value().is_null()) {
        auto code = static_cast<std::int64_t>(RpcCode::InternalError);
        std::string message = "upstream error";
        std::optional<boost::json::value> data;

        if (it->value().is_object()) {
            auto& error = it->value().as_object();
            if (auto const* c = error.if_contains("code"); c != nullptr and c->is_int64())
                code = c->as_int64();
            if (auto const* m = error.if_contains("message"); m != nullptr and m->is_string())
                message = std::string{m->as_string()};
            if (auto* d = error.if_contains("data"); d != nullptr)
                data = std::move(*d);
        } else if (it->value().is_string()) {
            message = std::string{it->value().as_string()};
        }

        return std::unexpected{RoutingError::upstreamRpcError(code, std::move(message), std::move(data))};
    }

    if (auto it = object.find("result"); it != object.end())
        return std::move(it->value());

    return std::unexpected{RoutingError::upstreamUnreachable("upstream response has neither result nor error")};
}

boost::json::object
RequestRouter::makeWireRequest(RequestContext const& context) const
{
    boost::json::object request;
    request["jsonrpc"] = "2.0";
    request["id"] = nextWireId_.fetch_add(1);
    request["method"] = context.method;
    if (context.params.has_value())
        request["params"] = *context.params;
    return request;
}

}  // namespace routing
