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
#include "routing/UpstreamRegistry.hpp"
#include "upstream/UpstreamDescriptor.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/spawn.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace routing {

/**
 * @brief Everything the router needs to know about one client call.
 */
struct RequestContext {
    std::string projectId;
    upstream::ChainId chainId = 0;
    std::string method;
    std::optional<boost::json::value> params; /**< Absent if the client omitted `params` */
    boost::json::value clientId;              /**< Echoed back in error bodies; null if the client sent none */
};

/**
 * @brief Routes JSON-RPC calls of clients to the upstream serving the requested project and chain.
 *
 * The first upstream of the (project, chain) bucket is always selected. Calls are forwarded once, without retries
 * or failover, and the upstream's answer is normalized into either its `result` or a @ref RoutingError.
 */
class RequestRouter {
    util::Logger log_{"Routing"};
    std::shared_ptr<UpstreamRegistry const> registry_;
    std::chrono::milliseconds requestTimeout_;
    std::uint64_t maxResponseSize_;
    mutable std::atomic_uint64_t nextWireId_{1};

public:
    static constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{10000};
    static constexpr std::uint64_t DEFAULT_MAX_RESPONSE_SIZE = 256 * 1024 * 1024;

    /**
     * @brief Construct a new Request Router
     *
     * @param registry The registry holding the published routing index
     * @param requestTimeout Deadline for each forwarded call
     * @param maxResponseSize Largest upstream response body accepted, in bytes
     */
    explicit RequestRouter(
        std::shared_ptr<UpstreamRegistry const> registry,
        std::chrono::milliseconds requestTimeout = DEFAULT_REQUEST_TIMEOUT,
        std::uint64_t maxResponseSize = DEFAULT_MAX_RESPONSE_SIZE
    );

    /**
     * @brief Route a call to its upstream and return the upstream's result.
     *
     * @param context The call to route
     * @param yield The coroutine context
     * @return The `result` of the upstream's response (possibly null) or the error that ended the call
     */
    std::expected<boost::json::value, RoutingError>
    route(RequestContext const& context, boost::asio::yield_context yield) const;

    /**
     * @brief Turn the raw body of an upstream response into a result or an error.
     *
     * A null `error` member counts as absent.
     *
     * @param body The response body
     * @return The `result` member, an UpstreamRpcError for a non-null `error` member, or UpstreamUnreachable otherwise
     */
    static std::expected<boost::json::value, RoutingError>
    normalizeResponse(std::string_view body);

private:
    [[nodiscard]] boost::json::object
    makeWireRequest(RequestContext const& context) const;
};

}  // namespace routing
