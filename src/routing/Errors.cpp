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

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace routing {

RoutingError
RoutingError::invalidRequest(std::string message)
{
    return {Kind::InvalidRequest, std::move(message), static_cast<std::int64_t>(RpcCode::InvalidRequest)};
}

RoutingError
RoutingError::unknownProject(std::string const& projectId)
{
    return {
        Kind::UnknownProject,
        fmt::format("unknown project '{}'", projectId),
        static_cast<std::int64_t>(RpcCode::UnknownProject)
    };
}

RoutingError
RoutingError::unsupportedChain(std::string const& projectId, std::uint64_t chainId)
{
    return {
        Kind::UnsupportedChain,
        fmt::format("chain {} is not supported by project '{}'", chainId, projectId),
        static_cast<std::int64_t>(RpcCode::UnsupportedChain)
    };
}

RoutingError
RoutingError::upstreamRpcError(std::int64_t code, std::string message, std::optional<boost::json::value> data)
{
    return {Kind::UpstreamRpcError, std::move(message), code, std::move(data)};
}

RoutingError
RoutingError::upstreamUnreachable(std::string message, bool timedOut)
{
    return {
        Kind::UpstreamUnreachable,
        std::move(message),
        static_cast<std::int64_t>(RpcCode::UpstreamUnreachable),
        std::nullopt,
        timedOut
    };
}

unsigned int
RoutingError::httpStatus() const
{
    switch (kind) {
        case Kind::InvalidRequest:
            return 400;
        case Kind::UnknownProject:
        case Kind::UnsupportedChain:
            return 404;
        case Kind::UpstreamRpcError:
            return 502;
        case Kind::UpstreamUnreachable:
            return timedOut ? 504 : 503;
    }
    return 500;
}

boost::json::object
RoutingError::toJson(boost::json::value const& clientId) const
{
    boost::json::object error;
    error["code"] = code;
    error["message"] = message;
    if (data.has_value())
        error["data"] = *data;

    boost::json::object envelope;
    envelope["jsonrpc"] = "2.0";
    envelope["id"] = clientId;
    envelope["error"] = std::move(error);
    return envelope;
}

}  // namespace routing
