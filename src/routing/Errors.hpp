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

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace routing {

/**
 * @brief JSON-RPC error codes used by the relay for errors of its own.
 */
enum class RpcCode : std::int64_t {
    InvalidRequest = -32600,
    InternalError = -32603,
    UnknownProject = -32001,
    UnsupportedChain = -32002,
    UpstreamUnreachable = -32003,
};

/**
 * @brief An error that ends the handling of one client request.
 */
struct RoutingError {
    enum class Kind { InvalidRequest, UnknownProject, UnsupportedChain, UpstreamRpcError, UpstreamUnreachable };

    Kind kind;
    std::string message;
    std::int64_t code;
    std::optional<boost::json::value> data = std::nullopt;
    bool timedOut = false;

    static RoutingError
    invalidRequest(std::string message);

    static RoutingError
    unknownProject(std::string const& projectId);

    static RoutingError
    unsupportedChain(std::string const& projectId, std::uint64_t chainId);

    /**
     * @brief An error returned by the upstream itself; code, message and data are relayed unchanged.
     */
    static RoutingError
    upstreamRpcError(std::int64_t code, std::string message, std::optional<boost::json::value> data);

    static RoutingError
    upstreamUnreachable(std::string message, bool timedOut = false);

    /**
     * @return The HTTP status the error is reported with
     */
    [[nodiscard]] unsigned int
    httpStatus() const;

    /**
     * @brief Build the JSON-RPC error envelope sent to the client.
     *
     * @param clientId The id of the client's request, null if it had none
     * @return `{"jsonrpc":"2.0","id":...,"error":{"code":...,"message":...[,"data":...]}}`
     */
    [[nodiscard]] boost::json::object
    toJson(boost::json::value const& clientId) const;
};

}  // namespace routing
