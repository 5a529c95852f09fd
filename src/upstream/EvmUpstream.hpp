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

#include "upstream/Endpoint.hpp"
#include "upstream/Errors.hpp"
#include "upstream/UpstreamDescriptor.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/spawn.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace upstream {

/**
 * @brief Decode a JSON-RPC hex quantity such as `0x1` or `0xaa36a7`.
 *
 * @param quantity The string to decode; must carry a `0x` prefix followed by 1 to 16 hex digits
 * @return The decoded value or std::nullopt if the string is not a valid quantity
 */
std::optional<ChainId>
parseHexQuantity(std::string_view quantity);

/**
 * @brief An upstream speaking the Ethereum JSON-RPC dialect over HTTP(S).
 */
class EvmUpstream {
    util::Logger log_{"Upstream"};
    Endpoint endpoint_;

public:
    static constexpr auto IDENTITY_METHOD = "eth_chainId";

    explicit EvmUpstream(Endpoint endpoint);

    /**
     * @brief Ask the node which chain it serves by calling `eth_chainId`.
     *
     * @param timeout Deadline for the whole lookup
     * @param yield The coroutine context
     * @return The chain id or the reason it could not be determined
     */
    std::expected<ChainId, ResolutionFailure>
    resolveIdentity(std::chrono::milliseconds timeout, boost::asio::yield_context yield) const;

    /**
     * @brief POST a JSON-RPC payload to the node.
     *
     * @param body The serialized JSON-RPC request
     * @param timeout Deadline for the whole exchange
     * @param maxResponseSize Largest response body accepted, in bytes; a larger one is a transport failure
     * @param yield The coroutine context
     * @return The response body or a transport failure
     */
    std::expected<std::string, ForwardError>
    send(
        std::string body,
        std::chrono::milliseconds timeout,
        std::uint64_t maxResponseSize,
        boost::asio::yield_context yield
    ) const;
};

}  // namespace upstream
