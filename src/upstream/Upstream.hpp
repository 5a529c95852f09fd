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

#include "upstream/Errors.hpp"
#include "upstream/EvmUpstream.hpp"
#include "upstream/UpstreamDescriptor.hpp"

#include <boost/asio/spawn.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <variant>

namespace upstream {

/**
 * @brief A configured upstream node together with the protocol implementation selected by its kind.
 *
 * Instances are immutable once constructed and are shared between requests via `std::shared_ptr<Upstream const>`.
 */
class Upstream {
    using ImplType = std::variant<EvmUpstream>;

    UpstreamDescriptor descriptor_;
    ImplType impl_;

public:
    explicit Upstream(UpstreamDescriptor descriptor);

    [[nodiscard]] UpstreamDescriptor const&
    descriptor() const
    {
        return descriptor_;
    }

    [[nodiscard]] std::string const&
    id() const
    {
        return descriptor_.id;
    }

    /**
     * @brief Ask the node for the chain it serves.
     *
     * @param timeout Deadline for the lookup
     * @param yield The coroutine context
     * @return The chain id or the reason it could not be determined
     */
    std::expected<ChainId, ResolutionFailure>
    resolveIdentity(std::chrono::milliseconds timeout, boost::asio::yield_context yield) const;

    /**
     * @brief Send a serialized JSON-RPC request to the node.
     *
     * @param body The request payload
     * @param timeout Deadline for the exchange
     * @param maxResponseSize Largest response body accepted, in bytes
     * @param yield The coroutine context
     * @return The raw response body or a transport failure
     */
    std::expected<std::string, ForwardError>
    send(
        std::string body,
        std::chrono::milliseconds timeout,
        std::uint64_t maxResponseSize,
        boost::asio::yield_context yield
    ) const;

private:
    static ImplType
    makeImpl(UpstreamDescriptor const& descriptor);
};

}  // namespace upstream
