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
#include "upstream/UpstreamDescriptor.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/spawn.hpp>

#include <chrono>
#include <expected>

namespace upstream {

/**
 * @brief Determines the chain an upstream serves.
 *
 * A chain id declared in the upstream's metadata is trusted as is and no network call is made. Otherwise the node is
 * asked with `eth_chainId` exactly once, without retries.
 */
class ChainIdResolver {
    util::Logger log_{"Bootstrap"};
    std::chrono::milliseconds identityTimeout_;

public:
    static constexpr std::chrono::milliseconds DEFAULT_IDENTITY_TIMEOUT{5000};

    explicit ChainIdResolver(std::chrono::milliseconds identityTimeout = DEFAULT_IDENTITY_TIMEOUT);

    /**
     * @brief Resolve the chain id of the given upstream.
     *
     * @param descriptor The upstream to resolve
     * @param yield The coroutine context
     * @return The chain id or the reason it could not be determined
     */
    std::expected<ChainId, ResolutionFailure>
    resolve(UpstreamDescriptor const& descriptor, boost::asio::yield_context yield) const;
};

}  // namespace upstream
