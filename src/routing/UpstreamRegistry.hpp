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

#include "routing/RoutingIndex.hpp"
#include "upstream/UpstreamDescriptor.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace routing {

/**
 * @brief Holds the currently published @ref RoutingIndex.
 *
 * Publishing swaps the whole index atomically, so readers observe either the previous or the new index and never a
 * partially built one. Before the first publish the registry holds an empty index.
 */
class UpstreamRegistry {
    std::atomic<std::shared_ptr<RoutingIndex const>> index_;

public:
    UpstreamRegistry();

    /**
     * @brief Replace the current index.
     *
     * @param index The new, complete index
     */
    void
    publish(RoutingIndex index);

    /**
     * @return The index that is current at the time of the call
     */
    [[nodiscard]] std::shared_ptr<RoutingIndex const>
    snapshot() const;

    /**
     * @brief Get the upstreams serving the given chain of a project
     *
     * @param projectId The project id
     * @param chainId The chain id
     * @return A copy of the upstream list; empty if nothing serves the pair
     */
    [[nodiscard]] UpstreamList
    lookup(std::string const& projectId, upstream::ChainId chainId) const;

    [[nodiscard]] bool
    exists(std::string const& projectId) const;
};

}  // namespace routing
