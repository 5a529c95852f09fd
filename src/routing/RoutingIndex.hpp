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

#include "upstream/Upstream.hpp"
#include "upstream/UpstreamDescriptor.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace routing {

/** @brief Ordered list of upstreams able to serve one (project, chain) pair. */
using UpstreamList = std::vector<std::shared_ptr<upstream::Upstream const>>;

/**
 * @brief Immutable mapping from (project, chain) to the upstreams serving it.
 *
 * Built once by the @ref Bootstrapper and published as a whole through the @ref UpstreamRegistry.
 */
class RoutingIndex {
public:
    using BucketsType = std::map<std::string, std::map<upstream::ChainId, UpstreamList>>;

private:
    std::set<std::string> projects_;
    BucketsType buckets_;

public:
    RoutingIndex() = default;

    /**
     * @brief Construct a new Routing Index
     *
     * @param projects Every known project id, including projects without upstreams
     * @param buckets Non-empty upstream lists keyed by project id and chain id
     */
    RoutingIndex(std::set<std::string> projects, BucketsType buckets);

    /**
     * @brief Get the upstreams serving the given chain of a project
     *
     * @param projectId The project id
     * @param chainId The chain id
     * @return The upstreams in preference order; empty if nothing serves the pair
     */
    [[nodiscard]] UpstreamList const&
    lookup(std::string const& projectId, upstream::ChainId chainId) const;

    [[nodiscard]] bool
    exists(std::string const& projectId) const;

    [[nodiscard]] std::set<std::string> const&
    projects() const;

    /**
     * @return The chain ids served for the project in ascending order
     */
    [[nodiscard]] std::vector<upstream::ChainId>
    chainIds(std::string const& projectId) const;

    /**
     * @brief Structural comparison: same projects, same buckets and the same upstream ids in the same order.
     */
    bool
    operator==(RoutingIndex const& other) const;
};

}  // namespace routing
