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
#include "upstream/Errors.hpp"
#include "upstream/UpstreamDescriptor.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/spawn.hpp>

#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace routing {

/**
 * @brief An upstream of a project could not be resolved, so the routing index was not built.
 */
struct BootstrapFailure {
    std::string projectId;
    std::string upstreamId;
    upstream::ResolutionFailure cause;

    /**
     * @return `cannot bootstrap upstream '<upstream>' of project '<project>': <cause>`
     */
    [[nodiscard]] std::string
    message() const;
};

/**
 * @brief Resolves every configured upstream and builds the @ref RoutingIndex out of the results.
 *
 * All upstreams are resolved concurrently, each exactly once. The index is only built when every resolution has
 * finished and all of them succeeded; otherwise the first failing upstream in configuration order is reported.
 */
class Bootstrapper {
public:
    using ResolverType = std::function<std::expected<upstream::ChainId, upstream::ResolutionFailure>(
        upstream::UpstreamDescriptor const&,
        boost::asio::yield_context
    )>;

private:
    util::Logger log_{"Bootstrap"};
    ResolverType resolver_;

public:
    /**
     * @brief Construct a new Bootstrapper
     *
     * @param resolver Determines the chain id of one upstream; usually @ref upstream::ChainIdResolver
     */
    explicit Bootstrapper(ResolverType resolver);

    /**
     * @brief Resolve all upstreams of all projects and build the routing index.
     *
     * The yield context's executor must be a strand if the underlying io_context is run by several threads.
     *
     * @param projects The configured projects
     * @param yield The coroutine context
     * @return The index or the first failure in configuration order
     */
    std::expected<RoutingIndex, BootstrapFailure>
    bootstrap(std::vector<upstream::ProjectConfig> const& projects, boost::asio::yield_context yield) const;
};

}  // namespace routing
