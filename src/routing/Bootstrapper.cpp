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

#include "routing/Bootstrapper.hpp"

#include "routing/RoutingIndex.hpp"
#include "upstream/Errors.hpp"
#include "upstream/Upstream.hpp"
#include "upstream/UpstreamDescriptor.hpp"
#include "util/Assert.hpp"
#include "util/CoroutineGroup.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/spawn.hpp>
#include <fmt/core.h>

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace routing {

namespace {

struct Slot {
    upstream::ProjectConfig const* project;
    upstream::UpstreamDescriptor const* descriptor;
    std::optional<std::expected<upstream::ChainId, upstream::ResolutionFailure>> result;
};

}  // namespace

std::string
BootstrapFailure::message() const
{
    return fmt::format("cannot bootstrap upstream '{}' of project '{}': {}", upstreamId, projectId, cause.message());
}

Bootstrapper::Bootstrapper(ResolverType resolver) : resolver_(std::move(resolver))
{
}

std::expected<RoutingIndex, BootstrapFailure>
Bootstrapper::bootstrap(std::vector<upstream::ProjectConfig> const& projects, boost::asio::yield_context yield) const
{
    std::vector<Slot> slots;
    for (auto const& project : projects) {
        for (auto const& descriptor : project.upstreams)
            slots.push_back(Slot{.project = &project, .descriptor = &descriptor, .result = std::nullopt});
    }

    LOG(log_.info()) << "Resolving " << slots.size() << " upstreams of " << projects.size() << " projects";

    util::CoroutineGroup group{yield};
    for (auto& slot : slots) {
        group.spawn(yield, [this, &slot](boost::asio::yield_context innerYield) {
            slot.result = resolver_(*slot.descriptor, innerYield);
        });
    }
    group.asyncWait(yield);

    for (auto const& slot : slots) {
        ASSERT(slot.result.has_value(), "Upstream '{}' was not resolved", slot.descriptor->id);
        if (not slot.result->has_value()) {
            BootstrapFailure failure{slot.project->id, slot.descriptor->id, slot.result->error()};
            LOG(log_.error()) << failure.message();
            return std::unexpected{std::move(failure)};
        }
    }

    std::set<std::string> projectIds;
    RoutingIndex::BucketsType buckets;
    for (auto const& project : projects)
        projectIds.insert(project.id);

    for (auto const& slot : slots) {
        auto const chainId = slot.result->value();
        auto descriptor = *slot.descriptor;
        descriptor.resolvedChainId = chainId;

        LOG(log_.info()) << "Upstream '" << descriptor.id << "' of project '" << slot.project->id << "' serves chain "
                         << chainId;
        buckets[slot.project->id][chainId].push_back(std::make_shared<upstream::Upstream const>(std::move(descriptor)));
    }

    return RoutingIndex{std::move(projectIds), std::move(buckets)};
}

}  // namespace routing
