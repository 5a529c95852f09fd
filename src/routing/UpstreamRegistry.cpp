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

#include "routing/UpstreamRegistry.hpp"

#include "routing/RoutingIndex.hpp"
#include "upstream/UpstreamDescriptor.hpp"

#include <memory>
#include <string>
#include <utility>

namespace routing {

UpstreamRegistry::UpstreamRegistry() : index_(std::make_shared<RoutingIndex const>())
{
}

void
UpstreamRegistry::publish(RoutingIndex index)
{
    index_.store(std::make_shared<RoutingIndex const>(std::move(index)));
}

std::shared_ptr<RoutingIndex const>
UpstreamRegistry::snapshot() const
{
    return index_.load();
}

UpstreamList
UpstreamRegistry::lookup(std::string const& projectId, upstream::ChainId chainId) const
{
    return snapshot()->lookup(projectId, chainId);
}

bool
UpstreamRegistry::exists(std::string const& projectId) const
{
    return snapshot()->exists(projectId);
}

}  // namespace routing
