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

#include "routing/RoutingIndex.hpp"

#include "upstream/UpstreamDescriptor.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace routing {

RoutingIndex::RoutingIndex(std::set<std::string> projects, BucketsType buckets)
    : projects_(std::move(projects)), buckets_(std::move(buckets))
{
}

UpstreamList const&
RoutingIndex::lookup(std::string const& projectId, upstream::ChainId chainId) const
{
    static UpstreamList const empty{};

    auto const project = buckets_.find(projectId);
    if (project == buckets_.end())
        return empty;

    auto const bucket = project->second.find(chainId);
    if (bucket == project->second.end())
        return empty;

    return bucket->second;
}

bool
RoutingIndex::exists(std::string const& projectId) const
{
    return projects_.contains(projectId);
}

std::set<std::string> const&
RoutingIndex::projects() const
{
    return projects_;
}

std::vector<upstream::ChainId>
RoutingIndex::chainIds(std::string const& projectId) const
{
    std::vector<upstream::ChainId> result;
    if (auto const project = buckets_.find(projectId); project != buckets_.end()) {
        std::transform(
            std::cbegin(project->second),
            std::cend(project->second),
            std::back_inserter(result),
            [](auto const& bucket) { return bucket.first; }
        );
    }
    return result;
}

bool
RoutingIndex::operator==(RoutingIndex const& other) const
{
    auto const sameUpstreams = [](UpstreamList const& lhs, UpstreamList const& rhs) {
        return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](auto const& a, auto const& b) {
            return a->id() == b->id() and a->descriptor().endpoint == b->descriptor().endpoint and
                a->descriptor().resolvedChainId == b->descriptor().resolvedChainId;
        });
    };

    return projects_ == other.projects_ and
        std::equal(
               buckets_.begin(),
               buckets_.end(),
               other.buckets_.begin(),
               other.buckets_.end(),
               [&](auto const& lhs, auto const& rhs) {
                   return lhs.first == rhs.first and
                       std::equal(
                              lhs.second.begin(),
                              lhs.second.end(),
                              rhs.second.begin(),
                              rhs.second.end(),
                              [&](auto const& l, auto const& r) {
                                  return l.first == r.first and sameUpstreams(l.second, r.second);
                              }
                       );
               }
        );
}

}  // namespace routing
