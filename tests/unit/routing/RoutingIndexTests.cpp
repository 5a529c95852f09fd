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
#include "routing/UpstreamRegistry.hpp"
#include "upstream/Endpoint.hpp"
#include "upstream/Upstream.hpp"
#include "upstream/UpstreamDescriptor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace routing;
using namespace upstream;

namespace {

std::shared_ptr<Upstream const>
makeUpstream(std::string id, ChainId chainId, std::string const& url = "http://127.0.0.1:8545")
{
    UpstreamDescriptor descriptor{.id = std::move(id), .endpoint = Endpoint::parse(url).value()};
    descriptor.resolvedChainId = chainId;
    return std::make_shared<Upstream const>(std::move(descriptor));
}

RoutingIndex
makeIndex()
{
    RoutingIndex::BucketsType buckets;
    buckets["main"][1] = {makeUpstream("a", 1), makeUpstream("b", 1)};
    buckets["main"][137] = {makeUpstream("c", 137)};
    return RoutingIndex{{"main", "empty"}, std::move(buckets)};
}

}  // namespace

TEST(RoutingIndexTests, DefaultIsEmpty)
{
    RoutingIndex const index;
    EXPECT_TRUE(index.projects().empty());
    EXPECT_FALSE(index.exists("main"));
    EXPECT_TRUE(index.lookup("main", 1).empty());
    EXPECT_TRUE(index.chainIds("main").empty());
}

TEST(RoutingIndexTests, Lookup)
{
    auto const index = makeIndex();

    auto const& mainnet = index.lookup("main", 1);
    ASSERT_EQ(mainnet.size(), 2);
    EXPECT_EQ(mainnet[0]->id(), "a");
    EXPECT_EQ(mainnet[1]->id(), "b");

    EXPECT_EQ(index.lookup("main", 137).size(), 1);
    EXPECT_TRUE(index.lookup("main", 10).empty());
    EXPECT_TRUE(index.lookup("empty", 1).empty());
    EXPECT_TRUE(index.lookup("unknown", 1).empty());
}

TEST(RoutingIndexTests, ProjectsWithoutUpstreamsExist)
{
    auto const index = makeIndex();
    EXPECT_TRUE(index.exists("main"));
    EXPECT_TRUE(index.exists("empty"));
    EXPECT_FALSE(index.exists("unknown"));
    EXPECT_EQ(index.projects(), (std::set<std::string>{"empty", "main"}));
    EXPECT_EQ(index.chainIds("main"), (std::vector<ChainId>{1, 137}));
}

TEST(RoutingIndexTests, StructuralEquality)
{
    EXPECT_TRUE(makeIndex() == makeIndex());

    RoutingIndex::BucketsType reordered;
    reordered["main"][1] = {makeUpstream("b", 1), makeUpstream("a", 1)};
    reordered["main"][137] = {makeUpstream("c", 137)};
    EXPECT_FALSE(makeIndex() == (RoutingIndex{{"main", "empty"}, reordered}));

    RoutingIndex::BucketsType otherEndpoint;
    otherEndpoint["main"][1] = {makeUpstream("a", 1, "http://10.0.0.1:8545"), makeUpstream("b", 1)};
    otherEndpoint["main"][137] = {makeUpstream("c", 137)};
    EXPECT_FALSE(makeIndex() == (RoutingIndex{{"main", "empty"}, otherEndpoint}));

    RoutingIndex::BucketsType same;
    same["main"][1] = {makeUpstream("a", 1), makeUpstream("b", 1)};
    same["main"][137] = {makeUpstream("c", 137)};
    EXPECT_FALSE(makeIndex() == (RoutingIndex{{"main"}, same}));
}

TEST(UpstreamRegistryTests, EmptyBeforePublish)
{
    UpstreamRegistry const registry;
    ASSERT_NE(registry.snapshot(), nullptr);
    EXPECT_TRUE(registry.snapshot()->projects().empty());
    EXPECT_FALSE(registry.exists("main"));
    EXPECT_TRUE(registry.lookup("main", 1).empty());
}

TEST(UpstreamRegistryTests, PublishSwapsIndex)
{
    UpstreamRegistry registry;
    auto const before = registry.snapshot();

    registry.publish(makeIndex());
    EXPECT_TRUE(registry.exists("main"));
    EXPECT_EQ(registry.lookup("main", 1).size(), 2);

    // a snapshot taken earlier is unaffected
    EXPECT_TRUE(before->projects().empty());
}

TEST(UpstreamRegistryTests, SnapshotOutlivesRepublish)
{
    UpstreamRegistry registry;
    registry.publish(makeIndex());
    auto const snapshot = registry.snapshot();

    registry.publish(RoutingIndex{});
    EXPECT_FALSE(registry.exists("main"));
    EXPECT_TRUE(snapshot->exists("main"));
    EXPECT_EQ(snapshot->lookup("main", 137).front()->id(), "c");
}

TEST(UpstreamRegistryTests, ReadersSeeCompleteIndexes)
{
    UpstreamRegistry registry;
    std::atomic_bool done{false};
    std::atomic_size_t inconsistent{0};

    std::thread reader{[&]() {
        while (not done) {
            auto const snapshot = registry.snapshot();
            // an index either has both chains of `main` or nothing at all
            auto const chains = snapshot->chainIds("main").size();
            if (chains != 0 and chains != 2)
                ++inconsistent;
            if (snapshot->exists("main") != (chains == 2))
                ++inconsistent;
        }
    }};

    for (std::size_t i = 0; i < 200; ++i)
        registry.publish(i % 2 == 0 ? makeIndex() : RoutingIndex{});

    done = true;
    reader.join();
    EXPECT_EQ(inconsistent, 0);
}
