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

#include "upstream/UpstreamDescriptor.hpp"

#include "upstream/Endpoint.hpp"
#include "util/config/Config.hpp"

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <exception>
#include <expected>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace upstream {

namespace {

std::expected<std::optional<ChainId>, std::string>
readDeclaredChainId(boost::json::object const& metadata)
{
    auto const it = metadata.find(UpstreamDescriptor::EVM_CHAIN_ID_KEY);
    if (it == metadata.end())
        return std::nullopt;

    auto const& value = it->value();
    if (value.is_uint64() and value.as_uint64() > 0)
        return value.as_uint64();
    if (value.is_int64() and value.as_int64() > 0)
        return static_cast<ChainId>(value.as_int64());

    return std::unexpected{fmt::format("`{}` must be a positive integer", UpstreamDescriptor::EVM_CHAIN_ID_KEY)};
}

std::expected<UpstreamDescriptor, std::string>
makeUpstream(util::Config const& config)
{
    UpstreamDescriptor descriptor;
    descriptor.id = config.valueOrThrow<std::string>("id", "upstream `id` is required and must be a string");
    if (descriptor.id.empty())
        return std::unexpected{"upstream `id` must not be empty"};

    auto const url = config.valueOrThrow<std::string>(
        "endpoint", fmt::format("upstream '{}': `endpoint` is required and must be a string", descriptor.id)
    );
    auto endpoint = Endpoint::parse(url);
    if (not endpoint.has_value())
        return std::unexpected{fmt::format("upstream '{}': {}", descriptor.id, endpoint.error())};
    descriptor.endpoint = std::move(endpoint).value();

    auto const type = config.valueOr<std::string>("type", "evm");
    auto const kind = upstreamKindFromString(type);
    if (not kind.has_value())
        return std::unexpected{fmt::format("upstream '{}': unknown type '{}'", descriptor.id, type)};
    descriptor.kind = *kind;

    if (config.contains("metadata")) {
        auto const metadata = config.section("metadata");
        descriptor.metadata = metadata.raw().as_object();
    }

    if (auto const declared = readDeclaredChainId(descriptor.metadata); not declared.has_value())
        return std::unexpected{fmt::format("upstream '{}': {}", descriptor.id, declared.error())};

    return descriptor;
}

}  // namespace

std::optional<UpstreamKind>
upstreamKindFromString(std::string_view name)
{
    if (name == "evm")
        return UpstreamKind::Evm;
    return std::nullopt;
}

std::optional<ChainId>
UpstreamDescriptor::declaredChainId() const
{
    auto declared = readDeclaredChainId(metadata);
    if (not declared.has_value())
        return std::nullopt;
    return *declared;
}

std::expected<std::vector<ProjectConfig>, std::string>
makeProjects(util::Config const& config)
{
    std::vector<ProjectConfig> projects;
    std::set<std::string> projectIds;

    try {
        if (config.contains("projects") and not config.maybeArray("projects").has_value())
            return std::unexpected{"`projects` must be an array"};

        for (auto const& projectConfig : config.arrayOr("projects", {})) {
            ProjectConfig project;
            project.id = projectConfig.valueOrThrow<std::string>("id", "project `id` is required and must be a string");
            if (project.id.empty())
                return std::unexpected{"project `id` must not be empty"};
            if (not projectIds.insert(project.id).second)
                return std::unexpected{fmt::format("duplicate project id '{}'", project.id)};

            if (projectConfig.contains("upstreams") and not projectConfig.maybeArray("upstreams").has_value())
                return std::unexpected{fmt::format("project '{}': `upstreams` must be an array", project.id)};

            std::set<std::string> upstreamIds;
            for (auto const& upstreamConfig : projectConfig.arrayOr("upstreams", {})) {
                auto upstream = makeUpstream(upstreamConfig);
                if (not upstream.has_value())
                    return std::unexpected{fmt::format("project '{}': {}", project.id, upstream.error())};
                if (not upstreamIds.insert(upstream->id).second) {
                    return std::unexpected{
                        fmt::format("project '{}': duplicate upstream id '{}'", project.id, upstream->id)
                    };
                }
                project.upstreams.push_back(std::move(upstream).value());
            }

            projects.push_back(std::move(project));
        }
    } catch (std::exception const& e) {
        return std::unexpected{e.what()};
    }

    return projects;
}

}  // namespace upstream
