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

#include "upstream/Endpoint.hpp"

#include <boost/json/object.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace util {
class Config;
}  // namespace util

namespace upstream {

/** @brief Numeric identifier of an EVM chain */
using ChainId = std::uint64_t;

/**
 * @brief Kind of protocol spoken by an upstream. Selects the implementation behind @ref Upstream.
 */
enum class UpstreamKind { Evm };

/**
 * @brief Parse the `type` of an upstream from the configuration.
 *
 * @param name The configured name, e.g. `evm`
 * @return The kind or std::nullopt if the name is unknown
 */
std::optional<UpstreamKind>
upstreamKindFromString(std::string_view name);

/**
 * @brief Configured description of one upstream node of a project.
 */
struct UpstreamDescriptor {
    static constexpr auto EVM_CHAIN_ID_KEY = "evmChainId";

    std::string id;
    Endpoint endpoint;
    UpstreamKind kind = UpstreamKind::Evm;
    boost::json::object metadata;

    /** Set once during bootstrap, before the descriptor is published */
    std::optional<ChainId> resolvedChainId;

    /**
     * @return The chain id declared in the metadata, if any
     */
    [[nodiscard]] std::optional<ChainId>
    declaredChainId() const;
};

/**
 * @brief A project and its ordered list of upstreams.
 */
struct ProjectConfig {
    std::string id;
    std::vector<UpstreamDescriptor> upstreams;
};

/**
 * @brief Read and validate the `projects` section of the configuration.
 *
 * Checks that project ids are non-empty and unique, that upstream ids are unique within their project, that
 * endpoints parse, that the upstream type is known and that a declared `evmChainId` is a positive integer.
 * A missing `projects` key yields no projects.
 *
 * @param config The root configuration
 * @return The projects in configuration order or a description of the first problem found
 */
std::expected<std::vector<ProjectConfig>, std::string>
makeProjects(util::Config const& config);

}  // namespace upstream
