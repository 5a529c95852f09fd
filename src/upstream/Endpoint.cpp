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

#include "upstream/Endpoint.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace upstream {

namespace {

constexpr std::string_view SCHEME_SEPARATOR = "://";
constexpr std::uint16_t HTTP_DEFAULT_PORT = 80;
constexpr std::uint16_t HTTPS_DEFAULT_PORT = 443;

std::string
bracketed(std::string const& host)
{
    return host.find(':') == std::string::npos ? host : fmt::format("[{}]", host);
}

}  // namespace

std::expected<Endpoint, std::string>
Endpoint::parse(std::string_view url)
{
    auto const schemeEnd = url.find(SCHEME_SEPARATOR);
    if (schemeEnd == std::string_view::npos)
        return std::unexpected{fmt::format("endpoint '{}' has no scheme", url)};

    Endpoint endpoint;
    auto const scheme = boost::algorithm::to_lower_copy(std::string{url.substr(0, schemeEnd)});
    if (scheme == "http") {
        endpoint.scheme = Scheme::Http;
        endpoint.port = HTTP_DEFAULT_PORT;
    } else if (scheme == "https") {
        endpoint.scheme = Scheme::Https;
        endpoint.port = HTTPS_DEFAULT_PORT;
    } else {
        return std::unexpected{fmt::format("endpoint '{}' has unsupported scheme '{}'", url, scheme)};
    }

    auto rest = url.substr(schemeEnd + SCHEME_SEPARATOR.size());
    auto const authorityEnd = rest.find_first_of("/?");
    auto authority = rest.substr(0, authorityEnd);

    if (authorityEnd != std::string_view::npos) {
        auto target = std::string{rest.substr(authorityEnd)};
        if (target.front() == '?')
            target.insert(target.begin(), '/');
        endpoint.target = std::move(target);
    }

    if (authority.find('@') != std::string_view::npos)
        return std::unexpected{fmt::format("endpoint '{}' must not contain credentials", url)};

    auto hostPart = authority;
    if (authority.starts_with('[')) {
        auto const closing = authority.find(']');
        if (closing == std::string_view::npos)
            return std::unexpected{fmt::format("endpoint '{}' has a malformed IPv6 host", url)};
        hostPart = authority.substr(1, closing - 1);
        authority.remove_prefix(closing + 1);
        if (not authority.empty() and not authority.starts_with(':'))
            return std::unexpected{fmt::format("endpoint '{}' has a malformed IPv6 host", url)};
    } else {
        auto const colon = authority.rfind(':');
        hostPart = authority.substr(0, colon);
        authority = colon == std::string_view::npos ? std::string_view{} : authority.substr(colon);
    }

    if (hostPart.empty())
        return std::unexpected{fmt::format("endpoint '{}' has an empty host", url)};
    endpoint.host = std::string{hostPart};

    if (authority.starts_with(':')) {
        auto const portString = authority.substr(1);
        unsigned int port = 0;
        auto const [ptr, ec] = std::from_chars(portString.data(), portString.data() + portString.size(), port);
        if (portString.empty() or ec != std::errc{} or ptr != portString.data() + portString.size() or port == 0 or
            port > UINT16_MAX)
            return std::unexpected{fmt::format("endpoint '{}' has an invalid port", url)};
        endpoint.port = static_cast<std::uint16_t>(port);
    }

    return endpoint;
}

std::string
Endpoint::toString() const
{
    return fmt::format("{}://{}:{}{}", isSecure() ? "https" : "http", bracketed(host), port, target);
}

std::string
Endpoint::hostHeader() const
{
    auto const defaultPort = isSecure() ? HTTPS_DEFAULT_PORT : HTTP_DEFAULT_PORT;
    if (port == defaultPort)
        return bracketed(host);
    return fmt::format("{}:{}", bracketed(host), port);
}

}  // namespace upstream
