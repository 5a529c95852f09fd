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

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace upstream {

/**
 * @brief Network location of an upstream node, parsed from a `http://` or `https://` URL.
 */
struct Endpoint {
    enum class Scheme { Http, Https };

    Scheme scheme = Scheme::Http;
    std::string host;
    std::uint16_t port = 0;
    std::string target = "/";

    /**
     * @brief Parse an endpoint URL.
     *
     * The port defaults to 80 for http and 443 for https; the target defaults to `/`.
     *
     * @param url The URL to parse
     * @return The endpoint or a description of what is wrong with the URL
     */
    static std::expected<Endpoint, std::string>
    parse(std::string_view url);

    [[nodiscard]] bool
    isSecure() const
    {
        return scheme == Scheme::Https;
    }

    /**
     * @return The endpoint formatted back as a URL
     */
    [[nodiscard]] std::string
    toString() const;

    /**
     * @brief Value of the `Host` header for requests to this endpoint.
     *
     * IPv6 hosts are bracketed and the port is omitted when it is the scheme's default.
     *
     * @return The host header value
     */
    [[nodiscard]] std::string
    hostHeader() const;

    bool
    operator==(Endpoint const&) const = default;
};

}  // namespace upstream
