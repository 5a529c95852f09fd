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

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

#include <string>
#include <vector>

struct WebHeader {
    WebHeader(boost::beast::http::field name, std::string value);

    boost::beast::http::field name;
    std::string value;
};

/**
 * @brief Status and body of a response received by @ref HttpSyncClient
 */
struct HttpResult {
    boost::beast::http::status status;
    std::string body;
    std::string contentType;
};

/**
 * @brief Blocking HTTP client used to talk to the relay from unit tests
 */
struct HttpSyncClient {
    static HttpResult
    post(
        std::string const& host,
        std::string const& port,
        std::string const& target,
        std::string const& body,
        std::vector<WebHeader> additionalHeaders = {}
    );

    static HttpResult
    get(std::string const& host,
        std::string const& port,
        std::string const& target,
        std::vector<WebHeader> additionalHeaders = {});

    static HttpResult
    request(
        boost::beast::http::verb method,
        std::string const& host,
        std::string const& port,
        std::string const& target,
        std::string const& body,
        std::vector<WebHeader> additionalHeaders = {}
    );
};
