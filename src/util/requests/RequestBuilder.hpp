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

#include "util/log/Logger.hpp"
#include "util/requests/Types.hpp"

#include <boost/asio/spawn.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace util::requests {

/**
 * @brief Builder for outgoing HTTP requests
 *
 * A single deadline set by @ref setTimeout covers the whole exchange: resolving, connecting, the TLS handshake,
 * writing the request and reading the response.
 */
class RequestBuilder {
    util::Logger log_{"Upstream"};
    std::string host_;
    std::string port_;
    std::chrono::milliseconds timeout_{DEFAULT_TIMEOUT};
    std::uint64_t bodyLimit_{DEFAULT_BODY_LIMIT};
    boost::beast::http::request<boost::beast::http::string_body> request_;

public:
    /**
     * @brief Construct a new Request Builder object
     *
     * @param host host to connect to
     * @param port port to connect to
     */
    RequestBuilder(std::string host, std::string port);

    /**
     * @brief Add a header to the request
     *
     * @param header header to add
     * @return reference to itself
     */
    RequestBuilder&
    addHeader(HttpHeader const& header);

    /**
     * @brief Add headers to the request
     *
     * @param headers headers to add
     * @return reference to itself
     */
    RequestBuilder&
    addHeaders(std::vector<HttpHeader> const& headers);

    /**
     * @brief Add body or data to the request
     *
     * @param data data to add
     * @return reference to itself
     */
    RequestBuilder&
    addData(std::string data);

    /**
     * @brief Set the timeout for the request
     *
     * @note Default timeout is defined in DEFAULT_TIMEOUT
     *
     * @param timeout timeout to set
     * @return reference to itself
     */
    RequestBuilder&
    setTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Set the largest response body accepted, in bytes
     *
     * @note Default limit is defined in DEFAULT_BODY_LIMIT. A larger body fails the request with a read error.
     *
     * @param limit limit to set
     * @return reference to itself
     */
    RequestBuilder&
    setBodyLimit(std::uint64_t limit);

    /**
     * @brief Set the target for the request
     *
     * @note Default target is "/"
     *
     * @param target target to set
     * @return reference to itself
     */
    RequestBuilder&
    setTarget(std::string_view target);

    /**
     * @brief Perform a POST request over TLS asynchronously
     *
     * @note A RequestBuilder must not be used by several coroutines at once.
     *
     * @param yield yield context
     * @return expected response body or error
     */
    std::expected<std::string, RequestError>
    postSsl(boost::asio::yield_context yield);

    /**
     * @brief Perform a POST request without TLS asynchronously
     *
     * @note A RequestBuilder must not be used by several coroutines at once.
     *
     * @param yield yield context
     * @return expected response body or error
     */
    std::expected<std::string, RequestError>
    postPlain(boost::asio::yield_context yield);

    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{30000};
    static constexpr std::uint64_t DEFAULT_BODY_LIMIT = 256 * 1024 * 1024;

private:
    template <typename StreamDataType>
    std::expected<std::string, RequestError>
    doRequestImpl(StreamDataType&& streamData, boost::asio::yield_context yield, boost::beast::http::verb method);
};

}  // namespace util::requests
