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

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>

#include <functional>
#include <optional>
#include <string>

/**
 * @brief Simple HTTP server playing the role of an upstream node in unit tests
 */
class TestHttpServer {
public:
    using RequestType = boost::beast::http::request<boost::beast::http::string_body>;
    using ResponseType = boost::beast::http::response<boost::beast::http::string_body>;
    using RequestHandler = std::function<std::optional<ResponseType>(RequestType)>;

    /**
     * @brief Construct a new TestHttpServer listening on a random port
     *
     * @param context boost::asio::io_context to use for networking
     * @param host host to bind to
     */
    TestHttpServer(boost::asio::io_context& context, std::string host);

    /**
     * @brief Schedule handling of exactly one incoming request
     *
     * If the handler returns std::nullopt the connection is dropped without a response.
     * A server that never had this method called accepts connections at the TCP level but never answers.
     *
     * @param handler RequestHandler to use for incoming request
     * @param allowToFail if true, network errors are not reported as test failures
     */
    void
    handleRequest(RequestHandler handler, bool allowToFail = false);

    /**
     * @brief Return the port HTTP server is connected to
     *
     * @return string port number
     */
    std::string
    port() const;

    /**
     * @brief Make a JSON response with the given status and body
     */
    static ResponseType
    makeJsonResponse(boost::beast::http::status status, std::string body);

private:
    boost::asio::ip::tcp::acceptor acceptor_;
};
