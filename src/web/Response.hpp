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

#include "web/Request.hpp"

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/json/value.hpp>

#include <string>

namespace web {

/**
 * @brief Represents an HTTP response.
 */
class Response {
public:
    /**
     * @brief The data for an HTTP response.
     */
    struct HttpData {
        enum class ContentType { ApplicationJson, TextHtml };

        boost::beast::http::status status;
        ContentType contentType;
        bool keepAlive;
        unsigned int version;
    };

private:
    std::string message_;
    HttpData httpData_;

public:
    /**
     * @brief Construct a Response from string. Content type will be text/html.
     *
     * @param status The HTTP status.
     * @param message The message to send.
     * @param request The request that triggered this response. Its version and keep-alive are copied.
     */
    Response(boost::beast::http::status status, std::string message, Request const& request);

    /**
     * @brief Construct a Response from a JSON value. Content type will be application/json.
     *
     * @param status The HTTP status.
     * @param message The JSON to serialize into the body.
     * @param request The request that triggered this response. Its version and keep-alive are copied.
     */
    Response(boost::beast::http::status status, boost::json::value const& message, Request const& request);

    /**
     * @return The body of the response.
     */
    std::string const&
    message() const;

    /**
     * @return The HTTP status of the response.
     */
    boost::beast::http::status
    status() const;

    /**
     * @brief Convert the Response to an HTTP response.
     *
     * @return The HTTP response.
     */
    boost::beast::http::response<boost::beast::http::string_body>
    intoHttpResponse() &&;
};

}  // namespace web
