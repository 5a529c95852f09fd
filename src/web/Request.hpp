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
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace web {

/**
 * @brief Represents an HTTP request received from a client.
 */
class Request {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;

private:
    HttpRequest request_;

public:
    /**
     * @brief Construct from an HTTP request.
     *
     * @param request The HTTP request.
     */
    explicit Request(HttpRequest request);

    bool
    operator==(Request const& other) const;

    /**
     * @brief Method of the request.
     */
    enum class Method { GET, POST, UNSUPPORTED };

    /**
     * @brief Get the method of the request.
     *
     * @return The method of the request.
     */
    Method
    method() const;

    /**
     * @return The underlying HTTP request.
     */
    HttpRequest const&
    asHttpRequest() const;

    /**
     * @return The body of the request.
     */
    std::string_view
    message() const;

    /**
     * @return The target of the request, including the query string if any.
     */
    std::string_view
    target() const;

    /**
     * @brief Get the value of a header.
     *
     * @param headerName The name of the header.
     * @return The value of the header or std::nullopt if the header does not exist.
     */
    std::optional<std::string_view>
    headerValue(boost::beast::http::field headerName) const;

    /**
     * @brief Get the value of a header.
     *
     * @param headerName The name of the header.
     * @return The value of the header or std::nullopt if the header does not exist.
     */
    std::optional<std::string_view>
    headerValue(std::string const& headerName) const;
};

}  // namespace web
