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

#include "web/Request.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace web {

namespace {

template <typename HeaderNameType>
std::optional<std::string_view>
getHeaderValue(Request::HttpRequest const& request, HeaderNameType const& headerName)
{
    auto it = request.find(headerName);
    if (it == request.end())
        return std::nullopt;
    return it->value();
}

}  // namespace

Request::Request(HttpRequest request) : request_{std::move(request)}
{
}

bool
Request::operator==(Request const& other) const
{
    return request_.method() == other.request_.method() and request_.target() == other.request_.target() and
        request_.body() == other.request_.body();
}

Request::Method
Request::method() const
{
    switch (request_.method()) {
        case boost::beast::http::verb::get:
            return Method::GET;
        case boost::beast::http::verb::post:
            return Method::POST;
        default:
            return Method::UNSUPPORTED;
    }
}

Request::HttpRequest const&
Request::asHttpRequest() const
{
    return request_;
}

std::string_view
Request::message() const
{
    return request_.body();
}

std::string_view
Request::target() const
{
    return request_.target();
}

std::optional<std::string_view>
Request::headerValue(boost::beast::http::field headerName) const
{
    return getHeaderValue(request_, headerName);
}

std::optional<std::string_view>
Request::headerValue(std::string const& headerName) const
{
    return getHeaderValue(request_, headerName);
}

}  // namespace web
