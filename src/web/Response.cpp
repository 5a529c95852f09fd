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

#include "web/Response.hpp"

#include "util/Assert.hpp"
#include "util/build/Build.hpp"
#include "web/Request.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <string>
#include <string_view>
#include <utility>

namespace http = boost::beast::http;
namespace web {

namespace {

std::string_view
asString(Response::HttpData::ContentType type)
{
    switch (type) {
        case Response::HttpData::ContentType::TextHtml:
            return "text/html";
        case Response::HttpData::ContentType::ApplicationJson:
            return "application/json";
    }
    ASSERT(false, "Unknown content type");
    std::unreachable();
}

Response::HttpData
makeHttpData(http::status status, Response::HttpData::ContentType contentType, Request const& request)
{
    auto const& httpRequest = request.asHttpRequest();
    return Response::HttpData{
        .status = status,
        .contentType = contentType,
        .keepAlive = httpRequest.keep_alive(),
        .version = httpRequest.version()
    };
}

}  // namespace

Response::Response(http::status status, std::string message, Request const& request)
    : message_(std::move(message)), httpData_{makeHttpData(status, HttpData::ContentType::TextHtml, request)}
{
}

Response::Response(http::status status, boost::json::value const& message, Request const& request)
    : message_(boost::json::serialize(message))
    , httpData_{makeHttpData(status, HttpData::ContentType::ApplicationJson, request)}
{
}

std::string const&
Response::message() const
{
    return message_;
}

http::status
Response::status() const
{
    return httpData_.status;
}

http::response<http::string_body>
Response::intoHttpResponse() &&
{
    http::response<http::string_body> result{httpData_.status, httpData_.version};
    result.set(http::field::server, fmt::format("chainrelay-{}", util::build::getChainRelayVersionString()));
    result.set(http::field::content_type, asString(httpData_.contentType));
    result.keep_alive(httpData_.keepAlive);
    result.body() = std::move(message_);
    result.prepare_payload();
    return result;
}

}  // namespace web
