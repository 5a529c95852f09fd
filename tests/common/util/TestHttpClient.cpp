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

#include "util/TestHttpClient.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>  // IWYU pragma: keep
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>  // IWYU pragma: keep
#include <boost/beast/version.hpp>

#include <string>
#include <utility>
#include <vector>

namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

WebHeader::WebHeader(http::field name, std::string value) : name(name), value(std::move(value))
{
}

HttpResult
HttpSyncClient::request(
    http::verb method,
    std::string const& host,
    std::string const& port,
    std::string const& target,
    std::string const& body,
    std::vector<WebHeader> additionalHeaders
)
{
    boost::asio::io_context ioc;

    net::ip::tcp::resolver resolver(ioc);
    boost::beast::tcp_stream stream(ioc);

    auto const results = resolver.resolve(host, port);
    stream.connect(results);

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");

    for (auto& header : additionalHeaders)
        req.set(header.name, header.value);

    req.body() = body;
    req.prepare_payload();
    http::write(stream, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    boost::beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return {
        .status = res.result(),
        .body = std::move(res.body()),
        .contentType = std::string{res[http::field::content_type]},
    };
}

HttpResult
HttpSyncClient::post(
    std::string const& host,
    std::string const& port,
    std::string const& target,
    std::string const& body,
    std::vector<WebHeader> additionalHeaders
)
{
    return request(http::verb::post, host, port, target, body, std::move(additionalHeaders));
}

HttpResult
HttpSyncClient::get(
    std::string const& host,
    std::string const& port,
    std::string const& target,
    std::vector<WebHeader> additionalHeaders
)
{
    return request(http::verb::get, host, port, target, "", std::move(additionalHeaders));
}
