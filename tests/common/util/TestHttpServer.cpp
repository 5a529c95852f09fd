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

#include "util/TestHttpServer.hpp"

#include "util/Assert.hpp"

#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/read.hpp>  // IWYU pragma: keep
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>  // IWYU pragma: keep
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

void
doSession(
    beast::tcp_stream stream,
    TestHttpServer::RequestHandler requestHandler,
    asio::yield_context yield,
    bool const allowToFail
)
{
    beast::error_code errorCode;
    beast::flat_buffer buffer;

    stream.expires_after(std::chrono::seconds(5));

    http::request<http::string_body> req;
    http::async_read(stream, buffer, req, yield[errorCode]);
    if (errorCode == http::error::end_of_stream)
        return;

    if (allowToFail and errorCode)
        return;

    ASSERT_FALSE(errorCode) << errorCode.message();

    auto response = requestHandler(std::move(req));
    if (not response)
        return;

    response->keep_alive(false);
    http::message_generator messageGenerator{std::move(response).value()};
    beast::async_write(stream, std::move(messageGenerator), yield[errorCode]);

    if (allowToFail and errorCode)
        return;

    ASSERT_FALSE(errorCode) << errorCode.message();

    stream.socket().shutdown(tcp::socket::shutdown_send, errorCode);
}

}  // namespace

TestHttpServer::TestHttpServer(boost::asio::io_context& context, std::string host) : acceptor_(context)
{
    boost::asio::ip::tcp::resolver resolver{context};
    auto const results = resolver.resolve(host, "0");
    ASSERT(!results.empty(), "Failed to resolve host");
    boost::asio::ip::tcp::endpoint const& endpoint = results.begin()->endpoint();
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
}

void
TestHttpServer::handleRequest(TestHttpServer::RequestHandler handler, bool const allowToFail)
{
    boost::asio::spawn(
        acceptor_.get_executor(),
        [this, allowToFail, handler = std::move(handler)](asio::yield_context yield) mutable {
            boost::beast::error_code errorCode;
            tcp::socket socket(this->acceptor_.get_executor());
            acceptor_.async_accept(socket, yield[errorCode]);

            if (allowToFail and errorCode)
                return;

            [&]() { ASSERT_FALSE(errorCode) << errorCode.message(); }();

            doSession(beast::tcp_stream{std::move(socket)}, std::move(handler), yield, allowToFail);
        },
        boost::asio::detached
    );
}

std::string
TestHttpServer::port() const
{
    return std::to_string(acceptor_.local_endpoint().port());
}

TestHttpServer::ResponseType
TestHttpServer::makeJsonResponse(http::status status, std::string body)
{
    ResponseType response{status, 11};
    response.set(http::field::content_type, "application/json");
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}
