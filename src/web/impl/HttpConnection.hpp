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

#include "web/Connection.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace web::impl {

/**
 * @brief A plain HTTP/1.1 connection. The socket's executor is expected to be a strand.
 */
class HttpConnection : public Connection, public std::enable_shared_from_this<HttpConnection> {
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;

public:
    HttpConnection(boost::asio::ip::tcp::socket socket, std::string ip)
        : Connection(std::move(ip)), stream_{std::move(socket)}
    {
    }

    std::optional<Error>
    send(
        Response response,
        boost::asio::yield_context yield,
        std::chrono::steady_clock::duration timeout = DEFAULT_TIMEOUT
    ) override
    {
        auto const httpResponse = std::move(response).intoHttpResponse();
        boost::system::error_code error;
        stream_.expires_after(timeout);
        boost::beast::http::async_write(stream_, httpResponse, yield[error]);
        if (error)
            return error;
        return std::nullopt;
    }

    std::expected<Request, Error>
    receive(boost::asio::yield_context yield, std::chrono::steady_clock::duration timeout = DEFAULT_TIMEOUT) override
    {
        boost::beast::http::request<boost::beast::http::string_body> request{};
        boost::system::error_code error;
        stream_.expires_after(timeout);
        boost::beast::http::async_read(stream_, buffer_, request, yield[error]);
        if (error)
            return std::unexpected{error};
        return Request{std::move(request)};
    }

    void
    close([[maybe_unused]] boost::asio::yield_context yield) override
    {
        [[maybe_unused]] boost::system::error_code error;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, error);
        stream_.socket().close(error);
    }

    void
    forceClose() override
    {
        boost::asio::post(stream_.get_executor(), [self = shared_from_this()]() { self->stream_.close(); });
    }
};

}  // namespace web::impl
