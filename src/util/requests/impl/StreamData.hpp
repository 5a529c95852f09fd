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

#include "util/requests/Types.hpp"
#include "util/requests/impl/SslContext.hpp"

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include <expected>
#include <memory>
#include <utility>

namespace util::requests::impl {

struct TcpStreamData {
    static constexpr bool sslEnabled = false;

    explicit TcpStreamData(boost::asio::yield_context yield) : stream(boost::asio::get_associated_executor(yield))
    {
    }

    boost::beast::tcp_stream stream;
};

/**
 * @brief Owns the SSL context together with the stream using it.
 *
 * The context is kept behind a pointer so that the stream's reference to it survives moves of this object.
 */
class SslTcpStreamData {
    std::unique_ptr<boost::asio::ssl::context> sslContext_;

public:
    static constexpr bool sslEnabled = true;

    static std::expected<SslTcpStreamData, RequestError>
    create(boost::asio::yield_context yield)
    {
        auto sslContext = makeClientSslContext();
        if (not sslContext.has_value())
            return std::unexpected{std::move(sslContext).error()};

        return SslTcpStreamData{
            std::make_unique<boost::asio::ssl::context>(std::move(sslContext).value()), yield
        };
    }

    boost::beast::ssl_stream<boost::beast::tcp_stream> stream;

private:
    SslTcpStreamData(std::unique_ptr<boost::asio::ssl::context> sslContext, boost::asio::yield_context yield)
        : sslContext_(std::move(sslContext)), stream(boost::asio::get_associated_executor(yield), *sslContext_)
    {
    }
};

}  // namespace util::requests::impl
