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

#include "util/requests/RequestBuilder.hpp"

#include "util/log/Logger.hpp"
#include "util/requests/Types.hpp"
#include "util/requests/impl/StreamData.hpp"

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <fmt/core.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace util::requests {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

using ResolveChannel =
    asio::experimental::concurrent_channel<void(beast::error_code, asio::ip::tcp::resolver::results_type)>;

}  // namespace

RequestBuilder::RequestBuilder(std::string host, std::string port) : host_(std::move(host)), port_(std::move(port))
{
    request_.set(http::field::host, host_);
    request_.target("/");
}

RequestBuilder&
RequestBuilder::addHeader(HttpHeader const& header)
{
    std::visit([&](auto const& name) { request_.set(name, header.value); }, header.name);
    return *this;
}

RequestBuilder&
RequestBuilder::addHeaders(std::vector<HttpHeader> const& headers)
{
    for (auto const& header : headers)
        addHeader(header);
    return *this;
}

RequestBuilder&
RequestBuilder::addData(std::string data)
{
    request_.body() = std::move(data);
    request_.prepare_payload();
    return *this;
}

RequestBuilder&
RequestBuilder::setTimeout(std::chrono::milliseconds const timeout)
{
    timeout_ = timeout;
    return *this;
}

RequestBuilder&
RequestBuilder::setBodyLimit(std::uint64_t const limit)
{
    bodyLimit_ = limit;
    return *this;
}

RequestBuilder&
RequestBuilder::setTarget(std::string_view target)
{
    request_.target(target);
    return *this;
}

std::expected<std::string, RequestError>
RequestBuilder::postSsl(asio::yield_context yield)
{
    auto streamData = impl::SslTcpStreamData::create(yield);
    if (not streamData.has_value())
        return std::unexpected{std::move(streamData).error()};

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
    if (!SSL_set_tlsext_host_name(streamData->stream.native_handle(), host_.c_str())) {
#pragma GCC diagnostic pop
        beast::error_code errorCode;
        errorCode.assign(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
        return std::unexpected{RequestError{"SSL setup failed", errorCode}};
    }
    streamData->stream.set_verify_callback(asio::ssl::host_name_verification(host_));

    return doRequestImpl(std::move(streamData).value(), yield, http::verb::post);
}

std::expected<std::string, RequestError>
RequestBuilder::postPlain(asio::yield_context yield)
{
    return doRequestImpl(impl::TcpStreamData{yield}, yield, http::verb::post);
}

template <typename StreamDataType>
std::expected<std::string, RequestError>
RequestBuilder::doRequestImpl(StreamDataType&& streamData, asio::yield_context yield, http::verb const method)
{
    auto& stream = streamData.stream;
    auto& lowestLayer = beast::get_lowest_layer(stream);

    // one deadline for the whole exchange
    lowestLayer.expires_after(timeout_);

    beast::error_code errorCode;
    auto const executor = asio::get_associated_executor(yield);

    // the lookup is not covered by the stream's timer and races a timer of its own; a lookup that loses is left
    // running and its result is dropped
    auto const resolved = std::make_shared<ResolveChannel>(executor, 1);
    auto const resolver = std::make_shared<tcp::resolver>(executor);
    resolver->async_resolve(
        host_, port_, [resolver, resolved](beast::error_code const ec, tcp::resolver::results_type results) {
            resolved->try_send(ec, std::move(results));
        }
    );

    asio::steady_timer resolveDeadline{executor, timeout_};
    resolveDeadline.async_wait([resolved](beast::error_code const ec) {
        if (not ec)
            resolved->try_send(beast::error_code{beast::error::timeout}, tcp::resolver::results_type{});
    });

    auto const resolverResult = resolved->async_receive(yield[errorCode]);
    resolveDeadline.cancel();
    if (errorCode)
        return std::unexpected{RequestError{"Resolve error", errorCode}};

    lowestLayer.async_connect(resolverResult, yield[errorCode]);
    if (errorCode)
        return std::unexpected{RequestError{"Connection error", errorCode}};

    request_.method(method);

    if constexpr (std::remove_cvref_t<StreamDataType>::sslEnabled) {
        stream.async_handshake(asio::ssl::stream_base::client, yield[errorCode]);
        if (errorCode)
            return std::unexpected{RequestError{"Handshake error", errorCode}};
    }

    http::async_write(stream, request_, yield[errorCode]);
    if (errorCode)
        return std::unexpected{RequestError{"Write error", errorCode}};

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(bodyLimit_);

    http::async_read(stream, buffer, parser, yield[errorCode]);
    if (errorCode)
        return std::unexpected{RequestError{"Read error", errorCode}};

    auto response = parser.release();

    if (response.result_int() < 200 or response.result_int() >= 300) {
        LOG(log_.debug()) << "Request to " << host_ << ":" << port_ << " returned " << response.result_int();
        return std::unexpected{RequestError{fmt::format("Response status is not OK: {}", response.result_int())}};
    }

    lowestLayer.socket().shutdown(tcp::socket::shutdown_both, errorCode);
    if (errorCode && errorCode != beast::errc::not_connected)
        LOG(log_.trace()) << "Shutdown socket error: " << errorCode.message();

    return std::move(response).body();
}

}  // namespace util::requests
