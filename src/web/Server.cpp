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

#include "web/Server.hpp"

#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"
#include "web/Connection.hpp"
#include "web/impl/ConnectionHandler.hpp"
#include "web/impl/HttpConnection.hpp"

#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/core.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <expected>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace web {

namespace {

constexpr auto ACCEPT_LOOP_STOP_TIMEOUT = std::chrono::seconds{1};

std::expected<boost::asio::ip::tcp::endpoint, std::string>
makeEndpoint(util::Config const& serverConfig)
{
    auto const ip = serverConfig.maybeValue<std::string>("ip");
    if (not ip.has_value())
        return std::unexpected{"Missing 'ip` in server config."};

    boost::system::error_code ec;
    auto const address = boost::asio::ip::make_address(*ip, ec);
    if (ec)
        return std::unexpected{fmt::format("Invalid 'ip' in server config: {}", *ip)};

    auto const* port = serverConfig.raw().as_object().if_contains("port");
    if (port == nullptr)
        return std::unexpected{"Missing 'port` in server config."};

    if ((not port->is_int64() and not port->is_uint64()) or (port->is_int64() and port->as_int64() < 0))
        return std::unexpected{"Invalid 'port' in server config: must be an integer between 0 and 65535"};

    auto const portValue = port->is_uint64() ? port->as_uint64() : static_cast<std::uint64_t>(port->as_int64());
    if (portValue > UINT16_MAX)
        return std::unexpected{"Invalid 'port' in server config: must be an integer between 0 and 65535"};

    return boost::asio::ip::tcp::endpoint{address, static_cast<unsigned short>(portValue)};
}

std::expected<std::unique_ptr<boost::asio::ip::tcp::acceptor>, std::string>
makeAcceptor(boost::asio::io_context& context, boost::asio::ip::tcp::endpoint const& endpoint)
{
    auto acceptor = std::make_unique<boost::asio::ip::tcp::acceptor>(boost::asio::make_strand(context));
    try {
        acceptor->open(endpoint.protocol());
        acceptor->set_option(boost::asio::socket_base::reuse_address(true));
        acceptor->bind(endpoint);
        acceptor->listen(boost::asio::socket_base::max_listen_connections);
    } catch (boost::system::system_error const& error) {
        return std::unexpected{fmt::format("Error creating TCP acceptor: {}", error.what())};
    }
    return acceptor;
}

std::expected<std::string, boost::system::system_error>
extractIp(boost::asio::ip::tcp::socket const& socket)
{
    std::string ip;
    try {
        ip = socket.remote_endpoint().address().to_string();
    } catch (boost::system::system_error const& error) {
        return std::unexpected{error};
    }
    return ip;
}

}  // namespace

Server::Server(
    boost::asio::io_context& ctx,
    boost::asio::ip::tcp::endpoint endpoint,
    impl::ConnectionHandler connectionHandler,
    std::chrono::steady_clock::duration gracefulPeriod
)
    : ctx_{ctx}
    , connectionHandler_{std::make_unique<impl::ConnectionHandler>(std::move(connectionHandler))}
    , endpoint_{std::move(endpoint)}
    , gracefulPeriod_{gracefulPeriod}
{
}

Server::~Server()
{
    if (acceptor_ != nullptr)
        stop();
}

std::optional<std::string>
Server::run()
{
    auto acceptor = makeAcceptor(ctx_.get(), endpoint_);
    if (not acceptor.has_value())
        return std::move(acceptor).error();

    acceptor_ = std::move(acceptor).value();
    LOG(log_.info()) << "Listening on " << acceptor_->local_endpoint();

    std::promise<void> acceptLoopDone;
    acceptLoopFinished_ = acceptLoopDone.get_future();

    boost::asio::spawn(
        acceptor_->get_executor(),
        [this, acceptLoopDone = std::move(acceptLoopDone)](boost::asio::yield_context yield) mutable {
            while (acceptor_->is_open()) {
                boost::beast::error_code errorCode;
                boost::asio::ip::tcp::socket socket{boost::asio::make_strand(ctx_.get())};

                acceptor_->async_accept(socket, yield[errorCode]);
                if (errorCode == boost::asio::error::operation_aborted or not acceptor_->is_open())
                    break;

                if (errorCode) {
                    LOG(log_.debug()) << "Error accepting a connection: " << errorCode.message();
                    continue;
                }

                auto executor = socket.get_executor();
                boost::asio::spawn(
                    executor,
                    [this, socket = std::move(socket)](boost::asio::yield_context yield) mutable {
                        handleConnection(std::move(socket), yield);
                    },
                    boost::asio::detached
                );
            }
            LOG(log_.debug()) << "Accept loop finished";
            acceptLoopDone.set_value();
        },
        boost::asio::detached
    );
    return std::nullopt;
}

void
Server::stop()
{
    if (stopped_ or acceptor_ == nullptr)
        return;
    stopped_ = true;

    LOG(log_.info()) << "Stopping the server";
    boost::asio::post(acceptor_->get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_->close(ec);
    });

    if (acceptLoopFinished_.has_value() and
        acceptLoopFinished_->wait_for(ACCEPT_LOOP_STOP_TIMEOUT) != std::future_status::ready)
        LOG(log_.warn()) << "Accept loop did not finish in time";

    connectionHandler_->stop(gracefulPeriod_);
    LOG(log_.info()) << "Server stopped";
}

std::optional<boost::asio::ip::tcp::endpoint>
Server::localEndpoint() const
{
    if (acceptor_ == nullptr)
        return std::nullopt;

    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    if (ec)
        return std::nullopt;
    return endpoint;
}

void
Server::handleConnection(boost::asio::ip::tcp::socket socket, boost::asio::yield_context yield)
{
    auto ip = extractIp(socket);
    if (not ip.has_value()) {
        LOG(log_.info()) << "Cannot get remote endpoint: " << ip.error().what();
        return;
    }

    auto connection = std::make_shared<impl::HttpConnection>(std::move(socket), std::move(ip).value());
    connectionHandler_->processConnection(std::move(connection), yield);
}

std::expected<Server, std::string>
make_Server(util::Config const& config, boost::asio::io_context& context, impl::ConnectionHandler connectionHandler)
{
    if (not config.contains("server"))
        return std::unexpected{"Missing 'server' section in config."};

    std::expected<boost::asio::ip::tcp::endpoint, std::string> endpoint;
    try {
        endpoint = makeEndpoint(config.section("server"));
    } catch (std::exception const& e) {
        return std::unexpected{fmt::format("Invalid server config: {}", e.what())};
    }
    if (not endpoint.has_value())
        return std::unexpected{std::move(endpoint).error()};

    auto const gracefulPeriod = config.valueOr("graceful_period", 10.0);
    if (gracefulPeriod < 0.0)
        return std::unexpected{"'graceful_period' must be non-negative"};

    return Server{
        context,
        std::move(endpoint).value(),
        std::move(connectionHandler),
        std::chrono::milliseconds{static_cast<std::int64_t>(std::round(gracefulPeriod * 1000.0))}
    };
}

}  // namespace web
