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

#include "util/log/Logger.hpp"
#include "web/impl/ConnectionHandler.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace util {
class Config;
}  // namespace util

namespace web {

/**
 * @brief Web server class.
 *
 * Accepts plain HTTP connections and hands each of them to the @ref impl::ConnectionHandler on its own strand.
 */
class Server {
    util::Logger log_{"WebServer"};
    std::reference_wrapper<boost::asio::io_context> ctx_;

    std::unique_ptr<impl::ConnectionHandler> connectionHandler_;

    boost::asio::ip::tcp::endpoint endpoint_;
    std::chrono::steady_clock::duration gracefulPeriod_;

    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::optional<std::future<void>> acceptLoopFinished_;
    bool stopped_{false};

public:
    static constexpr std::chrono::steady_clock::duration DEFAULT_GRACEFUL_PERIOD = std::chrono::seconds{10};

    /**
     * @brief Construct a new Server object.
     *
     * @param ctx The boost::asio::io_context to use.
     * @param endpoint The endpoint to listen on.
     * @param connectionHandler The connection handler.
     * @param gracefulPeriod How long in-flight requests may run once the server is stopping.
     */
    Server(
        boost::asio::io_context& ctx,
        boost::asio::ip::tcp::endpoint endpoint,
        impl::ConnectionHandler connectionHandler,
        std::chrono::steady_clock::duration gracefulPeriod = DEFAULT_GRACEFUL_PERIOD
    );

    /**
     * @brief Copy constructor is deleted. The Server couldn't be copied.
     */
    Server(Server const&) = delete;

    /**
     * @brief Move constructor is defaulted.
     * @note A running server must not be moved.
     */
    Server(Server&&) = default;

    ~Server();

    /**
     * @brief Bind to the endpoint and start accepting connections.
     *
     * @return std::nullopt if the server started successfully, otherwise an error message.
     */
    std::optional<std::string>
    run();

    /**
     * @brief Stop the server.
     * @note Stops accepting connections and shuts existing ones down gracefully. Blocks until that is done or the
     * graceful period is over. Calling it more than once has no effect.
     */
    void
    stop();

    /**
     * @return The endpoint the server listens on; useful when it was configured with port 0.
     */
    std::optional<boost::asio::ip::tcp::endpoint>
    localEndpoint() const;

private:
    void
    handleConnection(boost::asio::ip::tcp::socket socket, boost::asio::yield_context yield);
};

/**
 * @brief Create a new Server.
 *
 * Reads `server.ip`, `server.port` and `graceful_period` from the config.
 *
 * @param config The configuration.
 * @param context The boost::asio::io_context to use.
 * @param connectionHandler The connection handler.
 *
 * @return The Server or an error message.
 */
std::expected<Server, std::string>
make_Server(util::Config const& config, boost::asio::io_context& context, impl::ConnectionHandler connectionHandler);

}  // namespace web
