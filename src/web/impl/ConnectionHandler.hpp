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

#include "util/Mutex.hpp"
#include "util/log/Logger.hpp"
#include "web/Connection.hpp"
#include "web/MessageHandler.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/spawn.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <unordered_map>

namespace web::impl {

/**
 * @brief Runs the request-response loop of every connection and keeps track of them for shutdown.
 */
class ConnectionHandler {
    util::Logger log_{"WebServer"};

    MessageHandler handler_;

    using ConnectionsMap = std::unordered_map<std::size_t, ConnectionPtr>;
    std::unique_ptr<util::Mutex<ConnectionsMap>> connections_{std::make_unique<util::Mutex<ConnectionsMap>>()};
    std::unique_ptr<std::atomic_bool> stopping_{std::make_unique<std::atomic_bool>(false)};

public:
    /**
     * @brief Construct a new Connection Handler
     *
     * @param handler Produces the response for every request
     */
    explicit ConnectionHandler(MessageHandler handler);

    /**
     * @brief Serve requests on the connection until the client disconnects or the handler is stopped.
     *
     * @param connection The connection to serve.
     * @param yield The yield context of the connection's coroutine.
     */
    void
    processConnection(ConnectionPtr connection, boost::asio::yield_context yield);

    /**
     * @brief Stop serving requests.
     *
     * Idle connections are closed right away. Connections processing a request may finish it for up to the
     * graceful period; whatever is left afterwards is closed forcibly.
     * @note Blocks the calling thread, which must not be one of the threads running the connections.
     *
     * @param gracefulPeriod How long in-flight requests are waited for.
     */
    void
    stop(std::chrono::steady_clock::duration gracefulPeriod);

    /**
     * @return The number of connections currently open.
     */
    std::size_t
    connectionsCount() const;

private:
    void
    insertConnection(ConnectionPtr connection);

    void
    removeConnection(Connection const& connection);

    /**
     * @brief Handle an error.
     *
     * @param error The error to handle.
     * @param connection The connection that caused the error.
     * @return True if the connection should be gracefully closed, false otherwise.
     */
    bool
    handleError(Error const& error, Connection const& connection) const;

    bool
    requestResponseLoop(Connection& connection, boost::asio::yield_context yield);

    Response
    handleRequest(Connection const& connection, Request const& request, boost::asio::yield_context yield) const;

    bool
    waitForConnections(std::chrono::steady_clock::duration timeout) const;

    void
    closeConnections(bool onlyIdle);
};

}  // namespace web::impl
