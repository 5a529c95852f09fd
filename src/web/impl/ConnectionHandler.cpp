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

#include "web/impl/ConnectionHandler.hpp"

#include "util/Assert.hpp"
#include "util/log/Logger.hpp"
#include "web/Connection.hpp"
#include "web/MessageHandler.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <chrono>
#include <cstddef>
#include <exception>
#include <string>
#include <thread>
#include <utility>

namespace web::impl {

namespace {

constexpr auto FORCED_CLOSE_TIMEOUT = std::chrono::seconds{1};
constexpr auto POLL_INTERVAL = std::chrono::milliseconds{10};
constexpr auto JSON_RPC_INTERNAL_ERROR = -32603;

boost::json::object
makeInternalErrorBody()
{
    boost::json::object error;
    error["code"] = JSON_RPC_INTERNAL_ERROR;
    error["message"] = "Internal error";

    boost::json::object body;
    body["jsonrpc"] = "2.0";
    body["id"] = nullptr;
    body["error"] = std::move(error);
    return body;
}

}  // namespace

ConnectionHandler::ConnectionHandler(MessageHandler handler) : handler_{std::move(handler)}
{
}

void
ConnectionHandler::processConnection(ConnectionPtr connectionPtr, boost::asio::yield_context yield)
{
    auto& connectionRef = *connectionPtr;
    insertConnection(std::move(connectionPtr));

    if (requestResponseLoop(connectionRef, yield))
        connectionRef.close(yield);

    removeConnection(connectionRef);
}

void
ConnectionHandler::stop(std::chrono::steady_clock::duration gracefulPeriod)
{
    if (stopping_->exchange(true))
        return;

    LOG(log_.info()) << "Stopping; " << connectionsCount() << " connections open";
    closeConnections(true);

    if (waitForConnections(gracefulPeriod))
        return;

    LOG(log_.warn()) << "Graceful period is over; closing " << connectionsCount() << " remaining connections";
    closeConnections(false);

    if (not waitForConnections(FORCED_CLOSE_TIMEOUT))
        LOG(log_.error()) << connectionsCount() << " connections did not close in time";
}

std::size_t
ConnectionHandler::connectionsCount() const
{
    return connections_->lock()->size();
}

void
ConnectionHandler::insertConnection(ConnectionPtr connection)
{
    auto const connectionId = connection->id();
    auto connectionsMap = connections_->lock();
    auto [it, inserted] = connectionsMap->emplace(connectionId, std::move(connection));
    ASSERT(inserted, "Connection with id {} already exists", it->second->id());
}

void
ConnectionHandler::removeConnection(Connection const& connection)
{
    auto connectionsMap = connections_->lock();
    auto const erased = connectionsMap->erase(connection.id());
    ASSERT(erased == 1, "Connection with id {} doesn't exist", connection.id());
}

bool
ConnectionHandler::handleError(Error const& error, Connection const& connection) const
{
    // the client closed the connection after a complete message
    if (error == boost::beast::http::error::end_of_stream)
        return false;

    if (error == boost::asio::error::operation_aborted) {
        LOG(log_.debug()) << "[conn " << connection.id() << "] closed by server";
        return false;
    }

    if (error == boost::beast::error::timeout) {
        LOG(log_.debug()) << "[conn " << connection.id() << "] timed out";
        return false;
    }

    LOG(log_.info()) << "[conn " << connection.id() << "] " << error.message() << ": " << error.value();
    return true;
}

bool
ConnectionHandler::requestResponseLoop(Connection& connection, boost::asio::yield_context yield)
{
    // HTTP keep-alive connections are reused until the client disconnects, a response asks to close the connection
    // or the server is stopping.
    while (not *stopping_) {
        auto expectedRequest = connection.receive(yield);
        if (not expectedRequest)
            return handleError(expectedRequest.error(), connection);

        connection.setBusy(true);
        LOG(log_.debug()) << "[conn " << connection.id() << "] received request from ip = " << connection.ip();

        auto const keepAlive = expectedRequest->asHttpRequest().keep_alive();
        auto response = handleRequest(connection, expectedRequest.value(), yield);

        auto const maybeError = connection.send(std::move(response), yield);
        connection.setBusy(false);

        if (maybeError.has_value())
            return handleError(maybeError.value(), connection);

        if (not keepAlive)
            return true;
    }
    return true;
}

Response
ConnectionHandler::handleRequest(Connection const& connection, Request const& request, boost::asio::yield_context yield)
    const
{
    try {
        return handler_(request, yield);
    } catch (std::exception const& e) {
        LOG(log_.error()) << "[conn " << connection.id() << "] caught exception: " << e.what();
    }
    return Response{boost::beast::http::status::internal_server_error, makeInternalErrorBody(), request};
}

bool
ConnectionHandler::waitForConnections(std::chrono::steady_clock::duration timeout) const
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (connectionsCount() > 0) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
    return true;
}

void
ConnectionHandler::closeConnections(bool onlyIdle)
{
    auto connectionsMap = connections_->lock();
    for (auto const& [id, connection] : *connectionsMap) {
        if (not onlyIdle or not connection->isBusy())
            connection->forceClose();
    }
}

}  // namespace web::impl
