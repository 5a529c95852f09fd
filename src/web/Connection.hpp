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

#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/spawn.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace web {

/**
 * @brief Error of a connection level operation.
 */
using Error = boost::system::error_code;

/**
 * @brief A class representing a connection to a client.
 */
class Connection {
    std::size_t id_;
    std::atomic_bool busy_{false};

protected:
    std::string ip_;  // client ip

public:
    /**
     * @brief The default timeout for send, receive, and close operations.
     */
    static constexpr std::chrono::steady_clock::duration DEFAULT_TIMEOUT = std::chrono::seconds{30};

    /**
     * @brief Construct a new Connection object
     *
     * @param ip The client ip.
     */
    explicit Connection(std::string ip);

    virtual ~Connection() = default;

    /**
     * @brief Send a response to the client.
     *
     * @param response The response to send.
     * @param yield The yield context.
     * @param timeout The timeout for the operation.
     * @return An error if the operation failed or nullopt if it succeeded.
     */
    virtual std::optional<Error>
    send(
        Response response,
        boost::asio::yield_context yield,
        std::chrono::steady_clock::duration timeout = DEFAULT_TIMEOUT
    ) = 0;

    /**
     * @brief Receive a request from the client.
     *
     * @param yield The yield context.
     * @param timeout The timeout for the operation.
     * @return The request if it was received or an error if the operation failed.
     */
    virtual std::expected<Request, Error>
    receive(boost::asio::yield_context yield, std::chrono::steady_clock::duration timeout = DEFAULT_TIMEOUT) = 0;

    /**
     * @brief Gracefully close the connection. Must be called from the connection's own coroutine.
     *
     * @param yield The yield context.
     */
    virtual void
    close(boost::asio::yield_context yield) = 0;

    /**
     * @brief Abort every pending operation and close the socket.
     * @note Safe to call from any thread; the work is dispatched to the connection's executor.
     */
    virtual void
    forceClose() = 0;

    /**
     * @brief Whether a request is currently being processed.
     */
    bool
    isBusy() const;

    void
    setBusy(bool busy);

    std::size_t
    id() const;

    /**
     * @brief Get the ip of the client.
     *
     * @return The ip of the client.
     */
    std::string const&
    ip() const;
};

/**
 * @brief A pointer to a connection.
 */
using ConnectionPtr = std::shared_ptr<Connection>;

}  // namespace web
