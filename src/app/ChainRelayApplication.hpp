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

#include "app/FatalError.hpp"
#include "routing/UpstreamRegistry.hpp"
#include "util/config/Config.hpp"
#include "web/Server.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace app {

/**
 * @brief The main application class.
 *
 * Loads the configuration, initializes logging, bootstraps all upstreams and serves the relay until stopped.
 */
class ChainRelayApplication {
    boost::asio::io_context ctx_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;
    std::vector<std::thread> threads_;

    std::filesystem::path configPath_;
    std::optional<util::Config> config_;
    std::shared_ptr<routing::UpstreamRegistry> registry_ = std::make_shared<routing::UpstreamRegistry>();
    std::optional<web::Server> server_;

    bool started_ = false;
    std::atomic_bool stopped_{false};
    std::atomic_bool stopRequested_{false};

public:
    static constexpr std::size_t DEFAULT_IO_THREADS = 2;

    /**
     * @brief Construct a new ChainRelayApplication object
     *
     * @param configPath Path to the JSON configuration file
     */
    explicit ChainRelayApplication(std::filesystem::path configPath);

    ChainRelayApplication(ChainRelayApplication const&) = delete;
    ChainRelayApplication&
    operator=(ChainRelayApplication const&) = delete;

    ~ChainRelayApplication();

    /**
     * @brief Start the relay.
     *
     * Returns once the server is accepting connections or as soon as a step fails. Nothing is listening after a
     * failure.
     *
     * @return std::nullopt on success; the reason of the failure otherwise
     */
    std::optional<FatalError>
    start();

    /**
     * @brief Stop the relay. Safe to call at any time and more than once.
     *
     * Stops accepting connections, lets in-flight requests finish for up to `graceful_period` seconds and stops the
     * I/O threads.
     */
    void
    stop();

    /**
     * @brief Start the relay and serve until SIGINT or SIGTERM.
     *
     * @return The process exit code
     */
    int
    run();

    /**
     * @return The endpoint the server is listening on, if it is running
     */
    std::optional<boost::asio::ip::tcp::endpoint>
    localEndpoint() const;

    /**
     * @return The registry holding the published routing index
     */
    std::shared_ptr<routing::UpstreamRegistry const>
    registry() const;
};

}  // namespace app
