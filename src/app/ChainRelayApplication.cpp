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

#include "app/ChainRelayApplication.hpp"

#include "app/ExitCode.hpp"
#include "app/FatalError.hpp"
#include "routing/Bootstrapper.hpp"
#include "routing/RequestRouter.hpp"
#include "routing/RoutingIndex.hpp"
#include "routing/UpstreamRegistry.hpp"
#include "upstream/ChainIdResolver.hpp"
#include "upstream/UpstreamDescriptor.hpp"
#include "util/SignalsHandler.hpp"
#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"
#include "web/RpcHandler.hpp"
#include "web/Server.hpp"
#include "web/impl/ConnectionHandler.hpp"

#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/strand.hpp>
#include <fmt/core.h>

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <expected>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace app {

namespace {

std::chrono::milliseconds
readSeconds(util::Config const& config, std::string const& key, double fallback)
{
    auto const seconds = config.valueOr(key, fallback);
    if (seconds <= 0.0)
        throw std::runtime_error(fmt::format("`{}` must be a positive number of seconds", key));
    return std::chrono::milliseconds{static_cast<std::int64_t>(std::round(seconds * 1000.0))};
}

FatalError
configError(std::string const& reason)
{
    return FatalError{FatalError::Kind::ConfigLoad, fmt::format("failed to load configuration: {}", reason)};
}

}  // namespace

ChainRelayApplication::ChainRelayApplication(std::filesystem::path configPath) : configPath_(std::move(configPath))
{
}

ChainRelayApplication::~ChainRelayApplication()
{
    stop();
}

std::optional<FatalError>
ChainRelayApplication::start()
{
    if (started_)
        return std::nullopt;
    started_ = true;

    auto config = util::ConfigReader::open(configPath_);
    if (not config.has_value()) {
        if (not std::filesystem::exists(configPath_))
            return FatalError{FatalError::Kind::ConfigLoad, std::move(config).error()};
        return configError(config.error());
    }
    config_ = std::move(config).value();

    try {
        util::LogService::init(*config_);
    } catch (std::exception const& e) {
        return configError(e.what());
    }

    auto projects = upstream::makeProjects(*config_);
    if (not projects.has_value())
        return configError(projects.error());

    std::size_t ioThreads = DEFAULT_IO_THREADS;
    std::chrono::milliseconds identityTimeout{};
    std::chrono::milliseconds requestTimeout{};
    std::uint64_t maxResponseSize = routing::RequestRouter::DEFAULT_MAX_RESPONSE_SIZE;
    try {
        ioThreads = config_->valueOr<std::size_t>("io_threads", DEFAULT_IO_THREADS);
        if (ioThreads == 0)
            return configError("`io_threads` must be at least 1");

        identityTimeout = readSeconds(config_->sectionOr("bootstrap", {}), "identity_timeout", 5.0);
        auto const forwarding = config_->sectionOr("forwarding", {});
        requestTimeout = readSeconds(forwarding, "request_timeout", 10.0);

        auto const responseSize =
            forwarding.valueOr<std::int64_t>("max_response_size", routing::RequestRouter::DEFAULT_MAX_RESPONSE_SIZE);
        if (responseSize <= 0)
            return configError("`max_response_size` must be a positive number of bytes");
        maxResponseSize = static_cast<std::uint64_t>(responseSize);
    } catch (std::exception const& e) {
        return configError(e.what());
    }

    LOG(util::LogService::info()) << "Starting chainrelay with " << ioThreads << " io threads and "
                                  << projects->size() << " projects";

    workGuard_.emplace(boost::asio::make_work_guard(ctx_));
    threads_.reserve(ioThreads);
    for (std::size_t i = 0; i < ioThreads; ++i)
        threads_.emplace_back([this]() { ctx_.run(); });

    routing::Bootstrapper const bootstrapper{
        [resolver = upstream::ChainIdResolver{identityTimeout}](auto const& descriptor, auto yield) {
            return resolver.resolve(descriptor, yield);
        }
    };

    std::promise<std::expected<routing::RoutingIndex, routing::BootstrapFailure>> bootstrapPromise;
    auto bootstrapResult = bootstrapPromise.get_future();
    boost::asio::spawn(
        boost::asio::make_strand(ctx_),
        [&bootstrapper, &bootstrapPromise, &projects](boost::asio::yield_context yield) {
            try {
                bootstrapPromise.set_value(bootstrapper.bootstrap(*projects, yield));
            } catch (std::exception const&) {
                bootstrapPromise.set_exception(std::current_exception());
            }
        },
        boost::asio::detached
    );

    auto index = bootstrapResult.get();
    if (not index.has_value())
        return FatalError{FatalError::Kind::Bootstrap, index.error().message()};

    registry_->publish(std::move(index).value());
    LOG(util::LogService::info()) << "Routing index published with " << registry_->snapshot()->projects().size()
                                  << " projects";

    auto router = std::make_shared<routing::RequestRouter const>(registry_, requestTimeout, maxResponseSize);
    web::impl::ConnectionHandler connectionHandler{web::RpcHandler<routing::RequestRouter>{std::move(router)}};

    auto server = web::make_Server(*config_, ctx_, std::move(connectionHandler));
    if (not server.has_value())
        return FatalError{FatalError::Kind::HttpServer, std::move(server).error()};

    server_.emplace(std::move(server).value());
    if (auto const error = server_->run(); error.has_value()) {
        server_.reset();
        return FatalError{FatalError::Kind::HttpServer, *error};
    }

    return std::nullopt;
}

void
ChainRelayApplication::stop()
{
    if (stopped_.exchange(true))
        return;

    if (server_.has_value())
        server_->stop();

    workGuard_.reset();
    ctx_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable())
            thread.join();
    }

    if (started_)
        LOG(util::LogService::info()) << "chainrelay stopped";
}

int
ChainRelayApplication::run()
{
    if (auto const error = start(); error.has_value()) {
        LOG(util::LogService::fatal()) << "Failed to start: " << *error;
        stop();
        return exitCodeFor(error->kind);
    }

    util::SignalsHandler signalsHandler{*config_};
    signalsHandler.subscribeToStop([this]() {
        stopRequested_ = true;
        stopRequested_.notify_one();
    });

    stopRequested_.wait(false);
    stop();
    return EXIT_SUCCESS;
}

std::optional<boost::asio::ip::tcp::endpoint>
ChainRelayApplication::localEndpoint() const
{
    if (not server_.has_value())
        return std::nullopt;
    return server_->localEndpoint();
}

std::shared_ptr<routing::UpstreamRegistry const>
ChainRelayApplication::registry() const
{
    return registry_;
}

}  // namespace app
