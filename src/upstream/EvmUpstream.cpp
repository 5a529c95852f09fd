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

#include "upstream/EvmUpstream.hpp"

#include "upstream/Endpoint.hpp"
#include "upstream/Errors.hpp"
#include "upstream/UpstreamDescriptor.hpp"
#include "util/log/Logger.hpp"
#include "util/requests/RequestBuilder.hpp"
#include "util/requests/Types.hpp"

#include <boost/asio/spawn.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace upstream {

namespace {

constexpr std::size_t MAX_HEX_DIGITS = 16;

}  // namespace

std::optional<ChainId>
parseHexQuantity(std::string_view quantity)
{
    if (not quantity.starts_with("0x") and not quantity.starts_with("0X"))
        return std::nullopt;

    auto const digits = quantity.substr(2);
    if (digits.empty() or digits.size() > MAX_HEX_DIGITS)
        return std::nullopt;

    ChainId value = 0;
    auto const [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
    if (ec != std::errc{} or ptr != digits.data() + digits.size())
        return std::nullopt;

    return value;
}

EvmUpstream::EvmUpstream(Endpoint endpoint) : endpoint_(std::move(endpoint))
{
}

std::expected<std::string, ForwardError>
EvmUpstream::send(
    std::string body,
    std::chrono::milliseconds timeout,
    std::uint64_t const maxResponseSize,
    boost::asio::yield_context yield
) const
{
    auto builder = util::requests::RequestBuilder{endpoint_.host, std::to_string(endpoint_.port)};
    builder.setTarget(endpoint_.target)
        .setTimeout(timeout)
        .setBodyLimit(maxResponseSize)
        .addHeader({boost::beast::http::field::host, endpoint_.hostHeader()})
        .addHeader({boost::beast::http::field::content_type, "application/json"})
        .addData(std::move(body));

    auto response = endpoint_.isSecure() ? builder.postSsl(yield) : builder.postPlain(yield);
    if (not response.has_value()) {
        LOG(log_.debug()) << "Request to " << endpoint_.toString() << " failed: " << response.error().message();
        return std::unexpected{ForwardError{response.error().message(), response.error().isTimeout()}};
    }

    return std::move(response).value();
}

std::expected<ChainId, ResolutionFailure>
EvmUpstream::resolveIdentity(std::chrono::milliseconds timeout, boost::asio::yield_context yield) const
{
    auto const fail = [this](std::string cause) {
        return std::unexpected{ResolutionFailure{endpoint_.toString(), IDENTITY_METHOD, std::move(cause)}};
    };

    boost::json::object request;
    request["jsonrpc"] = "2.0";
    request["id"] = 1;
    request["method"] = IDENTITY_METHOD;
    request["params"] = boost::json::array{};

    auto response =
        send(boost::json::serialize(request), timeout, util::requests::RequestBuilder::DEFAULT_BODY_LIMIT, yield);
    if (not response.has_value())
        return fail(response.error().timedOut ? "timed out: " + response.error().cause : response.error().cause);

    boost::json::value parsed;
    try {
        parsed = boost::json::parse(*response);
    } catch (std::exception const& e) {
        return fail(fmt::format("malformed JSON response: {}", e.what()));
    }

    if (not parsed.is_object())
        return fail("response is not a JSON object");

    auto const& object = parsed.as_object();
    if (auto const it = object.find("error"); it != object.end() and not it->value().is_null()) {
        auto const& error = it->value();
        return fail(fmt::format(
            "upstream returned an error: {}",
            error.is_string() ? std::string{error.as_string()} : boost::json::serialize(error)
        ));
    }

    auto const it = object.find("result");
    if (it == object.end() or not it->value().is_string())
        return fail("response has no string `result`");

    auto const chainId = parseHexQuantity(it->value().as_string());
    if (not chainId.has_value())
        return fail(fmt::format("`result` is not a hex quantity: {}", boost::json::serialize(it->value())));

    LOG(log_.info()) << "Endpoint " << endpoint_.toString() << " serves chain " << *chainId;
    return *chainId;
}

}  // namespace upstream
