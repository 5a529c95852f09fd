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

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/error.hpp>

#include <expected>
#include <optional>
#include <string>

namespace util::requests::impl {

/**
 * @brief Create an SSL context for outgoing connections that verifies peers against the system root certificates.
 *
 * @return The context or an error if no root certificate bundle could be read
 */
std::expected<boost::asio::ssl::context, RequestError>
makeClientSslContext();

/**
 * @brief Describe an OpenSSL error code.
 *
 * @param error The error code to describe
 * @return A human readable description or std::nullopt if the error is not from the SSL category
 */
std::optional<std::string>
sslErrorToString(boost::beast::error_code const& error);

}  // namespace util::requests::impl
