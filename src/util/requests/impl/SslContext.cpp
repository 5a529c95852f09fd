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

#include "util/requests/impl/SslContext.hpp"

#include "util/requests/Types.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/verify_mode.hpp>
#include <boost/beast/core/error.hpp>
#include <fmt/core.h>
#include <openssl/err.h>

#include <array>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <ios>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace util::requests::impl {

namespace asio = boost::asio;
namespace ssl = asio::ssl;

namespace {

// Well known locations of the CA bundle on common linux distributions
constexpr std::array CERT_FILE_PATHS{
    "/etc/ssl/certs/ca-certificates.crt",
    "/etc/pki/tls/certs/ca-bundle.crt",
    "/etc/ssl/ca-bundle.pem",
    "/etc/pki/tls/cacert.pem",
    "/etc/pki/ca-trust/extracted/pem/tls-ca-bundle.pem",
    "/etc/ssl/cert.pem",
};

std::expected<std::string, RequestError>
readRootCertificates()
{
    for (auto const* path : CERT_FILE_PATHS) {
        std::error_code ec;
        if (not std::filesystem::is_regular_file(path, ec))
            continue;

        std::ifstream const fileStream{path, std::ios::in};
        if (not fileStream.is_open())
            continue;

        std::stringstream buffer;
        buffer << fileStream.rdbuf();
        return std::move(buffer).str();
    }
    return std::unexpected{RequestError{"SSL setup failed: could not find root certificates"}};
}

}  // namespace

std::expected<boost::asio::ssl::context, RequestError>
makeClientSslContext()
{
    ssl::context context{ssl::context::tls_client};
    context.set_verify_mode(ssl::verify_peer);

    auto const rootCertificates = readRootCertificates();
    if (not rootCertificates.has_value())
        return std::unexpected{rootCertificates.error()};

    boost::system::error_code ec;
    context.add_certificate_authority(asio::buffer(rootCertificates->data(), rootCertificates->size()), ec);
    if (ec)
        return std::unexpected{RequestError{"SSL setup failed", ec}};

    return context;
}

std::optional<std::string>
sslErrorToString(boost::beast::error_code const& error)
{
    if (error.category() != asio::error::get_ssl_category())
        return std::nullopt;

    auto const code = static_cast<unsigned long>(error.value());
    std::string errorString = fmt::format("({},{}) ", ERR_GET_LIB(code), ERR_GET_REASON(code));

    static constexpr std::size_t BUFFER_SIZE = 128;
    std::array<char, BUFFER_SIZE> buf{};
    ::ERR_error_string_n(code, buf.data(), buf.size());
    errorString += buf.data();

    return errorString;
}

}  // namespace util::requests::impl
