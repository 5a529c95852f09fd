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

#include "util/config/Config.hpp"

#include "util/config/detail/Helpers.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/parse_options.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <exception>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <ios>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace util {

namespace {

Config::ArrayType
toConfigArray(boost::json::array const& arr)
{
    Config::ArrayType out;
    out.reserve(arr.size());
    std::transform(std::cbegin(arr), std::cend(arr), std::back_inserter(out), [](auto const& element) {
        return Config{element};
    });
    return out;
}

}  // namespace

// Note: `store_(store)` MUST use `()` instead of `{}` otherwise gcc
// picks `initializer_list` constructor and anything passed becomes an
// array :-D
Config::Config(boost::json::value store) : store_(std::move(store))
{
}

Config::operator bool() const noexcept
{
    return not store_.is_null();
}

bool
Config::contains(KeyType key) const
{
    return lookup(key).has_value();
}

std::optional<boost::json::value>
Config::lookup(KeyType key) const
{
    if (store_.is_null())
        return std::nullopt;

    std::reference_wrapper<boost::json::value const> cur = std::cref(store_);
    auto tokenized = detail::Tokenizer<KeyType, SEPARATOR>{key};
    std::string subkey{};
    auto found = true;

    // the whole key is tokenized first so that a malformed key always throws
    while (auto section = tokenized.next()) {
        subkey += *section;
        if (found) {
            if (not cur.get().is_object())
                throw detail::StoreException("Not an object at '" + subkey + "'");

            auto const& object = cur.get().as_object();
            if (auto const it = object.find(*section); it != object.end()) {
                cur = std::cref(it->value());
            } else {
                found = false;
            }
        }
        subkey += SEPARATOR;
    }

    if (not found)
        return std::nullopt;
    return cur.get();
}

std::optional<Config::ArrayType>
Config::maybeArray(KeyType key) const
{
    try {
        auto const maybeArr = lookup(key);
        if (maybeArr && maybeArr->is_array())
            return toConfigArray(maybeArr->as_array());
    } catch (detail::StoreException const&) {  // NOLINT(bugprone-empty-catch)
        // a broken path means there is no array; key format errors still propagate
    }

    return std::nullopt;
}

Config::ArrayType
Config::array(KeyType key) const
{
    if (auto maybeArr = maybeArray(key); maybeArr)
        return std::move(maybeArr).value();
    throw std::logic_error("No array found at '" + key + "'");
}

Config::ArrayType
Config::arrayOr(KeyType key, ArrayType fallback) const
{
    if (auto maybeArr = maybeArray(key); maybeArr)
        return std::move(maybeArr).value();
    return fallback;
}

Config
Config::section(KeyType key) const
{
    auto maybeElement = lookup(key);
    if (maybeElement && maybeElement->is_object())
        return Config{std::move(*maybeElement)};
    throw std::logic_error("No section found at '" + key + "'");
}

Config
Config::sectionOr(KeyType key, boost::json::object fallback) const
{
    auto maybeElement = lookup(key);
    if (maybeElement && maybeElement->is_object())
        return Config{std::move(*maybeElement)};
    return Config{std::move(fallback)};
}

Config::ArrayType
Config::array() const
{
    if (not store_.is_array())
        throw std::logic_error("_self_ is not an array");
    return toConfigArray(store_.as_array());
}

boost::json::value const&
Config::raw() const
{
    return store_;
}

std::expected<Config, std::string>
ConfigReader::open(std::filesystem::path const& path)
{
    std::error_code errorCode;
    if (not std::filesystem::exists(path, errorCode))
        return std::unexpected{fmt::format("Configuration file '{}' does not exist", path.string())};

    std::ifstream const in(path, std::ios::in | std::ios::binary);
    if (not in)
        return std::unexpected{fmt::format("Could not open configuration file '{}'", path.string())};

    std::stringstream contents;
    contents << in.rdbuf();

    try {
        auto opts = boost::json::parse_options{};
        opts.allow_comments = true;
        auto value = boost::json::parse(contents.str(), {}, opts);
        if (not value.is_object())
            return std::unexpected{fmt::format("Configuration file '{}' must contain a JSON object", path.string())};
        return Config{std::move(value)};
    } catch (std::exception const& e) {
        return std::unexpected{fmt::format("Could not parse configuration file '{}': {}", path.string(), e.what())};
    }
}

}  // namespace util
