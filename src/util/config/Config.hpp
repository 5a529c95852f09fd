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

#include "util/config/detail/Helpers.hpp"

#include <boost/json/conversion.hpp>
#include <boost/json/kind.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <cstdint>
#include <exception>
#include <expected>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace util {

/**
 * @brief Convenience wrapper to query a JSON configuration file.
 *
 * Any custom data type can be supported by implementing the `tag_invoke` for `boost::json::value_to`.
 * Keys are dotted paths: `server.port` reads key `port` of the object stored at key `server`.
 */
class Config final {
    boost::json::value store_;
    static constexpr char SEPARATOR = '.';

public:
    using KeyType = std::string;
    using ArrayType = std::vector<Config>;

    /**
     * @brief Construct a new Config object.
     * @param store boost::json::value that backs this instance
     */
    explicit Config(boost::json::value store = {});

    /**
     * @brief Checks whether underlying store is not null.
     *
     * @return true If the store is not null
     * @return false If the store is null
     */
    operator bool() const noexcept;

    /**
     * @brief Checks whether something exists under given key.
     *
     * @param key The key to check
     * @return true If something exists under key
     * @return false If nothing exists under key
     * @throws std::logic_error If the key is of invalid format
     */
    [[nodiscard]] bool
    contains(KeyType key) const;

    /**
     * @brief Interface for fetching values by key that returns std::optional.
     *
     * Will attempt to fetch the value under the desired key. If the value exists and can be represented by the desired
     * type Result then it will be returned wrapped in an optional. If the value exists but the conversion to Result is
     * not possible, a runtime_error will be thrown. If the value does not exist under the specified key, std::nullopt
     * is returned.
     *
     * @tparam Result The desired return type
     * @param key The key to check
     * @return Actual value or std::nullopt if nothing is found
     * @throws std::logic_error If the key is of invalid format
     * @throws std::runtime_error If conversion fails
     */
    template <typename Result>
    [[nodiscard]] std::optional<Result>
    maybeValue(KeyType key) const
    {
        auto const maybeElement = lookup(key);
        if (maybeElement)
            return checkedAs<Result>(key, *maybeElement);
        return std::nullopt;
    }

    /**
     * @brief Interface for fetching values by key.
     *
     * @tparam Result The desired return type
     * @param key The key to check
     * @return Actual value
     * @throws std::logic_error If the key is of invalid format
     * @throws std::runtime_error If conversion fails
     * @throws std::bad_optional_access If nothing is stored under the key
     */
    template <typename Result>
    [[nodiscard]] Result
    value(KeyType key) const
    {
        return maybeValue<Result>(key).value();
    }

    /**
     * @brief Interface for fetching values by key with fallback.
     *
     * @tparam Result The desired return type
     * @param key The key to check
     * @param fallback The fallback value
     * @return Actual value or the fallback if nothing is stored under the key
     * @throws std::logic_error If the key is of invalid format
     * @throws std::runtime_error If conversion fails
     */
    template <typename Result>
    [[nodiscard]] Result
    valueOr(KeyType key, Result fallback) const
    {
        try {
            return maybeValue<Result>(key).value_or(fallback);
        } catch (detail::StoreException const&) {
            return fallback;
        }
    }

    /**
     * @brief Interface for fetching values by key with custom error handling.
     *
     * @tparam Result The desired return type
     * @param key The key to check
     * @param err The custom error message
     * @return Actual value
     * @throws std::runtime_error With the custom message if the value is missing or can not be converted
     */
    template <typename Result>
    [[nodiscard]] Result
    valueOrThrow(KeyType key, std::string_view err) const
    {
        try {
            return maybeValue<Result>(key).value();
        } catch (std::exception const&) {
            throw std::runtime_error(std::string{err});
        }
    }

    /**
     * @brief Interface for fetching an array by key that returns std::optional.
     *
     * @param key The key to check
     * @return Array of Config objects or std::nullopt if there is no array under the key
     * @throws std::logic_error If the key is of invalid format
     */
    [[nodiscard]] std::optional<ArrayType>
    maybeArray(KeyType key) const;

    /**
     * @brief Interface for fetching an array by key.
     *
     * @param key The key to check
     * @return Array of Config objects
     * @throws std::logic_error If there is no array under the key
     */
    [[nodiscard]] ArrayType
    array(KeyType key) const;

    /**
     * @brief Interface for fetching an array by key with fallback.
     *
     * @param key The key to check
     * @param fallback The fallback value
     * @return Array of Config objects or the fallback
     */
    [[nodiscard]] ArrayType
    arrayOr(KeyType key, ArrayType fallback) const;

    /**
     * @brief Interface for fetching a sub section by key.
     *
     * @param key The key to check
     * @return Section represented as a separate instance of Config
     * @throws std::logic_error If there is no object under the key
     */
    [[nodiscard]] Config
    section(KeyType key) const;

    /**
     * @brief Interface for fetching a sub section by key with a fallback object.
     *
     * @param key The key to check
     * @param fallback The fallback object
     * @return Section represented as a separate instance of Config
     */
    [[nodiscard]] Config
    sectionOr(KeyType key, boost::json::object fallback) const;

    /**
     * @brief Interface for reading the value directly referred to by the instance.
     *
     * @tparam Result The desired return type
     * @return The value or std::nullopt if this Config is null
     * @throws std::runtime_error If conversion fails
     */
    template <typename Result>
    [[nodiscard]] std::optional<Result>
    maybeValue() const
    {
        if (store_.is_null())
            return std::nullopt;
        return checkedAs<Result>("_self_", store_);
    }

    /**
     * @brief Interface for reading the array directly referred to by the instance.
     *
     * @return Array of Config objects
     * @throws std::logic_error If this Config is not an array
     */
    [[nodiscard]] ArrayType
    array() const;

    /**
     * @return The JSON value this instance wraps
     */
    [[nodiscard]] boost::json::value const&
    raw() const;

private:
    template <typename Return>
    [[nodiscard]] Return
    checkedAs(KeyType key, boost::json::value const& value) const
    {
        auto hasError = false;
        if constexpr (std::is_same_v<Return, bool>) {
            hasError = not value.is_bool();
        } else if constexpr (std::is_same_v<Return, std::string>) {
            hasError = not value.is_string();
        } else if constexpr (std::is_floating_point_v<Return>) {
            hasError = not value.is_number();
        } else if constexpr (std::is_integral_v<Return>) {
            hasError = not value.is_int64() and not value.is_uint64();
        }

        if (hasError) {
            throw std::runtime_error(
                "Type for key '" + key + "' is '" + std::string{to_string(value.kind())} + "' in JSON but requested '" +
                detail::typeName<Return>() + "'"
            );
        }

        return boost::json::value_to<Return>(value);
    }

    std::optional<boost::json::value>
    lookup(KeyType key) const;
};

/**
 * @brief Simple configuration file reader.
 *
 * Reads the JSON file under the given path and wraps it in a @ref Config. Comments are allowed in the file.
 */
class ConfigReader final {
public:
    /**
     * @brief Read and parse a configuration file.
     *
     * @param path The path to the file
     * @return The parsed configuration or a description of why it could not be read
     */
    static std::expected<Config, std::string>
    open(std::filesystem::path const& path);
};

}  // namespace util
