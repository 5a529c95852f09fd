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

#include <cstdint>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>

namespace util::detail {

/**
 * @brief Thrown when a key path is malformed.
 */
struct KeyException : public std::logic_error {
    KeyException(std::string msg) : std::logic_error{msg}
    {
    }
};

/**
 * @brief Thrown when the stored JSON does not have the shape a key path expects.
 */
struct StoreException : public std::logic_error {
    StoreException(std::string msg) : std::logic_error{msg}
    {
    }
};

/**
 * @brief Splits a dotted key such as `server.port` into its sections. Used by @ref util::Config.
 *
 * @tparam KeyType The type of key to use
 * @tparam Separator The separator character
 */
template <typename KeyType, char Separator>
class Tokenizer final {
    KeyType key_;
    KeyType token_{};
    std::queue<KeyType> tokens_{};

public:
    explicit Tokenizer(KeyType key) : key_{key}
    {
        if (key.empty())
            throw KeyException("Empty key");

        for (auto const& c : key) {
            if (c == Separator) {
                saveToken();
            } else {
                token_ += c;
            }
        }

        saveToken();
    }

    [[nodiscard]] std::optional<KeyType>
    next()
    {
        if (tokens_.empty())
            return std::nullopt;
        auto token = std::move(tokens_.front());
        tokens_.pop();
        return token;
    }

private:
    void
    saveToken()
    {
        if (token_.empty())
            throw KeyException("Empty token in key '" + key_ + "'.");
        tokens_.push(std::move(token_));
        token_ = {};
    }
};

/**
 * @brief Human readable name of a type requested from the config, used in error messages.
 */
template <typename T>
char const*
typeName()
{
    if constexpr (std::is_same_v<T, uint64_t>) {
        return "uint64_t";
    } else if constexpr (std::is_same_v<T, int64_t>) {
        return "int64_t";
    } else if constexpr (std::is_same_v<T, uint32_t>) {
        return "uint32_t";
    } else if constexpr (std::is_same_v<T, int32_t>) {
        return "int32_t";
    } else if constexpr (std::is_same_v<T, uint16_t>) {
        return "uint16_t";
    } else if constexpr (std::is_same_v<T, bool>) {
        return "bool";
    } else if constexpr (std::is_same_v<T, std::string>) {
        return "std::string";
    } else if constexpr (std::is_same_v<T, double>) {
        return "double";
    } else if constexpr (std::is_same_v<T, float>) {
        return "float";
    } else {
        return typeid(T).name();
    }
}

}  // namespace util::detail
