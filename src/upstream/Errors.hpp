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

#include <string>

namespace upstream {

/**
 * @brief Why the chain identity of an upstream could not be determined.
 */
struct ResolutionFailure {
    std::string endpoint;
    std::string method;
    std::string cause;

    /**
     * @return A human readable description including the endpoint and method
     */
    [[nodiscard]] std::string
    message() const;
};

/**
 * @brief A transport level failure while talking to an upstream.
 *
 * Covers everything that prevented a JSON-RPC response body from being received: resolution, connection, TLS,
 * timeouts and non-2xx statuses.
 */
struct ForwardError {
    std::string cause;
    bool timedOut = false;
};

}  // namespace upstream
