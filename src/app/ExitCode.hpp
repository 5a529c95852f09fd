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

namespace app {

/** @brief Exit code when the process stops because of an unexpected exception */
static constexpr int EXIT_CODE_UNEXPECTED = 1;

/**
 * @brief Map a startup failure to the process exit code.
 *
 * @param kind The kind of the failure
 * @return 2 for configuration errors, 3 for bootstrap errors and 4 for HTTP server errors
 */
constexpr int
exitCodeFor(FatalError::Kind kind)
{
    switch (kind) {
        case FatalError::Kind::ConfigLoad:
            return 2;
        case FatalError::Kind::Bootstrap:
            return 3;
        case FatalError::Kind::HttpServer:
            return 4;
    }
    return EXIT_CODE_UNEXPECTED;
}

}  // namespace app
