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

#include "app/FatalError.hpp"

#include "util/Assert.hpp"

#include <ostream>
#include <string_view>
#include <utility>

namespace app {

std::string_view
toString(FatalError::Kind kind)
{
    switch (kind) {
        case FatalError::Kind::ConfigLoad:
            return "ConfigLoad";
        case FatalError::Kind::Bootstrap:
            return "Bootstrap";
        case FatalError::Kind::HttpServer:
            return "HttpServer";
    }
    ASSERT(false, "Unknown fatal error kind");
    std::unreachable();
}

std::ostream&
operator<<(std::ostream& stream, FatalError const& error)
{
    return stream << toString(error.kind) << " error: " << error.message;
}

}  // namespace app
