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

#include "util/build/Build.hpp"

#include <string>

namespace util::build {

#ifndef CHAINRELAY_VERSION
#define CHAINRELAY_VERSION "0.0.0-dev"
#endif

static constexpr char versionString[] = CHAINRELAY_VERSION;  // NOLINT(readability-identifier-naming)

std::string const&
getChainRelayVersionString()
{
    static std::string const value = versionString;
    return value;
}

std::string const&
getChainRelayFullVersionString()
{
    static std::string const value = "chainrelay-" + getChainRelayVersionString();
    return value;
}

}  // namespace util::build
