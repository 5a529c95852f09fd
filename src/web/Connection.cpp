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

#include "web/Connection.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <utility>

namespace web {

namespace {

std::size_t
nextConnectionId()
{
    static std::atomic_size_t counter{0};
    return counter++;
}

}  // namespace

Connection::Connection(std::string ip) : id_{nextConnectionId()}, ip_{std::move(ip)}
{
}

bool
Connection::isBusy() const
{
    return busy_;
}

void
Connection::setBusy(bool busy)
{
    busy_ = busy;
}

std::size_t
Connection::id() const
{
    return id_;
}

std::string const&
Connection::ip() const
{
    return ip_;
}

}  // namespace web
