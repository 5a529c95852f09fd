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

#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstddef>
#include <functional>

namespace util {

/**
 * @brief Spawns a group of child coroutines and lets the parent coroutine wait until all of them are finished.
 *
 * Children run on the executor of the parent's yield context. Use a strand when the underlying io_context is run by
 * more than one thread.
 */
class CoroutineGroup {
    boost::asio::steady_timer timer_;
    std::size_t childrenCounter_{0};

public:
    /**
     * @brief Construct a new Coroutine Group object
     *
     * @param yield The yield context of the parent coroutine
     */
    explicit CoroutineGroup(boost::asio::yield_context yield);

    /**
     * @brief Destroy the Coroutine Group object
     *
     * @note asyncWait() must be called before the object is destroyed
     */
    ~CoroutineGroup();

    CoroutineGroup(CoroutineGroup const&) = delete;
    CoroutineGroup&
    operator=(CoroutineGroup const&) = delete;

    /**
     * @brief Spawn a new coroutine in the group
     *
     * @param yield The yield context of the parent coroutine
     * @param fn The function to execute
     */
    void
    spawn(boost::asio::yield_context yield, std::function<void(boost::asio::yield_context)> fn);

    /**
     * @brief Suspend the parent coroutine until every child has returned
     *
     * @param yield The yield context of the parent coroutine
     */
    void
    asyncWait(boost::asio::yield_context yield);

    /**
     * @return The number of children that are still running
     */
    std::size_t
    size() const;
};

}  // namespace util
