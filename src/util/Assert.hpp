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

#include "util/SourceLocation.hpp"
#include "util/log/Logger.hpp"

#include <boost/log/core/core.hpp>
#include <boost/stacktrace.hpp>
#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/core.h>
#include <fmt/format.h>

#include <cstdlib>
#include <iostream>
#include <utility>

namespace util {

/**
 * @brief Check an invariant and terminate the process with a diagnostic if it does not hold
 * @note Calls std::exit so that coverage data is still flushed
 *
 * @tparam Args The format argument types
 * @param location Where the assertion was written
 * @param expression The stringified condition
 * @param condition The condition itself
 * @param format The format string of the message
 * @param args The format arguments
 */
template <typename... Args>
constexpr void
assertImpl(
    SourceLocationType const location,
    char const* expression,
    bool const condition,
    fmt::format_string<Args...> format,
    Args&&... args
)
{
    if (condition)
        return;

    auto const message = fmt::format(
        "Assertion '{}' failed at {}:{}:\n{}\nStacktrace:\n{}",
        expression,
        location.file_name(),
        location.line(),
        fmt::format(format, std::forward<Args>(args)...),
        boost::stacktrace::to_string(boost::stacktrace::stacktrace())
    );

    if (boost::log::core::get()->get_logging_enabled()) {
        LOG(LogService::fatal()) << message;
    } else {
        std::cerr << message;
    }
    std::exit(EXIT_FAILURE);
}

}  // namespace util

#define ASSERT(condition, ...) util::assertImpl(CURRENT_SRC_LOCATION, #condition, (condition), __VA_ARGS__)
