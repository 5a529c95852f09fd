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

#include "upstream/Upstream.hpp"

#include "upstream/Errors.hpp"
#include "upstream/EvmUpstream.hpp"
#include "upstream/UpstreamDescriptor.hpp"
#include "util/Assert.hpp"

#include <boost/asio/spawn.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <variant>

namespace upstream {

Upstream::Upstream(UpstreamDescriptor descriptor) : descriptor_(std::move(descriptor)), impl_(makeImpl(descriptor_))
{
}

Upstream::ImplType
Upstream::makeImpl(UpstreamDescriptor const& descriptor)
{
    switch (descriptor.kind) {
        case UpstreamKind::Evm:
            return EvmUpstream{descriptor.endpoint};
    }
    ASSERT(false, "Unknown upstream kind");
    std::unreachable();
}

std::expected<ChainId, ResolutionFailure>
Upstream::resolveIdentity(std::chrono::milliseconds timeout, boost::asio::yield_context yield) const
{
    return std::visit([&](auto const& impl) { return impl.resolveIdentity(timeout, yield); }, impl_);
}

std::expected<std::string, ForwardError>
Upstream::send(
    std::string body,
    std::chrono::milliseconds timeout,
    std::uint64_t const maxResponseSize,
    boost::asio::yield_context yield
) const
{
    return std::visit(
        [&](auto const& impl) { return impl.send(std::move(body), timeout, maxResponseSize, yield); }, impl_
    );
}

}  // namespace upstream
