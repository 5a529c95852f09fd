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

#include "upstream/ChainIdResolver.hpp"

#include "upstream/Errors.hpp"
#include "upstream/Upstream.hpp"
#include "upstream/UpstreamDescriptor.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/spawn.hpp>

#include <chrono>
#include <expected>

namespace upstream {

ChainIdResolver::ChainIdResolver(std::chrono::milliseconds identityTimeout) : identityTimeout_(identityTimeout)
{
}

std::expected<ChainId, ResolutionFailure>
ChainIdResolver::resolve(UpstreamDescriptor const& descriptor, boost::asio::yield_context yield) const
{
    if (auto const declared = descriptor.declaredChainId(); declared.has_value()) {
        LOG(log_.debug()) << "Upstream '" << descriptor.id << "' declares chain " << *declared;
        return *declared;
    }

    LOG(log_.debug()) << "Probing upstream '" << descriptor.id << "' at " << descriptor.endpoint.toString();
    return Upstream{descriptor}.resolveIdentity(identityTimeout_, yield);
}

}  // namespace upstream
