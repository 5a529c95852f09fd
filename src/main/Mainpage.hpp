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

/**
 * @mainpage chainrelay
 *
 * @section intro Introduction
 *
 * chainrelay is a JSON-RPC relay for EVM nodes. Clients address a project and a chain in the request path,
 * `POST /{projectId}/{chainId}`, and the relay forwards the call to an upstream node serving that chain.
 *
 * At startup every configured upstream is asked for its chain id (unless the configuration declares it) and the
 * routing index is built from the answers. The server only starts listening once every upstream has been resolved.
 *
 * @section layout Layout
 *
 * - `upstream`: upstream descriptors, endpoints and the protocol spoken to the nodes
 * - `routing`: bootstrap, the routing index and the request router
 * - `web`: the HTTP server
 * - `app`: command line, process lifecycle and exit codes
 * - `util`: configuration, logging and other shared utilities
 */
