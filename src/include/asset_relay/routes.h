//
// Copyright (C) 2020 Maciej Sobczak
//
// This file declares the routes and response headers of the game asset host.
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file Boost_Software_License_1_0.txt
// or copy at http://www.opensource.org/licenses/bsl1.0.html)
//

#ifndef ASSET_RELAY_ROUTES_H_INCLUDED
#define ASSET_RELAY_ROUTES_H_INCLUDED

#include <asset_relay/http_server.h>

#include <string>
#include <utility>
#include <vector>

namespace asset_relay
{

/// Cross-origin and no-cache headers attached to every response.
const std::vector<std::pair<std::string, std::string> > & relay_headers();

/// Filter replacing (or adding) all of relay_headers() on the response.
response_filter_type make_relay_headers_filter();

/// Action answering CORS preflight requests: 200 without body.
route_action_type make_preflight_action();

/// Action answering POST requests to unknown endpoints: 404.
route_action_type make_unknown_endpoint_action();

/// \brief Configure the server as the game asset host.
///
/// Registers, in this order:
/// OPTIONS on any path, POST on the console relay path,
/// POST on any other path, and the relay_headers() filter.
/// GET and HEAD are left to the static file handler.
void install_relay_routes(http_server & server);

} // namespace asset_relay

#endif // ASSET_RELAY_ROUTES_H_INCLUDED
