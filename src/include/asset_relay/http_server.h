//
// Copyright (C) 2020 Maciej Sobczak
//
// This file declares the interface of the minimal, embedded HTTP server.
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file Boost_Software_License_1_0.txt
// or copy at http://www.opensource.org/licenses/bsl1.0.html)
//

#ifndef ASSET_RELAY_HTTP_SERVER_H_INCLUDED
#define ASSET_RELAY_HTTP_SERVER_H_INCLUDED

#include <asset_relay/logger.h>
#include <asset_relay/message.h>
#include <asset_relay/sockets.h>
#include <asset_relay/static_files.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <istream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

/// Namespace with scope for all asset relay server definitions.
namespace asset_relay
{

/// Server settings, fixed at construction time.
struct server_config
{
    std::string host;          ///< IPv4 address of the listening socket.
    int port;                  ///< Listening port, 0 selects an ephemeral one.
    std::string asset_root;    ///< Directory with the static files.
    std::ostream * log_stream; ///< Destination of log lines, NULL disables logging.
    unsigned int log_mask;     ///< Categories of log lines to write.
    std::size_t max_body_size; ///< Largest request body accepted by the console relay.
};

/// Settings of the game host: 0.0.0.0:5000, logging to standard output.
/// The asset root is left empty and has to be filled in by the caller.
server_config default_config();

/// Type of function deciding whether the given request is handled by a route.
typedef std::function<bool(const request &)> route_matcher_type;

/// Type of function callback for handling requests.
/// @param req the parsed request line and headers
/// @param in stream positioned at the first byte of the request body;
/// the callback consumes as much of the body as it needs
/// @return the response, before filters are applied
typedef std::function<response(const request &, std::istream &)> route_action_type;

/// Type of function applied to every response just before it is sent.
typedef std::function<void(const request &, response &)> response_filter_type;

/// Matcher accepting any request with the given method.
route_matcher_type match_method(const std::string & method);

/// Matcher accepting requests with the given method and exact path.
route_matcher_type match_method_and_path(const std::string & method, const std::string & path);

/// \brief The embedded HTTP server.
///
/// Requests are dispatched to the registered routes, in registration order,
/// and GET/HEAD requests that no route claims are served from the asset root.
/// Response filters run on every response, including errors.
///
/// Connections are accepted and served one at a time, by the thread
/// that calls serve_forever(); each connection carries a single request.
class http_server
{
public:
    explicit http_server(const server_config & config);

    const server_config & config() const { return config_; }

    logger & log() { return log_; }

    /// Register a route, evaluated after the routes registered earlier.
    void add_route(route_matcher_type matcher, route_action_type action);

    /// Register a response filter, applied after the filters registered earlier.
    void add_response_filter(response_filter_type filter);

    /// \brief Serve a single request.
    ///
    /// Read one request from the in stream, dispatch it
    /// and write the complete response to the out stream.
    /// Nothing is written when the client sent no request at all.
    ///
    /// @param in stream with the raw request bytes.
    /// @param out stream receiving the raw response bytes.
    /// @param client_address used in the access log.
    void handle_connection(std::istream & in, std::ostream & out,
        const std::string & client_address);

    /// Bind the listening socket.
    /// Throws socket_runtime_error when the address cannot be bound.
    void listen();

    /// Port number of the listening socket, valid after listen().
    int port() const;

    /// Accept and serve connections until stop() is called.
    void serve_forever();

    /// Make serve_forever() return; may be called from any thread.
    void stop();

    /// \brief Start the server.
    ///
    /// Print the startup banner, bind the listening socket and serve forever.
    /// Throws socket_runtime_error when the listening socket cannot be bound.
    void run();

private:
    // not for use
    http_server(const http_server &);
    void operator=(const http_server &);

    response dispatch(const request & req, std::istream & in);

    void send(const request & req, response & resp, std::ostream & out);

    void serve_connection(tcp_socket_wrapper & sock);

    server_config config_;
    logger log_;
    static_files files_;

    std::vector<std::pair<route_matcher_type, route_action_type> > routes_;
    std::vector<response_filter_type> filters_;

    tcp_socket_wrapper listener_;
    std::atomic<bool> stopping_;
};

} // namespace asset_relay

#endif // ASSET_RELAY_HTTP_SERVER_H_INCLUDED
