//
// Copyright (C) 2020 Maciej Sobczak
//
// This file declares the endpoint relaying browser console output
// to the server log.
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file Boost_Software_License_1_0.txt
// or copy at http://www.opensource.org/licenses/bsl1.0.html)
//

#ifndef ASSET_RELAY_CONSOLE_RELAY_H_INCLUDED
#define ASSET_RELAY_CONSOLE_RELAY_H_INCLUDED

#include <asset_relay/http_server.h>

#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace asset_relay
{

/// Path of the console relay endpoint.
extern const char * const console_path;

/// Designates a console relay request that cannot be processed.
class console_record_error : public std::runtime_error
{
public:
    explicit console_record_error(const std::string & what)
        : std::runtime_error(what)
    {
    }
};

/// One call of the browser console, e.g. console.warn("a", "b").
struct console_record
{
    std::string level;              ///< "log", "warn", "error", ... (not validated)
    std::vector<std::string> args;  ///< Arguments of the call, already stringified.
};

/// \brief Read the request body.
///
/// Read exactly as many bytes as the Content-Length header declares.
/// Throws console_record_error when the header is missing or malformed,
/// when it exceeds max_size, or when the stream ends too early.
std::string read_request_body(const request & req, std::istream & in, std::size_t max_size);

/// \brief Decode the JSON body of the relay request.
///
/// The body has to be a UTF-8 JSON object with a string "level"
/// and an array of strings "args"; other members are ignored.
/// Throws nlohmann::json::exception for malformed JSON (including malformed UTF-8)
/// and console_record_error for the wrong structure.
console_record parse_console_record(const std::string & body);

/// Format the record for the log: "<LEVEL>: <args separated by spaces>".
std::string format_console_record(const console_record & record);

/// \brief Action of the relay endpoint.
///
/// Writes the record to the log with the "[Browser] " prefix and answers
/// 204 No Content; any failure is logged and answered with an empty 500.
route_action_type make_console_relay_action(logger & log, std::size_t max_body_size);

} // namespace asset_relay

#endif // ASSET_RELAY_CONSOLE_RELAY_H_INCLUDED
