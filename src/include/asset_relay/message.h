//
// Copyright (C) 2020 Maciej Sobczak
//
// This file declares the request and response types of the HTTP server.
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file Boost_Software_License_1_0.txt
// or copy at http://www.opensource.org/licenses/bsl1.0.html)
//

#ifndef ASSET_RELAY_MESSAGE_H_INCLUDED
#define ASSET_RELAY_MESSAGE_H_INCLUDED

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace asset_relay
{

/// Single parsed HTTP request (request line and headers, without the body).
struct request
{
    std::string method;
    std::string target;         ///< Raw request target, as sent by the client.
    std::string path;           ///< Target without the query and fragment parts.
    std::string version;
    std::string request_line;
    std::string client_address;

    /// Header fields, keyed by lower-case name.
    std::map<std::string, std::string> headers;

    /// Value of the given header (name in any case), or "" when absent.
    std::string header(const std::string & name) const;

    /// Check whether the given header (name in any case) is present.
    bool has_header(const std::string & name) const;
};

/// HTTP response, complete with body, before it is serialized.
struct response
{
    response();
    explicit response(int status_code);

    int status;
    std::string reason;
    std::vector<std::pair<std::string, std::string> > headers;
    std::string body;

    /// Non-empty for error responses, written to the error log.
    std::string error_message;

    /// Add the header, or replace the value of the header with the same name.
    void set_header(const std::string & name, const std::string & value);

    /// Value of the given header, or "" when absent.
    std::string header(const std::string & name) const;
};

/// Standard reason phrase of the given status code.
std::string reason_phrase(int status);

/// \brief Build an error response.
///
/// The body is the standard HTML error page
/// with the status code, the (HTML-encoded) message and a short explanation.
/// @param status HTTP status code.
/// @param message one line description, also written to the error log.
response make_error_response(int status, const std::string & message);

/// Encode basic HTML entities.
///
/// Encode basic HTML entities - '<', '>', '&'.
/// Those special characters are replaced with "&lt;", "&gt;" and "&amp;".
/// @param s string to be encoded.
/// @return encoded string.
std::string html_encode(const std::string & s);

} // namespace asset_relay

#endif // ASSET_RELAY_MESSAGE_H_INCLUDED
