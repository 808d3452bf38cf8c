//
// Copyright (C) 2020 Maciej Sobczak
//
// This file declares the diagnostic log sink shared by the server components.
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file Boost_Software_License_1_0.txt
// or copy at http://www.opensource.org/licenses/bsl1.0.html)
//

#ifndef ASSET_RELAY_LOGGER_H_INCLUDED
#define ASSET_RELAY_LOGGER_H_INCLUDED

#include <mutex>
#include <ostream>
#include <string>

namespace asset_relay
{

/// Bit masks for various categories of diagnostic log messages.
const unsigned int log_startup     = 0x01;
const unsigned int log_requests    = 0x02;
const unsigned int log_errors      = 0x04;
const unsigned int log_browser     = 0x08;
const unsigned int log_connections = 0x10;
const unsigned int log_everything  = 0x1f;

/// Categories enabled unless configured otherwise.
const unsigned int log_default = log_startup | log_requests | log_errors | log_browser;

/// Line prefix of messages produced by the server itself.
extern const char * const server_prefix;

/// Line prefix of messages relayed from the browser console.
extern const char * const browser_prefix;

/// \brief Line-oriented log sink.
///
/// Every message is written as one complete line, followed by a flush,
/// so that lines from different threads never interleave.
/// A logger constructed without a stream discards everything.
class logger
{
public:
    logger();
    logger(std::ostream * out, unsigned int mask);

    /// Check whether messages of the given category are written at all.
    bool enabled(unsigned int category) const;

    /// Write prefix and text as a single line, if the category is enabled.
    void write(unsigned int category, const char * prefix, const std::string & text);

    /// Shorthand for write() with server_prefix.
    void server(unsigned int category, const std::string & text);

private:
    // not for use
    logger(const logger &);
    void operator=(const logger &);

    std::ostream * out_;
    unsigned int mask_;
    std::mutex mtx_;
};

} // namespace asset_relay

#endif // ASSET_RELAY_LOGGER_H_INCLUDED
