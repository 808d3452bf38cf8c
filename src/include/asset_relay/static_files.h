//
// Copyright (C) 2020 Maciej Sobczak
//
// This file declares the static file handler of the HTTP server.
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file Boost_Software_License_1_0.txt
// or copy at http://www.opensource.org/licenses/bsl1.0.html)
//

#ifndef ASSET_RELAY_STATIC_FILES_H_INCLUDED
#define ASSET_RELAY_STATIC_FILES_H_INCLUDED

#include <asset_relay/message.h>

#include <ctime>
#include <string>

namespace asset_relay
{

/// \brief Serves GET and HEAD requests from a directory tree.
///
/// Directories are served through their index.html (or index.htm) file,
/// or as a generated listing when there is none.
/// Nothing outside of the root directory is reachable.
class static_files
{
public:
    explicit static_files(const std::string & root);

    /// \brief Map the request target to a local file name.
    ///
    /// The query and fragment are dropped, the path is percent-decoded
    /// and normalized, so that "." and ".." never leave the root directory.
    /// A trailing slash of the target is preserved.
    /// @param target request target, as sent by the client.
    /// @return name of the local file or directory,
    /// or an empty string when the decoded path contains a NUL character.
    std::string translate_path(const std::string & target) const;

    /// Produce the response for a GET or HEAD request.
    response serve(const request & req) const;

private:
    response serve_file(const std::string & file_name, const request & req) const;
    response list_directory(const std::string & dir_name, const request & req) const;

    std::string root_;
};

/// MIME type guessed from the extension of the file name,
/// "application/octet-stream" when the extension is not known.
std::string file_mime_type(const std::string & file_name);

/// Decode %hh escapes; malformed escapes are kept as they are.
std::string percent_decode(const std::string & s);

/// Encode string for safe use as a URL path,
/// alpha-numeric characters, '-', '_', '.', '~' and '/' are left unchanged.
std::string path_encode(const std::string & s);

/// Format the time as an HTTP date, e.g. "Sun, 18 Oct 2026 20:28:00 GMT".
std::string http_date(std::time_t t);

/// Parse an HTTP date in the IMF-fixdate format.
/// @return false if the string is not a valid date.
bool parse_http_date(const std::string & s, std::time_t & result);

} // namespace asset_relay

#endif // ASSET_RELAY_STATIC_FILES_H_INCLUDED
