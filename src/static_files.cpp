#include <asset_relay/static_files.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

using namespace asset_relay;

namespace // unnamed
{

int hex_digit_to_int(char c)
{
    if ((c >= '0') && (c <= '9'))
    {
        return c - '0';
    }
    else if ((c >= 'a') && (c <= 'f'))
    {
        return c - 'a' + 10;
    }
    else if ((c >= 'A') && (c <= 'F'))
    {
        return c - 'A' + 10;
    }
    else
    {
        return -1;
    }
}

std::string to_lower(const std::string & s)
{
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
        [](char c) { return (char)std::tolower((unsigned char)c); });

    return result;
}

bool ends_with_slash(const std::string & s)
{
    return (s.empty() == false) && (s[s.size() - 1] == '/');
}

bool is_directory(const std::string & name)
{
    struct stat st;
    return (::stat(name.c_str(), &st) == 0) && S_ISDIR(st.st_mode);
}

bool is_regular_file(const std::string & name)
{
    struct stat st;
    return (::stat(name.c_str(), &st) == 0) && S_ISREG(st.st_mode);
}

bool is_symlink(const std::string & name)
{
    struct stat st;
    return (::lstat(name.c_str(), &st) == 0) && S_ISLNK(st.st_mode);
}

struct case_insensitive_less
{
    bool operator()(const std::string & a, const std::string & b) const
    {
        return to_lower(a) < to_lower(b);
    }
};

} // unnamed namespace

static_files::static_files(const std::string & root)
    : root_(root)
{
    while (ends_with_slash(root_))
    {
        root_.erase(root_.size() - 1);
    }
}

std::string static_files::translate_path(const std::string & target) const
{
    std::string path = target.substr(0, target.find('?'));
    path = path.substr(0, path.find('#'));

    std::size_t last = path.find_last_not_of(" \t");
    bool trailing_slash = (last != std::string::npos) && (path[last] == '/');

    path = percent_decode(path);

    // an embedded NUL would truncate the name seen by the file system
    if (path.find('\0') != std::string::npos)
    {
        return "";
    }

    std::vector<std::string> words;
    std::istringstream segments(path);
    std::string word;
    while (std::getline(segments, word, '/'))
    {
        if (word.empty() || word == ".")
        {
            continue;
        }

        if (word == "..")
        {
            if (words.empty() == false)
            {
                words.pop_back();
            }

            continue;
        }

        words.push_back(word);
    }

    std::string result = root_;
    for (const std::string & w : words)
    {
        result += '/';
        result += w;
    }

    if (result.empty())
    {
        result = "/";
    }
    else if (trailing_slash)
    {
        result += '/';
    }

    return result;
}

response static_files::serve(const request & req) const
{
    std::string name = translate_path(req.target);
    if (name.empty())
    {
        return make_error_response(404, "File not found");
    }

    if (is_directory(name))
    {
        if (ends_with_slash(req.path) == false)
        {
            // redirect browser, relative links in the page depend on it
            response resp(301);
            resp.set_header("Location",
                req.path + "/" + req.target.substr(req.path.size()));

            return resp;
        }

        const char * const index_names[] = { "index.html", "index.htm" };

        bool found = false;
        for (const char * index : index_names)
        {
            std::string index_name = name;
            if (ends_with_slash(index_name) == false)
            {
                index_name += '/';
            }
            index_name += index;

            if (is_regular_file(index_name))
            {
                name = index_name;
                found = true;
                break;
            }
        }

        if (found == false)
        {
            return list_directory(name, req);
        }
    }

    // a trailing slash is never valid for a file name
    if (ends_with_slash(name))
    {
        return make_error_response(404, "File not found");
    }

    return serve_file(name, req);
}

response static_files::serve_file(const std::string & file_name, const request & req) const
{
    std::ifstream file(file_name.c_str(), std::ifstream::binary);

    struct stat st;
    if (!file || ::stat(file_name.c_str(), &st) != 0 || S_ISREG(st.st_mode) == false)
    {
        return make_error_response(404, "File not found");
    }

    if (req.has_header("If-Modified-Since") && (req.has_header("If-None-Match") == false))
    {
        // ill-formed dates are ignored
        std::time_t since;
        if (parse_http_date(req.header("If-Modified-Since"), since) &&
            (st.st_mtime <= since))
        {
            return response(304);
        }
    }

    std::filebuf * pbuf = file.rdbuf();

    std::size_t size = static_cast<std::size_t>(st.st_size);

    std::vector<char> buffer(size);
    if (size != 0 &&
        static_cast<std::size_t>(pbuf->sgetn(&buffer[0], size)) != size)
    {
        return make_error_response(404, "File not found");
    }

    response resp(200);
    resp.set_header("Content-Type", file_mime_type(file_name));
    resp.set_header("Last-Modified", http_date(st.st_mtime));
    resp.body.assign(buffer.begin(), buffer.end());

    return resp;
}

response static_files::list_directory(const std::string & dir_name, const request & req) const
{
    DIR * dir = ::opendir(dir_name.c_str());
    if (dir == NULL)
    {
        return make_error_response(404, "No permission to list directory");
    }

    std::vector<std::string> names;
    while (dirent * entry = ::readdir(dir))
    {
        std::string name(entry->d_name);
        if (name != "." && name != "..")
        {
            names.push_back(name);
        }
    }

    ::closedir(dir);

    std::stable_sort(names.begin(), names.end(), case_insensitive_less());

    std::string base = dir_name;
    if (ends_with_slash(base) == false)
    {
        base += '/';
    }

    const std::string title = "Directory listing for " + html_encode(percent_decode(req.path));

    std::ostringstream page;
    page << "<!DOCTYPE HTML>\n"
        << "<html lang=\"en\">\n"
        << "<head>\n"
        << "<meta charset=\"utf-8\">\n"
        << "<title>" << title << "</title>\n</head>\n"
        << "<body>\n<h1>" << title << "</h1>\n"
        << "<hr>\n<ul>\n";

    for (const std::string & name : names)
    {
        std::string full_name = base + name;
        std::string display_name = name;
        std::string link_name = name;

        // directories end with '/', symbolic links with '@'
        if (is_directory(full_name))
        {
            display_name += '/';
            link_name += '/';
        }
        if (is_symlink(full_name))
        {
            display_name = name + "@";
        }

        page << "<li><a href=\"" << path_encode(link_name) << "\">"
            << html_encode(display_name) << "</a></li>\n";
    }

    page << "</ul>\n<hr>\n</body>\n</html>\n";

    response resp(200);
    resp.set_header("Content-Type", "text/html; charset=utf-8");
    resp.body = page.str();

    return resp;
}

std::string asset_relay::file_mime_type(const std::string & file_name)
{
    std::size_t slash = file_name.rfind('/');
    std::size_t pos = file_name.rfind('.');
    if (pos == std::string::npos || (slash != std::string::npos && pos < slash))
    {
        return "application/octet-stream";
    }

    std::string ext = to_lower(file_name.substr(pos + 1));
    if (ext == "html" || ext == "htm")
    {
        return "text/html";
    }
    else if (ext == "css")
    {
        return "text/css";
    }
    else if (ext == "js" || ext == "mjs")
    {
        return "text/javascript";
    }
    else if (ext == "json" || ext == "map")
    {
        return "application/json";
    }
    else if (ext == "wasm")
    {
        return "application/wasm";
    }
    else if (ext == "txt")
    {
        return "text/plain";
    }
    else if (ext == "xml")
    {
        return "text/xml";
    }
    else if (ext == "png")
    {
        return "image/png";
    }
    else if (ext == "jpg" || ext == "jpeg")
    {
        return "image/jpeg";
    }
    else if (ext == "gif")
    {
        return "image/gif";
    }
    else if (ext == "svg")
    {
        return "image/svg+xml";
    }
    else if (ext == "ico")
    {
        return "image/vnd.microsoft.icon";
    }
    else if (ext == "webp")
    {
        return "image/webp";
    }
    else if (ext == "wav")
    {
        return "audio/x-wav";
    }
    else if (ext == "mp3")
    {
        return "audio/mpeg";
    }
    else if (ext == "ogg")
    {
        return "audio/ogg";
    }
    else if (ext == "mp4")
    {
        return "video/mp4";
    }
    else if (ext == "webm")
    {
        return "video/webm";
    }
    else if (ext == "ttf")
    {
        return "font/ttf";
    }
    else if (ext == "otf")
    {
        return "font/otf";
    }
    else if (ext == "woff")
    {
        return "font/woff";
    }
    else if (ext == "woff2")
    {
        return "font/woff2";
    }
    else
    {
        return "application/octet-stream";
    }
}

std::string asset_relay::percent_decode(const std::string & s)
{
    std::string result;

    for (std::size_t i = 0; i != s.size(); ++i)
    {
        if (s[i] == '%' && i + 2 < s.size() &&
            hex_digit_to_int(s[i + 1]) >= 0 && hex_digit_to_int(s[i + 2]) >= 0)
        {
            result.append(1, (char)(16 * hex_digit_to_int(s[i + 1]) + hex_digit_to_int(s[i + 2])));
            i += 2;
        }
        else
        {
            result.append(1, s[i]);
        }
    }

    return result;
}

std::string asset_relay::path_encode(const std::string & s)
{
    std::string result;

    for (char c : s)
    {
        if ((std::isalnum((unsigned char)c) != 0) ||
            (c == '-') || (c == '_') || (c == '.') || (c == '~') || (c == '/'))
        {
            result.append(1, c);
        }
        else
        {
            char buf[4];

            std::snprintf(buf, sizeof(buf), "%%%02X", (unsigned int)(unsigned char)c);

            result.append(buf);
        }
    }

    return result;
}

std::string asset_relay::http_date(std::time_t t)
{
    struct tm parts;
    ::gmtime_r(&t, &parts);

    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &parts);

    return buf;
}

bool asset_relay::parse_http_date(const std::string & s, std::time_t & result)
{
    struct tm parts;
    std::memset(&parts, 0, sizeof(parts));

    const char * rest = ::strptime(s.c_str(), "%a, %d %b %Y %H:%M:%S GMT", &parts);
    if (rest == NULL || *rest != '\0')
    {
        return false;
    }

    result = ::timegm(&parts);

    return true;
}
