#ifndef ASSET_RELAY_TEST_SUPPORT_H_INCLUDED
#define ASSET_RELAY_TEST_SUPPORT_H_INCLUDED

#include <asset_relay/http_server.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace test_support
{

// scratch directory removed with its content when it goes out of scope
class temp_dir
{
public:
    temp_dir()
    {
        char templ[] = "/tmp/asset_relay_test_XXXXXX";
        if (::mkdtemp(templ) == NULL)
        {
            throw std::runtime_error("mkdtemp failed");
        }

        path_ = templ;
    }

    ~temp_dir()
    {
        ::nftw(path_.c_str(), &remove_entry, 16, FTW_DEPTH | FTW_PHYS);
    }

    const std::string & path() const { return path_; }

    void make_dir(const std::string & rel) const
    {
        if (::mkdir((path_ + "/" + rel).c_str(), 0755) != 0)
        {
            throw std::runtime_error("mkdir failed: " + rel);
        }
    }

    void write_file(const std::string & rel, const std::string & content) const
    {
        std::ofstream out((path_ + "/" + rel).c_str(), std::ofstream::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out)
        {
            throw std::runtime_error("cannot write " + rel);
        }
    }

private:
    temp_dir(const temp_dir &);
    void operator=(const temp_dir &);

    static int remove_entry(const char * name, const struct stat *, int, struct FTW *)
    {
        return std::remove(name);
    }

    std::string path_;
};

struct parsed_response
{
    int status;
    std::string status_line;
    std::map<std::string, std::string> headers; // lower-case names
    std::string body;

    bool has_header(const std::string & name) const
    {
        return headers.find(name) != headers.end();
    }

    std::string header(const std::string & name) const
    {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }
};

inline parsed_response parse_response(const std::string & raw)
{
    parsed_response result;
    result.status = 0;

    std::size_t end_of_head = raw.find("\r\n\r\n");
    if (end_of_head == std::string::npos)
    {
        throw std::runtime_error("incomplete response: " + raw);
    }

    std::istringstream head(raw.substr(0, end_of_head));
    std::string line;
    std::getline(head, line);
    if (line.empty() == false && line[line.size() - 1] == '\r')
    {
        line.erase(line.size() - 1);
    }
    result.status_line = line;

    std::istringstream status_words(line);
    std::string version;
    status_words >> version >> result.status;

    while (std::getline(head, line))
    {
        if (line.empty() == false && line[line.size() - 1] == '\r')
        {
            line.erase(line.size() - 1);
        }

        std::size_t colon = line.find(':');
        std::string name = line.substr(0, colon);
        for (std::size_t i = 0; i != name.size(); ++i)
        {
            name[i] = (char)std::tolower((unsigned char)name[i]);
        }

        std::size_t value = line.find_first_not_of(' ', colon + 1);
        result.headers[name] = value == std::string::npos ? "" : line.substr(value);
    }

    result.body = raw.substr(end_of_head + 4);

    return result;
}

// feed the raw request to the server, return the raw response
inline std::string exchange(asset_relay::http_server & server, const std::string & raw_request)
{
    std::istringstream in(raw_request);
    std::ostringstream out;

    server.handle_connection(in, out, "127.0.0.1");

    return out.str();
}

inline asset_relay::server_config test_config(const std::string & root, std::ostream & log)
{
    asset_relay::server_config config = asset_relay::default_config();
    config.host = "127.0.0.1";
    config.port = 0;
    config.asset_root = root;
    config.log_stream = &log;

    return config;
}

} // namespace test_support

#endif // ASSET_RELAY_TEST_SUPPORT_H_INCLUDED
