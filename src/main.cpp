//
// Local host for the game assets.
// Point your browser to http://localhost:5000
//

#include <asset_relay/http_server.h>
#include <asset_relay/routes.h>

#include <climits>
#include <cstdlib>
#include <iostream>
#include <string>

#include <unistd.h>

namespace // unnamed
{

// directory containing the server executable, the game assets live next to it
std::string executable_directory(const char * argv0)
{
    std::string path;

    char buf[PATH_MAX];
    ssize_t len = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len > 0)
    {
        path.assign(buf, static_cast<std::size_t>(len));
    }
    else if (::realpath(argv0, buf) != NULL)
    {
        path = buf;
    }
    else
    {
        return ".";
    }

    std::size_t slash = path.rfind('/');
    if (slash == 0)
    {
        return "/";
    }

    return path.substr(0, slash);
}

} // unnamed namespace

int main(int /* argc */, char * argv[])
{
    asset_relay::server_config config = asset_relay::default_config();
    config.asset_root = executable_directory(argv[0]);

    asset_relay::http_server server(config);
    asset_relay::install_relay_routes(server);

    try
    {
        // does not return as long as the server functions properly
        server.run();
    }
    catch (const asset_relay::socket_runtime_error & e)
    {
        std::cerr << asset_relay::server_prefix << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
