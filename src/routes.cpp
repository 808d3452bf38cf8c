#include <asset_relay/routes.h>
#include <asset_relay/console_relay.h>

using namespace asset_relay;

const std::vector<std::pair<std::string, std::string> > & asset_relay::relay_headers()
{
    static const std::vector<std::pair<std::string, std::string> > headers =
    {
        { "Access-Control-Allow-Origin", "*" },
        { "Access-Control-Allow-Methods", "GET, POST, OPTIONS" },
        { "Access-Control-Allow-Headers", "*" },
        // clients always fetch the latest version of the assets
        { "Cache-Control", "no-cache, no-store, must-revalidate" },
        { "Pragma", "no-cache" },
        { "Expires", "0" }
    };

    return headers;
}

response_filter_type asset_relay::make_relay_headers_filter()
{
    return [](const request & /* req */, response & resp)
    {
        for (const auto & h : relay_headers())
        {
            resp.set_header(h.first, h.second);
        }
    };
}

route_action_type asset_relay::make_preflight_action()
{
    return [](const request & /* req */, std::istream & /* in */)
    {
        return response(200);
    };
}

route_action_type asset_relay::make_unknown_endpoint_action()
{
    return [](const request & /* req */, std::istream & /* in */)
    {
        return make_error_response(404, "Endpoint not found");
    };
}

void asset_relay::install_relay_routes(http_server & server)
{
    server.add_route(match_method("OPTIONS"), make_preflight_action());

    server.add_route(match_method_and_path("POST", console_path),
        make_console_relay_action(server.log(), server.config().max_body_size));

    server.add_route(match_method("POST"), make_unknown_endpoint_action());

    server.add_response_filter(make_relay_headers_filter());
}
