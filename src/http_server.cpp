#include <asset_relay/http_server.h>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <sstream>

#include <time.h>

using namespace asset_relay;

namespace // unnamed
{

const char * const server_software = "asset_relay/1.0";

// header lines accepted per request
const std::size_t max_headers = 100;

// length of the request line and of each header line
const std::size_t max_line_length = 65536;

// time given to the client to finish sending a request body nobody has read
const int drain_timeout_ms = 1000;

enum read_status
{
    request_ok,      // request line and headers parsed
    request_missing, // the client closed without sending anything
    request_invalid  // the error response was prepared
};

std::string trim(const std::string & s)
{
    std::size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos)
    {
        return "";
    }

    std::size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::string to_lower(const std::string & s)
{
    std::string result(s);
    for (std::size_t i = 0; i != result.size(); ++i)
    {
        result[i] = (char)std::tolower((unsigned char)result[i]);
    }

    return result;
}

enum line_status
{
    line_ok,
    line_end,     // nothing left to read
    line_too_long // max_line_length exceeded, the rest of the line is not read
};

line_status get_line(std::istream & in, std::string & line)
{
    line.clear();

    std::istream::int_type c;
    while ((c = in.get()) != std::istream::traits_type::eof())
    {
        if (c == '\n')
        {
            if (line.empty() == false && line[line.size() - 1] == '\r')
            {
                line.erase(line.size() - 1);
            }

            return line_ok;
        }

        if (line.size() == max_line_length)
        {
            return line_too_long;
        }

        line.push_back(static_cast<char>(c));
    }

    // last line without a terminator
    return line.empty() ? line_end : line_ok;
}

read_status read_request(std::istream & in, request & req, response & error)
{
    std::string line;
    line_status ls = get_line(in, line);
    if (ls == line_too_long)
    {
        error = make_error_response(414, "Request-URI Too Long");
        return request_invalid;
    }

    if (ls == line_end || line.empty())
    {
        return request_missing;
    }

    req.request_line = line;

    std::istringstream words(line);
    std::string extra;
    if (!(words >> req.method >> req.target >> req.version) || (words >> extra))
    {
        error = make_error_response(400, "Bad request syntax ('" + line + "')");
        return request_invalid;
    }

    if (req.version.compare(0, 5, "HTTP/") != 0)
    {
        error = make_error_response(400, "Bad request version ('" + req.version + "')");
        return request_invalid;
    }

    req.path = req.target.substr(0, req.target.find('?'));
    req.path = req.path.substr(0, req.path.find('#'));

    std::size_t count = 0;
    while ((ls = get_line(in, line)) != line_end && line.empty() == false)
    {
        if (ls == line_too_long)
        {
            error = make_error_response(431, "Line too long");
            return request_invalid;
        }

        if (++count > max_headers)
        {
            error = make_error_response(431, "Too many headers");
            return request_invalid;
        }

        std::size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0)
        {
            error = make_error_response(400, "Bad header line ('" + line + "')");
            return request_invalid;
        }

        req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    return request_ok;
}

bool body_allowed(int status)
{
    return (status >= 200) && (status != 204) && (status != 304);
}

// local time in the access log format, e.g. 18/Oct/2026 20:28:00
std::string log_date_time()
{
    static const char * const month_names[] =
    {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun",
        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
    };

    std::time_t now = std::time(NULL);
    struct tm parts;
    ::localtime_r(&now, &parts);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d/%s/%04d %02d:%02d:%02d",
        parts.tm_mday, month_names[parts.tm_mon], parts.tm_year + 1900,
        parts.tm_hour, parts.tm_min, parts.tm_sec);

    return buf;
}

} // unnamed namespace

server_config asset_relay::default_config()
{
    server_config config;
    config.host = "0.0.0.0";
    config.port = 5000;
    config.log_stream = &std::cout;
    config.log_mask = log_default;
    config.max_body_size = 1024 * 1024;

    return config;
}

route_matcher_type asset_relay::match_method(const std::string & method)
{
    return [method](const request & req)
    {
        return req.method == method;
    };
}

route_matcher_type asset_relay::match_method_and_path(const std::string & method,
    const std::string & path)
{
    return [method, path](const request & req)
    {
        return (req.method == method) && (req.path == path);
    };
}

http_server::http_server(const server_config & config)
    : config_(config),
      log_(config.log_stream, config.log_mask),
      files_(config.asset_root),
      stopping_(false)
{
}

void http_server::add_route(route_matcher_type matcher, route_action_type action)
{
    routes_.push_back(std::make_pair(matcher, action));
}

void http_server::add_response_filter(response_filter_type filter)
{
    filters_.push_back(filter);
}

void http_server::handle_connection(std::istream & in, std::ostream & out,
    const std::string & client_address)
{
    request req;
    req.client_address = client_address;

    response resp;

    read_status status = read_request(in, req, resp);
    if (status == request_missing)
    {
        log_.server(log_connections, "connection from " + client_address +
            " closed without a request");
        return;
    }

    if (status == request_ok)
    {
        resp = dispatch(req, in);
    }

    send(req, resp, out);
}

response http_server::dispatch(const request & req, std::istream & in)
{
    for (const auto & route : routes_)
    {
        if (route.first(req))
        {
            return route.second(req, in);
        }
    }

    if (req.method == "GET" || req.method == "HEAD")
    {
        return files_.serve(req);
    }

    return make_error_response(501, "Unsupported method ('" + req.method + "')");
}

void http_server::send(const request & req, response & resp, std::ostream & out)
{
    for (const auto & filter : filters_)
    {
        filter(req, resp);
    }

    const bool with_body = body_allowed(resp.status);
    const bool write_body = with_body && (req.method != "HEAD") && (resp.body.empty() == false);

    out << "HTTP/1.1 " << resp.status << ' ' << resp.reason << "\r\n"
        << "Server: " << server_software << "\r\n"
        << "Date: " << http_date(std::time(NULL)) << "\r\n";

    for (const auto & h : resp.headers)
    {
        out << h.first << ": " << h.second << "\r\n";
    }

    if (with_body)
    {
        out << "Content-Length: " << resp.body.size() << "\r\n";
    }

    out << "Connection: close\r\n"
        << "\r\n";

    if (write_body)
    {
        out.write(resp.body.data(), static_cast<std::streamsize>(resp.body.size()));
    }

    out.flush();

    if (resp.error_message.empty() == false)
    {
        std::ostringstream msg;
        msg << "code " << resp.status << ", message " << resp.error_message;
        log_.server(log_errors, msg.str());
    }

    if (log_.enabled(log_requests))
    {
        std::ostringstream line;
        line << req.client_address << " - - [" << log_date_time() << "] \""
            << req.request_line << "\" " << resp.status << ' ';
        if (write_body)
        {
            line << resp.body.size();
        }
        else
        {
            line << '-';
        }

        log_.server(log_requests, line.str());
    }
}

void http_server::serve_connection(tcp_socket_wrapper & sock)
{
    const std::string client_address = sock.address();

    log_.server(log_connections, "accepted new connection from " + client_address);

    tcp_stream stream(sock);

    // socket failures surface as exceptions instead of a silent badbit
    stream.exceptions(std::ios::badbit);

    handle_connection(stream, stream, client_address);

    stream.flush();

    sock.drain(drain_timeout_ms);
    sock.close();

    log_.server(log_connections, "finished with connection from " + client_address);
}

void http_server::listen()
{
    listener_.listen(config_.host, config_.port);
}

int http_server::port() const
{
    return listener_.local_port();
}

void http_server::serve_forever()
{
    while (stopping_ == false)
    {
        std::unique_ptr<tcp_socket_wrapper> sock;

        try
        {
            sock.reset(new tcp_socket_wrapper(listener_.accept()));
        }
        catch (const std::exception & e)
        {
            if (stopping_)
            {
                break;
            }

            log_.server(log_errors, std::string("accept failed: ") + e.what());
            continue;
        }

        try
        {
            serve_connection(*sock);
        }
        catch (const std::exception & e)
        {
            log_.server(log_errors, std::string("error in connection: ") + e.what());
        }
    }

    log_.server(log_connections, "server stopped");
}

void http_server::stop()
{
    stopping_ = true;

    listener_.shutdown();
}

void http_server::run()
{
    std::ostringstream endpoint;
    endpoint << config_.host << ':' << config_.port;

    log_.server(log_startup, "Starting HTTP server on " + endpoint.str());
    log_.server(log_startup, "Serving files from: " + config_.asset_root);
    log_.server(log_startup, "Game available at: http://" + endpoint.str());

    listen();

    log_.server(log_startup, "Server ready and listening...");

    serve_forever();
}
