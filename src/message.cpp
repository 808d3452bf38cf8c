#include <asset_relay/message.h>

#include <cctype>
#include <sstream>

using namespace asset_relay;

namespace // unnamed
{

std::string to_lower(const std::string & s)
{
    std::string result(s);
    for (std::size_t i = 0; i != result.size(); ++i)
    {
        result[i] = (char)std::tolower((unsigned char)result[i]);
    }

    return result;
}

bool same_name(const std::string & a, const std::string & b)
{
    return to_lower(a) == to_lower(b);
}

// long description of the status code, used on error pages
std::string explanation(int status)
{
    switch (status)
    {
    case 400: return "Bad request syntax or unsupported method";
    case 404: return "Nothing matches the given URI";
    case 414: return "The URI is too long";
    case 431: return "The server refused this request because the request header fields are too large";
    case 500: return "Server got itself in trouble";
    case 501: return "Server does not support this operation";
    default:  return "???";
    }
}

} // unnamed namespace

std::string request::header(const std::string & name) const
{
    auto it = headers.find(to_lower(name));
    if (it != headers.end())
    {
        return it->second;
    }

    return "";
}

bool request::has_header(const std::string & name) const
{
    return headers.find(to_lower(name)) != headers.end();
}

response::response()
    : status(200), reason(reason_phrase(200))
{
}

response::response(int status_code)
    : status(status_code), reason(reason_phrase(status_code))
{
}

void response::set_header(const std::string & name, const std::string & value)
{
    for (auto & h : headers)
    {
        if (same_name(h.first, name))
        {
            h.second = value;
            return;
        }
    }

    headers.push_back(std::make_pair(name, value));
}

std::string response::header(const std::string & name) const
{
    for (const auto & h : headers)
    {
        if (same_name(h.first, name))
        {
            return h.second;
        }
    }

    return "";
}

std::string asset_relay::reason_phrase(int status)
{
    switch (status)
    {
    case 200: return "OK";
    case 204: return "No Content";
    case 301: return "Moved Permanently";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 414: return "URI Too Long";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    default:  return "Unknown";
    }
}

response asset_relay::make_error_response(int status, const std::string & message)
{
    std::ostringstream page;
    page << "<!DOCTYPE HTML>\n"
        << "<html lang=\"en\">\n"
        << "    <head>\n"
        << "        <meta charset=\"utf-8\">\n"
        << "        <title>Error response</title>\n"
        << "    </head>\n"
        << "    <body>\n"
        << "        <h1>Error response</h1>\n"
        << "        <p>Error code: " << status << "</p>\n"
        << "        <p>Message: " << html_encode(message) << ".</p>\n"
        << "        <p>Error code explanation: " << status << " - "
            << html_encode(explanation(status)) << ".</p>\n"
        << "    </body>\n"
        << "</html>\n";

    response resp(status);
    resp.error_message = message;
    resp.set_header("Content-Type", "text/html;charset=utf-8");
    resp.body = page.str();

    return resp;
}

std::string asset_relay::html_encode(const std::string & s)
{
    std::string result;

    for (char c : s)
    {
        if (c == '<')
        {
            result.append("&lt;");
        }
        else if (c == '>')
        {
            result.append("&gt;");
        }
        else if (c == '&')
        {
            result.append("&amp;");
        }
        else
        {
            result.append(1, c);
        }
    }

    return result;
}
