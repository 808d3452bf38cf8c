#include <asset_relay/console_relay.h>

#include <nlohmann/json.hpp>

#include <cctype>
#include <exception>

using namespace asset_relay;

const char * const asset_relay::console_path = "/__console__";

namespace // unnamed
{

std::size_t parse_content_length(const request & req)
{
    if (req.has_header("Content-Length") == false)
    {
        throw console_record_error("missing Content-Length header");
    }

    const std::string value = req.header("Content-Length");
    if (value.empty() || value.size() > 18 ||
        value.find_first_not_of("0123456789") != std::string::npos)
    {
        throw console_record_error("invalid Content-Length header: '" + value + "'");
    }

    return static_cast<std::size_t>(std::stoull(value));
}

} // unnamed namespace

std::string asset_relay::read_request_body(const request & req, std::istream & in,
    std::size_t max_size)
{
    std::size_t content_length = parse_content_length(req);
    if (content_length > max_size)
    {
        throw console_record_error("request body of " + std::to_string(content_length) +
            " bytes exceeds the limit of " + std::to_string(max_size) + " bytes");
    }

    std::string body(content_length, '\0');
    if (content_length != 0)
    {
        in.read(&body[0], static_cast<std::streamsize>(content_length));
    }

    std::size_t got = static_cast<std::size_t>(in.gcount());
    if (content_length != 0 && got != content_length)
    {
        // the response still has to go out through the same stream
        in.clear();

        throw console_record_error("incomplete request body: expected " +
            std::to_string(content_length) + " bytes, got " + std::to_string(got));
    }

    return body;
}

console_record asset_relay::parse_console_record(const std::string & body)
{
    const nlohmann::json data = nlohmann::json::parse(body);

    if (data.is_object() == false)
    {
        throw console_record_error("console record is not a JSON object");
    }

    auto level = data.find("level");
    if (level == data.end())
    {
        throw console_record_error("missing field 'level'");
    }
    if (level->is_string() == false)
    {
        throw console_record_error("field 'level' is not a string");
    }

    auto args = data.find("args");
    if (args == data.end())
    {
        throw console_record_error("missing field 'args'");
    }
    if (args->is_array() == false)
    {
        throw console_record_error("field 'args' is not an array");
    }

    console_record record;
    record.level = level->get<std::string>();

    for (const auto & arg : *args)
    {
        if (arg.is_string() == false)
        {
            throw console_record_error("field 'args' holds a " +
                std::string(arg.type_name()) + " instead of a string");
        }

        record.args.push_back(arg.get<std::string>());
    }

    return record;
}

std::string asset_relay::format_console_record(const console_record & record)
{
    std::string line;

    for (char c : record.level)
    {
        line.append(1, (char)std::toupper((unsigned char)c));
    }

    line.append(": ");

    for (std::size_t i = 0; i != record.args.size(); ++i)
    {
        if (i != 0)
        {
            line.append(1, ' ');
        }

        line.append(record.args[i]);
    }

    return line;
}

route_action_type asset_relay::make_console_relay_action(logger & log, std::size_t max_body_size)
{
    return [&log, max_body_size](const request & req, std::istream & in) -> response
    {
        try
        {
            console_record record = parse_console_record(
                read_request_body(req, in, max_body_size));

            log.write(log_browser, browser_prefix, format_console_record(record));

            return response(204);
        }
        catch (const std::exception & e)
        {
            log.server(log_errors, std::string("Console log error: ") + e.what());

            return response(500);
        }
    };
}
