#include <asset_relay/logger.h>

using namespace asset_relay;

const char * const asset_relay::server_prefix = "[Server] ";
const char * const asset_relay::browser_prefix = "[Browser] ";

logger::logger()
    : out_(NULL), mask_(0)
{
}

logger::logger(std::ostream * out, unsigned int mask)
    : out_(out), mask_(mask)
{
}

bool logger::enabled(unsigned int category) const
{
    return (out_ != NULL) && ((mask_ & category) != 0);
}

void logger::write(unsigned int category, const char * prefix, const std::string & text)
{
    if (enabled(category))
    {
        std::lock_guard<std::mutex> lck(mtx_);

        *out_ << prefix << text << std::endl;
    }
}

void logger::server(unsigned int category, const std::string & text)
{
    write(category, server_prefix, text);
}
