//
// Copyright (C) 2001-2020 Maciej Sobczak
//
// This file implements wrappers that can be used
// as IOStream-compatible TCP/IP sockets.
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file Boost_Software_License_1_0.txt
// or copy at http://www.opensource.org/licenses/bsl1.0.html)
//

#include <asset_relay/sockets.h>

#include <sstream>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#define INVALID_SOCKET -1
#define SOCKET_ERROR -1

using namespace asset_relay;

namespace // unnamed
{

// release a descriptor that failed to set up, keeping errno of the failed call
void close_preserving_errno(int sock)
{
    int saved = errno;
    ::close(sock);
    errno = saved;
}

} // unnamed namespace

socket_runtime_error::socket_runtime_error(const std::string & what)
    : runtime_error(what), errnum_(errno)
{
}

const char * socket_runtime_error::what() const throw()
{
    std::ostringstream ss;
    ss << runtime_error::what();
    ss << " error number: " << errnum_ << " (" << std::strerror(errnum_) << ")";
    msg_ = ss.str();
    return msg_.c_str();
}

base_socket_wrapper::~base_socket_wrapper()
{
    if (sockstate_ != CLOSED)
    {
        ::close(sock_);
    }
}

void base_socket_wrapper::write(const void * buf, std::size_t len)
{
    if (sockstate_ != CONNECTED && sockstate_ != ACCEPTED)
    {
        throw socket_logic_error("socket not connected");
    }

    while (len != 0)
    {
        // a vanished peer must not kill the process with SIGPIPE
        ssize_t written = ::send(sock_, buf, len, MSG_NOSIGNAL);
        if (written == SOCKET_ERROR)
        {
            if (errno == EINTR)
            {
                continue;
            }

            throw socket_runtime_error("write failed");
        }

        len -= static_cast<std::size_t>(written);
        buf = static_cast<const char *>(buf) + written;
    }
}

std::size_t base_socket_wrapper::read(void * buf, std::size_t len)
{
    if (sockstate_ != CONNECTED && sockstate_ != ACCEPTED)
    {
        throw socket_logic_error("socket not connected");
    }

    ssize_t readn;
    do
    {
        readn = ::recv(sock_, buf, len, 0);
    }
    while (readn == SOCKET_ERROR && errno == EINTR);

    if (readn == SOCKET_ERROR)
    {
        throw socket_runtime_error("read failed");
    }

    return static_cast<std::size_t>(readn);
}

void base_socket_wrapper::shutdown()
{
    if (sockstate_ != CLOSED)
    {
        // ENOTCONN is expected for a listening socket on some systems,
        // accept() is woken up nevertheless
        if (::shutdown(sock_, SHUT_RDWR) == SOCKET_ERROR && errno != ENOTCONN)
        {
            throw socket_runtime_error("shutdown failed");
        }
    }
}

void base_socket_wrapper::shutdown_output()
{
    if (sockstate_ != CONNECTED && sockstate_ != ACCEPTED)
    {
        throw socket_logic_error("socket not connected");
    }

    if (::shutdown(sock_, SHUT_WR) == SOCKET_ERROR)
    {
        throw socket_runtime_error("shutdown failed");
    }
}

void base_socket_wrapper::drain(int timeout_ms)
{
    if (sockstate_ != CONNECTED && sockstate_ != ACCEPTED)
    {
        return;
    }

    if (::shutdown(sock_, SHUT_WR) == SOCKET_ERROR)
    {
        // the peer is already gone, nothing left to drain
        return;
    }

    char scratch[4096];
    while (true)
    {
        pollfd pfd;
        pfd.fd = sock_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready <= 0)
        {
            break;
        }

        ssize_t readn = ::recv(sock_, scratch, sizeof(scratch), 0);
        if (readn <= 0)
        {
            break;
        }
    }
}

void base_socket_wrapper::close()
{
    if (sockstate_ != CLOSED)
    {
        if (::close(sock_) == SOCKET_ERROR)
        {
            throw socket_runtime_error("close failed");
        }
        sockstate_ = CLOSED;
    }
}

tcp_socket_wrapper::tcp_socket_wrapper(
    const tcp_socket_wrapper::tcp_accepted_socket & as)
    : base_socket_wrapper(as), sockaddress_(as.addr_)
{
}

void tcp_socket_wrapper::listen(const std::string & address, int port, int backlog)
{
    if (sockstate_ != CLOSED)
    {
        throw socket_logic_error("socket not in CLOSED state");
    }

    sockaddr_in local;

    std::memset(&local, 0, sizeof(local));

    local.sin_family = AF_INET;
    local.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, address.c_str(), &local.sin_addr) != 1)
    {
        throw socket_logic_error("invalid listening address: " + address);
    }

    sock_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock_ == INVALID_SOCKET)
    {
        throw socket_runtime_error("socket failed");
    }

    int option_value = 1;
    if (::setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR,
        &option_value, sizeof(option_value)) == SOCKET_ERROR)
    {
        close_preserving_errno(sock_);
        throw socket_runtime_error("setsockopt failed");
    }

    if (::bind(sock_, reinterpret_cast<sockaddr *>(&local), sizeof(local)) == SOCKET_ERROR)
    {
        close_preserving_errno(sock_);
        throw socket_runtime_error("bind failed");
    }

    if (::listen(sock_, backlog) == SOCKET_ERROR)
    {
        close_preserving_errno(sock_);
        throw socket_runtime_error("listen failed");
    }

    socklen_t len = sizeof(sockaddress_);
    std::memset(&sockaddress_, 0, sizeof(sockaddress_));
    if (::getsockname(sock_, reinterpret_cast<sockaddr *>(&sockaddress_), &len)
        == SOCKET_ERROR)
    {
        close_preserving_errno(sock_);
        throw socket_runtime_error("getsockname failed");
    }

    sockstate_ = LISTENING;
}

tcp_socket_wrapper::tcp_accepted_socket tcp_socket_wrapper::accept()
{
    if (sockstate_ != LISTENING)
    {
        throw socket_logic_error("socket not listening");
    }

    sockaddr_in from;
    socklen_t len = sizeof(from);

    std::memset(&from, 0, len);

    socket_type newsocket;
    do
    {
        newsocket = ::accept(sock_, reinterpret_cast<sockaddr *>(&from), &len);
    }
    while (newsocket == INVALID_SOCKET && errno == EINTR);

    if (newsocket == INVALID_SOCKET)
    {
        throw socket_runtime_error("accept failed");
    }

    int option_value = 1;
    if (::setsockopt(newsocket, IPPROTO_TCP, TCP_NODELAY,
        &option_value, sizeof(option_value)) == SOCKET_ERROR)
    {
        ::close(newsocket);
        throw socket_runtime_error("setsockopt failed");
    }

    return tcp_accepted_socket(newsocket, from);
}

int tcp_socket_wrapper::local_port() const
{
    if (sockstate_ != LISTENING)
    {
        throw socket_logic_error("socket not listening");
    }

    return ntohs(sockaddress_.sin_port);
}

void tcp_socket_wrapper::connect(const std::string & address, int port)
{
    if (sockstate_ != CLOSED)
    {
        throw socket_logic_error("socket not in CLOSED state");
    }

    std::memset(&sockaddress_, 0, sizeof(sockaddress_));
    sockaddress_.sin_family = AF_INET;
    sockaddress_.sin_port = htons(static_cast<uint16_t>(port));

    if (::inet_pton(AF_INET, address.c_str(), &sockaddress_.sin_addr) != 1)
    {
        addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo * found = NULL;
        if (::getaddrinfo(address.c_str(), NULL, &hints, &found) != 0 || found == NULL)
        {
            throw socket_runtime_error("cannot resolve address " + address);
        }

        sockaddress_.sin_addr =
            reinterpret_cast<sockaddr_in *>(found->ai_addr)->sin_addr;
        ::freeaddrinfo(found);
    }

    sock_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock_ == INVALID_SOCKET)
    {
        throw socket_runtime_error("socket failed");
    }

    if (::connect(sock_, reinterpret_cast<sockaddr *>(&sockaddress_), sizeof(sockaddress_))
        == SOCKET_ERROR)
    {
        close_preserving_errno(sock_);
        throw socket_runtime_error("connect failed");
    }

    int option_value = 1;
    if (::setsockopt(sock_, IPPROTO_TCP, TCP_NODELAY,
        &option_value, sizeof(option_value)) == SOCKET_ERROR)
    {
        close_preserving_errno(sock_);
        throw socket_runtime_error("setsockopt failed");
    }

    sockstate_ = CONNECTED;
}

std::string tcp_socket_wrapper::address() const
{
    if (sockstate_ != CONNECTED && sockstate_ != ACCEPTED)
    {
        throw socket_logic_error("socket not connected");
    }

    char buf[INET_ADDRSTRLEN];
    if (::inet_ntop(AF_INET, &sockaddress_.sin_addr, buf, sizeof(buf)) == NULL)
    {
        throw socket_runtime_error("inet_ntop failed");
    }

    return buf;
}

socket_stream_buffer::socket_stream_buffer(base_socket_wrapper & sock,
    std::size_t bufsize)
    : rsocket_(sock), inbuf_(bufsize), outbuf_(bufsize)
{
    setg(&inbuf_[0], &inbuf_[0], &inbuf_[0]);
    setp(&outbuf_[0], &outbuf_[0] + outbuf_.size());
}

void socket_stream_buffer::flush_output()
{
    std::size_t pending = static_cast<std::size_t>(pptr() - pbase());
    if (pending != 0)
    {
        rsocket_.write(pbase(), pending);
    }

    setp(&outbuf_[0], &outbuf_[0] + outbuf_.size());
}

socket_stream_buffer::int_type socket_stream_buffer::overflow(int_type c)
{
    // the put area is full, push it to the socket
    flush_output();

    if (traits_type::eq_int_type(c, traits_type::eof()) == false)
    {
        *pptr() = traits_type::to_char_type(c);
        pbump(1);
    }

    return traits_type::not_eof(c);
}

int socket_stream_buffer::sync()
{
    flush_output();
    return 0;
}

socket_stream_buffer::int_type socket_stream_buffer::underflow()
{
    if (gptr() < egptr())
    {
        return traits_type::to_int_type(*gptr());
    }

    std::size_t readn = rsocket_.read(&inbuf_[0], inbuf_.size());
    if (readn == 0)
    {
        return traits_type::eof();
    }

    setg(&inbuf_[0], &inbuf_[0], &inbuf_[0] + readn);

    return traits_type::to_int_type(*gptr());
}

void tcp_client_stream::shutdown_output()
{
    flush();
    isedmember_.shutdown_output();
}
