//
// Copyright (C) 2001-2020 Maciej Sobczak
//
// This file declares wrappers that can be used
// as IOStream-compatible TCP/IP sockets.
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file Boost_Software_License_1_0.txt
// or copy at http://www.opensource.org/licenses/bsl1.0.html)
//

#ifndef ASSET_RELAY_SOCKETS_H_INCLUDED
#define ASSET_RELAY_SOCKETS_H_INCLUDED

#include <sys/types.h>
#include <netinet/in.h>

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <vector>

namespace asset_relay
{

// exception class which designates errors from socket functions
class socket_runtime_error : public std::runtime_error
{
public:
    explicit socket_runtime_error(const std::string & what);
    virtual ~socket_runtime_error() throw () { }

    virtual const char * what() const throw();
    int errornumber() const throw() { return errnum_; }

private:
    // this will serve as a message returned from what()
    mutable std::string msg_;
    int errnum_;
};

// exception class which designates logic (programming) errors with sockets
class socket_logic_error : public std::logic_error
{
public:
    explicit socket_logic_error(const std::string & what)
        : std::logic_error(what)
    {
    }
};

// this class is a base class for TCP sockets
class base_socket_wrapper
{
public:
    // socket is just a descriptor number
    typedef int socket_type;

    enum sockstate_type { CLOSED, LISTENING, ACCEPTED, CONNECTED };

    base_socket_wrapper() : sock_(-1), sockstate_(CLOSED) {}
    virtual ~base_socket_wrapper();

    // write data to the socket
    void write(const void * buf, std::size_t len);

    // read data from the socket
    // returns the number of bytes read (0 when the peer closed)
    std::size_t read(void * buf, std::size_t len);

    // stop both directions of the socket without releasing the descriptor;
    // a thread blocked in accept() on a listening socket is woken up
    void shutdown();

    // stop sending, the peer reads the end of stream
    void shutdown_output();

    // signal the end of output and discard whatever the peer still sends,
    // until it closes or timeout_ms elapses without new data
    void drain(int timeout_ms);

    void close();

protected:

    // proxy helper for syntax:
    // sock s2(s1.accept());
    template <class address_type, class socket_wrapper>
    class accepted_socket
    {
    public:
        accepted_socket(const accepted_socket & a)
            : sock_(a.sock_), addr_(a.addr_)
        {
        }

        accepted_socket(socket_type s, address_type a)
            : sock_(s), addr_(a)
        {
        }

        socket_type sock_;
        address_type addr_;

    private:
        // assignment not provided
        void operator=(const accepted_socket &);
    };

    template <class address_type, class socket_wrapper>
    base_socket_wrapper(const accepted_socket<address_type, socket_wrapper> & as)
        : sock_(as.sock_), sockstate_(ACCEPTED)
    {
    }

    socket_type sock_;
    sockstate_type sockstate_;

private:
    // not provided
    base_socket_wrapper(const base_socket_wrapper &);
    void operator=(const base_socket_wrapper &);
};

// this class serves as a socket wrapper
class tcp_socket_wrapper : public base_socket_wrapper
{
    typedef base_socket_wrapper::accepted_socket<sockaddr_in, tcp_socket_wrapper>
    tcp_accepted_socket;

public:

    tcp_socket_wrapper() {}

    // this is provided for syntax
    // tcp_socket_wrapper s2(s1.accept());
    tcp_socket_wrapper(const tcp_accepted_socket & as);

    // server methods

    // binds and listens on a given IPv4 address and port number,
    // port 0 selects an ephemeral port (see local_port())
    void listen(const std::string & address, int port, int backlog = 100);

    // accepts the new connection
    // it requires the earlier call to listen
    tcp_accepted_socket accept();

    // port number actually bound by listen()
    int local_port() const;

    // client methods

    // creates the new connection
    void connect(const std::string & address, int port);

    // general methods

    // get the network address of the peer
    std::string address() const;

private:
    // not for use
    tcp_socket_wrapper(const tcp_socket_wrapper &);
    void operator=(const tcp_socket_wrapper &);

    sockaddr_in sockaddress_;
};

// this class is supposed to serve as a stream buffer associated with a socket;
// the socket is neither owned nor flushed on destruction,
// flush the stream explicitly before closing the connection
class socket_stream_buffer : public std::streambuf
{
public:
    explicit socket_stream_buffer(base_socket_wrapper & sock,
        std::size_t bufsize = 4096);

protected:
    int_type overflow(int_type c);
    int sync();
    int_type underflow();

private:
    // not for use
    socket_stream_buffer(const socket_stream_buffer &);
    void operator=(const socket_stream_buffer &);

    void flush_output();

    base_socket_wrapper & rsocket_;
    std::vector<char> inbuf_;
    std::vector<char> outbuf_;
};

// this class is an ultimate stream associated with a socket
class tcp_stream :
    private socket_stream_buffer,
    public std::iostream
{
public:
    explicit tcp_stream(base_socket_wrapper & sock)
        : socket_stream_buffer(sock),
          std::iostream(static_cast<socket_stream_buffer *>(this))
    {
    }

private:
    // not for use
    tcp_stream(const tcp_stream &);
    void operator=(const tcp_stream &);
};

namespace sockets_details
{

// helper type for hiding conflicting names
    template <class isolated>
    struct base_class_isolator
    {
        isolated isedmember_;
    };

} // namespace sockets_details

// specialized for use as a TCP client
class tcp_client_stream :
    private sockets_details::base_class_isolator<tcp_socket_wrapper>,
    public tcp_stream
{
public:

    tcp_client_stream(const std::string & address, int port)
        : tcp_stream(isedmember_)
    {
        isedmember_.connect(address, port);
    }

    // flush pending output and half-close,
    // the peer sees the end of the request
    void shutdown_output();

private:
    // not for use
    tcp_client_stream(const tcp_client_stream &);
    void operator=(const tcp_client_stream &);
};

} // namespace asset_relay

#endif // ASSET_RELAY_SOCKETS_H_INCLUDED
