////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/gelf/error.hpp"
#include "pfs/gelf/posix/inet_socket.hpp"
#include <pfs/endian.hpp>
#include <pfs/i18n.hpp>
#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

GELF__NAMESPACE_BEGIN

namespace posix {

constexpr inet_socket::socket_id inet_socket::kINVALID_SOCKET;

inet_socket::inet_socket () = default;

inet_socket::inet_socket (type_enum socktype, error * perr)
{
    int ai_family = AF_INET;
    int ai_socktype = -1;
    int ai_protocol = 0;

    switch (socktype) {
        case type_enum::stream:
            ai_socktype = SOCK_STREAM;
            break;
        case type_enum::dgram:
            ai_socktype = SOCK_DGRAM;
            break;
        default:
            break;
    }

    if (ai_socktype < 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::transport_error)
            , tr::_("bad/unsupported socket type")
        });

        return;
    }

    _socket = ::socket(ai_family, ai_socktype, ai_protocol);

    if (_socket < 0) {
        _socket = kINVALID_SOCKET;

        pfs::throw_or(perr, error {
              make_error_code(errc::transport_error)
            , tr::_("create INET socket failure")
            , pfs::system_error_text()
        });
    }
}

inet_socket::inet_socket (inet_socket && other) noexcept
    : _socket(other._socket)
    , _saddr(other._saddr)
{
    other._socket = kINVALID_SOCKET;
}

inet_socket & inet_socket::operator = (inet_socket && other) noexcept
{
    if (this != & other) {
        this->~inet_socket();
        _socket = other._socket;
        _saddr  = other._saddr;
        other._socket = kINVALID_SOCKET;
    }

    return *this;
}

inet_socket::~inet_socket ()
{
    if (_socket != kINVALID_SOCKET) {
        ::close(_socket);
        _socket = kINVALID_SOCKET;
    }
}

inet_socket::operator bool () const noexcept
{
    return _socket != kINVALID_SOCKET;
}

inet_socket::socket_id inet_socket::id () const noexcept
{
    return _socket;
}

socket4_addr inet_socket::saddr () const noexcept
{
    return _saddr;
}

bool inet_socket::connect (socket4_addr const & saddr, error * perr)
{
    sockaddr_in addr_in4;

    std::memset(& addr_in4, 0, sizeof(addr_in4));

    addr_in4.sin_family      = AF_INET;
    addr_in4.sin_port        = pfs::to_network_order(static_cast<std::uint16_t>(saddr.port));
    addr_in4.sin_addr.s_addr = pfs::to_network_order(static_cast<std::uint32_t>(saddr.addr));

    auto rc = ::connect(_socket
        , reinterpret_cast<sockaddr *>(& addr_in4)
        , sizeof(addr_in4));

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::transport_error)
            , tr::f_("connect socket failure: {}", to_string(saddr))
            , pfs::system_error_text()
        });

        return false;
    }

    _saddr = saddr;
    return true;
}

send_result inet_socket::send (char const * data, std::size_t len, error * perr)
{
    // MSG_NOSIGNAL flag means:
    // requests not to send SIGPIPE on errors on stream oriented sockets
    // when the other end breaks the connection.
    // The EPIPE error is still returned.
    auto n = ::send(_socket, data, len, MSG_NOSIGNAL);

    if (n < 0) {
        // man send:
        // The output queue for a network interface was full. This generally
        // indicates that the interface has stopped sending, but may be
        // caused by transient congestion.(Normally, this does not occur in
        // Linux. Packets are just silently dropped when a device queue
        // overflows.)
        if (errno == ENOBUFS)
            return send_result{send_status::overflow, n};

        if (errno == EAGAIN || (EAGAIN != EWOULDBLOCK && errno == EWOULDBLOCK))
            return send_result{send_status::again, n};

        if (errno == ECONNREFUSED || errno == ENETDOWN || errno == ENETUNREACH)
            return send_result{send_status::network, n};

        pfs::throw_or(perr, error {
              make_error_code(errc::transmission_error)
            , tr::f_("send to socket failure: {}", to_string(_saddr))
            , pfs::system_error_text()
        });

        return send_result{send_status::failure, n};
    }

    return send_result{send_status::good, static_cast<std::int64_t>(n)};
}

} // namespace posix

GELF__NAMESPACE_END
