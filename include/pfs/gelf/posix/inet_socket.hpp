////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include <pfs/gelf/error.hpp>
#include <pfs/gelf/exports.hpp>
#include <pfs/gelf/namespace.hpp>
#include <pfs/gelf/send_result.hpp>
#include <pfs/gelf/socket4_addr.hpp>
#include <cstddef>

GELF__NAMESPACE_BEGIN

namespace posix {

/**
 * POSIX inet socket
 */
class inet_socket
{
public:
    using socket_id = int;
    static socket_id constexpr kINVALID_SOCKET = -1;

protected:
    enum class type_enum {
          unknown
        , stream = 0x001
        , dgram  = 0x002
    };

protected:
    socket_id _socket { kINVALID_SOCKET };

    // Peer address for connected socket.
    socket4_addr _saddr;

protected:
    /**
     * Constructs invalid POSIX socket
     */
    inet_socket ();

    /**
     * Constructs blocking POSIX socket.
     */
    inet_socket (type_enum socktype, error * perr = nullptr);

    inet_socket (inet_socket const &) = delete;
    inet_socket & operator = (inet_socket const &) = delete;

    GELF__EXPORT inet_socket (inet_socket &&) noexcept;
    GELF__EXPORT inet_socket & operator = (inet_socket &&) noexcept;

public:
    GELF__EXPORT ~inet_socket ();

public:
    /**
     *  Checks if socket is valid
     */
    GELF__EXPORT operator bool () const noexcept;

    GELF__EXPORT socket_id id () const noexcept;

    GELF__EXPORT socket4_addr saddr () const noexcept;

    /**
     * Sets the default destination for the socket. Datagram sockets are not
     * really connected, so no packet is sent by this call.
     */
    GELF__EXPORT bool connect (socket4_addr const & saddr, error * perr = nullptr);

    /**
     * Sends @a data message with @a len on a connected socket. Only one send
     * attempt is made.
     *
     * @param data Data to send.
     * @param len Data size to send.
     * @param perr Pointer to structure to store error if occurred.
     */
    GELF__EXPORT send_result send (char const * data, std::size_t len, error * perr = nullptr);
};

} // namespace posix

GELF__NAMESPACE_END
