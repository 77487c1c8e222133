////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "inet_socket.hpp"

GELF__NAMESPACE_BEGIN

namespace posix {

/**
 * POSIX UDP sender socket
 */
class udp_sender: public inet_socket
{
public:
    udp_sender (udp_sender const & s) = delete;
    udp_sender & operator = (udp_sender const & s) = delete;

    /**
     * Constructs UDP sender.
     *
     * @throws gelf::error with @c errc::transport_error if @a perr is @c nullptr
     *         and the socket could not be created.
     */
    GELF__EXPORT udp_sender (error * perr = nullptr);

    GELF__EXPORT udp_sender (udp_sender && s) noexcept;
    GELF__EXPORT udp_sender & operator = (udp_sender && s) noexcept;
    GELF__EXPORT ~udp_sender ();
};

} // namespace posix

GELF__NAMESPACE_END
