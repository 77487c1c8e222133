////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

GELF__NAMESPACE_BEGIN

class transport
{
public:
    virtual ~transport () = default;

    virtual bool connected () const noexcept = 0;

    /**
     * Resolves @a hostname and opens datagram endpoint to @a hostname:@a port.
     * Does nothing if already connected.
     *
     * @throws gelf::error with @c errc::transport_error code.
     */
    virtual void connect (std::string const & hostname, std::uint16_t port) = 0;

    /**
     * Makes exactly one send attempt.
     *
     * @return Number of bytes written, @c 0 if nothing was written or @c -1 on
     *         failure.
     */
    virtual std::int64_t write (char const * data, std::size_t len) = 0;
};

GELF__NAMESPACE_END
