////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include "transport.hpp"
#include "posix/udp_sender.hpp"
#include <memory>

GELF__NAMESPACE_BEGIN

/**
 * UDP transport. The socket is created by the first connect() call and closed
 * on destruction.
 */
class udp_transport: public transport
{
    std::unique_ptr<posix::udp_sender> _sender;

public:
    GELF__EXPORT udp_transport ();
    GELF__EXPORT ~udp_transport ();

    udp_transport (udp_transport const &) = delete;
    udp_transport & operator = (udp_transport const &) = delete;

public:
    GELF__EXPORT bool connected () const noexcept override;
    GELF__EXPORT void connect (std::string const & hostname, std::uint16_t port) override;
    GELF__EXPORT std::int64_t write (char const * data, std::size_t len) override;

    /**
     * Destination address, valid if connected.
     */
    GELF__EXPORT socket4_addr saddr () const noexcept;
};

GELF__NAMESPACE_END
