////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "inet4_addr.hpp"
#include "namespace.hpp"
#include <cstdint>
#include <string>

GELF__NAMESPACE_BEGIN

struct socket4_addr
{
    inet4_addr    addr;
    std::uint16_t port {0};
};

inline std::string to_string (socket4_addr const & saddr)
{
    return to_string(saddr.addr) + ':' + std::to_string(saddr.port);
}

inline bool operator == (socket4_addr const & a, socket4_addr const & b)
{
    return a.addr == b.addr && a.port == b.port;
}

inline bool operator != (socket4_addr const & a, socket4_addr const & b)
{
    return a.addr != b.addr || a.port != b.port;
}

GELF__NAMESPACE_END
