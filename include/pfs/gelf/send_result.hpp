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
#include <cstdint>

GELF__NAMESPACE_BEGIN

enum class send_status {
      failure   = -1
    , good      =  0
    , again     =  1
    , overflow  =  2

    // Connection refused by peer (ECONNREFUSED, reported by a connected
    // datagram socket after an ICMP port unreachable)
    // Network is down (ENETDOWN)
    // Network is unreachable (ENETUNREACH)
    , network   =  3
};

struct send_result
{
    send_status state;
    std::int64_t n;
};

GELF__NAMESPACE_END
