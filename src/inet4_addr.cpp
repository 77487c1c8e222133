////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/gelf/inet4_addr.hpp"
#include <pfs/fmt.hpp>

GELF__NAMESPACE_BEGIN

std::string to_string (inet4_addr const & addr)
{
    auto a = static_cast<std::uint32_t>(addr);

    return fmt::format("{}.{}.{}.{}"
        , (a >> 24) & 0xFF
        , (a >> 16) & 0xFF
        , (a >> 8) & 0xFF
        , a & 0xFF);
}

GELF__NAMESPACE_END
