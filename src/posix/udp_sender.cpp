////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/gelf/posix/udp_sender.hpp"

GELF__NAMESPACE_BEGIN

namespace posix {

udp_sender::udp_sender (error * perr) : inet_socket(type_enum::dgram, perr) {}

udp_sender::udp_sender (udp_sender && s) noexcept
    : inet_socket(std::move(s))
{}

udp_sender & udp_sender::operator = (udp_sender && s) noexcept
{
    inet_socket::operator = (std::move(s));
    return *this;
}

udp_sender::~udp_sender () = default;

} // namespace posix

GELF__NAMESPACE_END
