////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/gelf/trace.hpp"
#include "pfs/gelf/udp_transport.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>

GELF__NAMESPACE_BEGIN

static char const * TAG = "gelf";

udp_transport::udp_transport () = default;

udp_transport::~udp_transport () = default;

bool udp_transport::connected () const noexcept
{
    return _sender != nullptr;
}

void udp_transport::connect (std::string const & hostname, std::uint16_t port)
{
    if (_sender)
        return;

    auto addrs = inet4_addr::resolve(hostname);

    std::unique_ptr<posix::udp_sender> sender {new posix::udp_sender};
    sender->connect(socket4_addr{addrs.front(), port});

    _sender = std::move(sender);

    LOGD(TAG, "UDP endpoint connected: {} ({})", to_string(_sender->saddr()), hostname);
}

std::int64_t udp_transport::write (char const * data, std::size_t len)
{
    if (!_sender) {
        throw error {
              make_error_code(errc::transport_error)
            , tr::_("transport is not connected")
        };
    }

    error err;
    auto res = _sender->send(data, len, & err);

    switch (res.state) {
        case send_status::good:
            return res.n;

        case send_status::again:
        case send_status::overflow:
            GELF__TRACE(TAG, "send buffer is full, datagram is not sent: {} bytes", len);
            return 0;

        case send_status::network:
        case send_status::failure:
        default:
            GELF__TRACE(TAG, "send failure: {}", err ? err.what() : "network error");
            return -1;
    }
}

socket4_addr udp_transport::saddr () const noexcept
{
    return _sender ? _sender->saddr() : socket4_addr{};
}

GELF__NAMESPACE_END
