////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include <cstdint>
#include <string>
#include <vector>

GELF__NAMESPACE_BEGIN

/**
 * @brief IPv4 address in native byte order.
 */
class inet4_addr
{
private:
    std::uint32_t _addr {0};

public:
    inet4_addr () = default;

    inet4_addr (std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d)
        : _addr(0)
    {
        _addr |= (static_cast<std::uint32_t>(a) << 24);
        _addr |= (static_cast<std::uint32_t>(b) << 16);
        _addr |= (static_cast<std::uint32_t>(c) << 8);
        _addr |= static_cast<std::uint32_t>(d);
    }

    inet4_addr (std::uint32_t a) : _addr(a)
    {}

    explicit operator std::uint32_t () const noexcept
    {
        return _addr;
    }

public: // static
    /**
     * Resolves @a hostname into the list of IPv4 addresses.
     *
     * @return Empty list on error if @a perr is not @c nullptr, otherwise throws
     *         @c gelf::error with @c errc::transport_error code.
     */
    static GELF__EXPORT std::vector<inet4_addr> resolve (std::string const & hostname
        , error * perr = nullptr);
};

/**
 * Converts IPv4 address to string in dotted-decimal notation.
 */
GELF__EXPORT std::string to_string (inet4_addr const & addr);

inline bool operator == (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) == static_cast<std::uint32_t>(b);
}

inline bool operator != (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) != static_cast<std::uint32_t>(b);
}

GELF__NAMESPACE_END
