////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/gelf/chunk.hpp"
#include "pfs/gelf/error.hpp"
#include <pfs/i18n.hpp>

GELF__NAMESPACE_BEGIN

char const * error_category::name () const noexcept
{
    return "gelf::category";
}

std::string error_category::message (int ev) const
{
    switch (static_cast<errc>(ev)) {
        case errc::success:
            return tr::_("no error");
        case errc::invalid_argument:
            return tr::_("invalid argument");
        case errc::configuration_error:
            return tr::_("configuration error");
        case errc::validation_error:
            return tr::_("message validation error");
        case errc::codec_error:
            return tr::_("codec error");
        case errc::framing_error:
            return tr::_("framing error");
        case errc::transport_error:
            return tr::_("transport error");
        case errc::transmission_error:
            return tr::_("transmission error");

        default: return tr::_("unknown GELF error");
    }
}

transmission_error::transmission_error (group_id_type const & group_id, std::size_t chunk_index
    , std::size_t chunk_count)
    : error(make_error_code(errc::transmission_error)
        , tr::f_("unable to write chunk {} of {} (message id: {}) to socket"
            , chunk_index, chunk_count, to_string(group_id)))
    , _group_id(group_id)
    , _chunk_index(chunk_index)
{}

GELF__NAMESPACE_END
