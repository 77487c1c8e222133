////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/gelf/codec.hpp"
#include <pfs/i18n.hpp>
#include <zlib.h>
#include <cstring>

GELF__NAMESPACE_BEGIN

namespace codec {

std::string serialize (message const & msg)
{
    try {
        return msg.to_map().dump();
    } catch (nlohmann::json::exception const & ex) {
        throw error {
              make_error_code(errc::codec_error)
            , tr::_("serialize message to JSON failure")
            , ex.what()
        };
    }
}

std::vector<char> compress (char const * data, std::size_t len)
{
    auto bound = compressBound(static_cast<uLong>(len));
    std::vector<char> result(bound);
    uLongf result_len = bound;

    auto rc = compress2(reinterpret_cast<Bytef *>(result.data()), & result_len
        , reinterpret_cast<Bytef const *>(data), static_cast<uLong>(len)
        , Z_DEFAULT_COMPRESSION);

    if (rc != Z_OK) {
        throw error {
              make_error_code(errc::codec_error)
            , tr::_("compress message failure")
            , zError(rc)
        };
    }

    result.resize(result_len);
    return result;
}

std::vector<char> decompress (char const * data, std::size_t len)
{
    z_stream zs;
    std::memset(& zs, 0, sizeof(zs));

    auto rc = inflateInit(& zs);

    if (rc != Z_OK) {
        throw error {
              make_error_code(errc::codec_error)
            , tr::_("initialize inflate stream failure")
            , zError(rc)
        };
    }

    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data));
    zs.avail_in = static_cast<uInt>(len);

    std::vector<char> result;
    char buffer[4096];

    do {
        zs.next_out = reinterpret_cast<Bytef *>(buffer);
        zs.avail_out = sizeof(buffer);

        rc = inflate(& zs, Z_NO_FLUSH);

        if (rc != Z_OK && rc != Z_STREAM_END) {
            // Z_BUF_ERROR here means truncated input
            std::string cause = zs.msg != nullptr ? std::string{zs.msg} : std::string{zError(rc)};
            inflateEnd(& zs);

            throw error {
                  make_error_code(errc::codec_error)
                , tr::_("decompress message failure")
                , cause
            };
        }

        result.insert(result.end(), buffer, buffer + (sizeof(buffer) - zs.avail_out));
    } while (rc != Z_STREAM_END);

    inflateEnd(& zs);

    return result;
}

} // namespace codec

GELF__NAMESPACE_END
