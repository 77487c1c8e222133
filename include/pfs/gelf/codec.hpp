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
#include "message.hpp"
#include "namespace.hpp"
#include <string>
#include <vector>

GELF__NAMESPACE_BEGIN

namespace codec {

/**
 * Serializes @a msg into compact JSON preserving the field order of the model.
 *
 * @throws gelf::error with @c errc::codec_error code (e.g. on invalid UTF-8).
 */
GELF__EXPORT std::string serialize (message const & msg);

/**
 * Compresses @a data in zlib stream format (RFC 1950).
 *
 * @throws gelf::error with @c errc::codec_error code.
 */
GELF__EXPORT std::vector<char> compress (char const * data, std::size_t len);

/**
 * Inflates zlib stream produced by compress().
 *
 * @throws gelf::error with @c errc::codec_error code on corrupted input.
 */
GELF__EXPORT std::vector<char> decompress (char const * data, std::size_t len);

/**
 * Serializes and compresses @a msg.
 */
inline std::vector<char> prepare (message const & msg)
{
    auto json = serialize(msg);
    return compress(json.data(), json.size());
}

} // namespace codec

GELF__NAMESPACE_END
