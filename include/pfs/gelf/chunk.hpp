////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Protocol: GELF chunked UDP
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

GELF__NAMESPACE_BEGIN

// Chunk datagram:
// +---------+---------+----------------+-----------------+-----------------+---------+
// | Magic 0 | Magic 1 | Group ID       | Sequence index  | Sequence count  | Data    |
// | 0x1E    | 0x0F    | 8 bytes        | 1 byte          | 1 byte          | ...     |
// +---------+---------+----------------+-----------------+-----------------+---------+
// Offsets:  0         1                2                 10                11        12

using chunk_group_id = transmission_error::group_id_type;

constexpr std::uint8_t CHUNK_MAGIC_0 = 0x1E;
constexpr std::uint8_t CHUNK_MAGIC_1 = 0x0F;
constexpr std::size_t CHUNK_HEADER_SIZE = 12;

// Receiver limit: sequence count is a single unsigned byte
constexpr std::size_t MAX_CHUNK_COUNT = 255;

struct chunk
{
    chunk_group_id group_id;
    std::uint8_t sequence_index;
    std::uint8_t sequence_count;
    char const * data; // Points into the framed payload
    std::size_t size;
};

/**
 * Generates new chunk group identifier: first 8 bytes of MD5 digest of the
 * current time (microsecond precision) concatenated with a random number.
 *
 * @throws gelf::error if digest calculation failed.
 */
GELF__EXPORT chunk_group_id generate_group_id ();

/**
 * Splits @a payload into chunks.
 *
 * @details If @a payload is larger than @a chunk_size it is split into pieces of
 *          @a chunk_size bytes (last piece may be shorter). Otherwise it is split
 *          into two halves if @a split_small_payload is @c true, or forms a
 *          single chunk.
 *
 *          Resulting chunks refer to @a payload data, so @a payload must outlive
 *          them.
 *
 * @throws gelf::error with @c errc::framing_error code if @a chunk_size is not
 *         positive, any piece is empty, or chunk count exceeds MAX_CHUNK_COUNT.
 */
GELF__EXPORT std::vector<chunk> frame (std::vector<char> const & payload, int chunk_size
    , chunk_group_id const & group_id, bool split_small_payload = true);

/**
 * Serializes chunk header and data into datagram.
 */
GELF__EXPORT std::vector<char> serialize (chunk const & c);

/**
 * Converts group identifier to hex string.
 */
GELF__EXPORT std::string to_string (chunk_group_id const & group_id);

GELF__NAMESPACE_END
