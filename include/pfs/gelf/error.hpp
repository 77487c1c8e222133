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
#include "namespace.hpp"
#include <pfs/error.hpp>
#include <array>
#include <cstddef>
#include <string>

GELF__NAMESPACE_BEGIN

using error_code = std::error_code;

enum class errc
{
      success = 0
    , invalid_argument     // Bad argument passed to the message model
    , configuration_error  // Bad publisher configuration (blank host name, bad port or chunk size)
    , validation_error     // Message has no required fields
    , codec_error          // Serialization or compression failure
    , framing_error        // Bad chunking parameters or too many chunks
    , transport_error      // Host name resolution or socket creation failure
    , transmission_error   // Chunk write failure
};

class error_category : public std::error_category
{
public:
    GELF__EXPORT virtual char const * name () const noexcept override;
    GELF__EXPORT virtual std::string message (int ev) const override;
};

inline std::error_category const & get_error_category ()
{
    static error_category instance;
    return instance;
}

inline std::error_code make_error_code (errc e)
{
    return std::error_code(static_cast<int>(e), get_error_category());
}

class error: public pfs::error
{
public:
    using pfs::error::error;
};

/**
 * Chunk write failure. Carries the identifier of the chunk group and the index
 * of the chunk that could not be written.
 */
class transmission_error: public error
{
public:
    using group_id_type = std::array<char, 8>;

private:
    group_id_type _group_id;
    std::size_t _chunk_index {0};

public:
    GELF__EXPORT transmission_error (group_id_type const & group_id, std::size_t chunk_index
        , std::size_t chunk_count);

    group_id_type const & group_id () const noexcept
    {
        return _group_id;
    }

    std::size_t chunk_index () const noexcept
    {
        return _chunk_index;
    }
};

GELF__NAMESPACE_END
