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
#include <nlohmann/json.hpp>
#include <pfs/optional.hpp>
#include <cstdint>
#include <string>

GELF__NAMESPACE_BEGIN

/// Syslog severity levels
enum class severity
{
      emergency = 0
    , alert
    , critical
    , error
    , warning
    , notice
    , informational
    , debug
};

/**
 * GELF message.
 *
 * @details Standard fields are serialized in fixed order: version, host,
 *          short_message, full_message, timestamp, level, facility, line, file.
 *          Unset optional fields are omitted. Additional fields follow in
 *          insertion order, their names are prefixed with underscore.
 */
class message
{
public:
    using map_type = nlohmann::ordered_json;

private:
    std::string _version;
    std::string _host;
    std::string _short_message;
    std::string _full_message;
    pfs::optional<double> _timestamp;
    pfs::optional<int> _level;
    std::string _facility;
    pfs::optional<int> _line;
    std::string _file;
    map_type _additional = map_type::object();

public:
    message () = default;

    message (std::string host, std::string short_message)
        : _host(std::move(host))
        , _short_message(std::move(short_message))
    {}

public:
    std::string const & version () const noexcept { return _version; }
    std::string const & host () const noexcept { return _host; }
    std::string const & short_message () const noexcept { return _short_message; }
    std::string const & full_message () const noexcept { return _full_message; }
    pfs::optional<double> timestamp () const noexcept { return _timestamp; }
    pfs::optional<int> level () const noexcept { return _level; }
    std::string const & facility () const noexcept { return _facility; }
    pfs::optional<int> line () const noexcept { return _line; }
    std::string const & file () const noexcept { return _file; }

    void set_version (std::string version) { _version = std::move(version); }
    void set_host (std::string host) { _host = std::move(host); }
    void set_short_message (std::string text) { _short_message = std::move(text); }
    void set_full_message (std::string text) { _full_message = std::move(text); }
    void set_timestamp (double seconds) { _timestamp = seconds; }
    void set_facility (std::string facility) { _facility = std::move(facility); }
    void set_line (int line) { _line = line; }
    void set_file (std::string file) { _file = std::move(file); }

    void set_level (severity level)
    {
        _level = static_cast<int>(level);
    }

    /**
     * Sets timestamp to the current system time.
     */
    GELF__EXPORT void stamp_time ();

    /**
     * Adds additional field or replaces the value of the existing one.
     * Underscore is prepended to @a name if it has no one.
     *
     * @throws gelf::error with @c errc::invalid_argument code if @a name is
     *         empty or reserved ("_id").
     */
    GELF__EXPORT void add_field (std::string name, std::string value);
    GELF__EXPORT void add_field (std::string name, char const * value);
    GELF__EXPORT void add_field (std::string name, std::int64_t value);
    GELF__EXPORT void add_field (std::string name, int value);
    GELF__EXPORT void add_field (std::string name, double value);

    map_type const & additional_fields () const noexcept
    {
        return _additional;
    }

    /**
     * Checks if "host" and "short_message" are set and not blank.
     */
    GELF__EXPORT bool has_required_fields () const;

    GELF__EXPORT map_type to_map () const;

private:
    std::string field_name (std::string name) const;
};

GELF__NAMESPACE_END
