////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/gelf/message.hpp"
#include <pfs/i18n.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>

GELF__NAMESPACE_BEGIN

namespace {

bool is_blank (std::string const & s)
{
    return std::all_of(s.begin(), s.end(), [] (char ch) {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    });
}

} // namespace

void message::stamp_time ()
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count();
    _timestamp = static_cast<double>(micros) / 1000000.0;
}

std::string message::field_name (std::string name) const
{
    if (name.empty() || name == "_") {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::_("additional field name must not be empty")
        };
    }

    if (name[0] != '_')
        name.insert(name.begin(), '_');

    // Reserved by GELF specification
    if (name == "_id") {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::f_("additional field name is reserved: {}", name)
        };
    }

    return name;
}

void message::add_field (std::string name, std::string value)
{
    _additional[field_name(std::move(name))] = std::move(value);
}

void message::add_field (std::string name, char const * value)
{
    add_field(std::move(name), std::string{value == nullptr ? "" : value});
}

void message::add_field (std::string name, std::int64_t value)
{
    _additional[field_name(std::move(name))] = value;
}

void message::add_field (std::string name, int value)
{
    add_field(std::move(name), static_cast<std::int64_t>(value));
}

void message::add_field (std::string name, double value)
{
    _additional[field_name(std::move(name))] = value;
}

bool message::has_required_fields () const
{
    return !is_blank(_host) && !is_blank(_short_message);
}

message::map_type message::to_map () const
{
    auto m = map_type::object();

    if (!_version.empty())
        m["version"] = _version;

    m["host"] = _host;
    m["short_message"] = _short_message;

    if (!_full_message.empty())
        m["full_message"] = _full_message;

    if (_timestamp)
        m["timestamp"] = *_timestamp;

    if (_level)
        m["level"] = *_level;

    if (!_facility.empty())
        m["facility"] = _facility;

    if (_line)
        m["line"] = *_line;

    if (!_file.empty())
        m["file"] = _file;

    for (auto const & item: _additional.items())
        m[item.key()] = item.value();

    return m;
}

GELF__NAMESPACE_END
