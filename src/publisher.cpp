////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/gelf/chunk.hpp"
#include "pfs/gelf/codec.hpp"
#include "pfs/gelf/publisher.hpp"
#include "pfs/gelf/trace.hpp"
#include "pfs/gelf/udp_transport.hpp"
#include <pfs/i18n.hpp>
#include <pfs/integer.hpp>
#include <pfs/log.hpp>
#include <algorithm>
#include <cctype>
#include <limits>
#include <thread>

GELF__NAMESPACE_BEGIN

static char const * TAG = "gelf";

constexpr std::uint16_t publisher::DEFAULT_PORT;
constexpr int publisher::CHUNK_SIZE_WAN;
constexpr int publisher::CHUNK_SIZE_LAN;
constexpr char const * publisher::PROTOCOL_VERSION;

namespace {

template <typename IntT>
IntT parse_option (std::string const & text, IntT min_value, IntT max_value, char const * name)
{
    std::error_code ec;
    auto first = text.data();
    auto last = text.data() + text.size();

    auto value = pfs::to_integer(first, last, min_value, max_value, ec);

    if (ec || text.empty()) {
        throw error {
              make_error_code(errc::configuration_error)
            , tr::f_("{} must be an integer in range [{}, {}], got: '{}'"
                , name, min_value, max_value, text)
        };
    }

    return value;
}

void validate (publisher::options const & opts)
{
    auto blank = std::all_of(opts.hostname.begin(), opts.hostname.end(), [] (char ch) {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    });

    if (blank) {
        throw error {
              make_error_code(errc::configuration_error)
            , tr::_("host name must be set")
        };
    }

    if (opts.port == 0) {
        throw error {
              make_error_code(errc::configuration_error)
            , tr::_("port must be in range [1, 65535]")
        };
    }

    if (opts.chunk_size <= 0) {
        throw error {
              make_error_code(errc::configuration_error)
            , tr::f_("chunk size must be greater than 0, got: {}", opts.chunk_size)
        };
    }
}

publisher::options make_options (std::string hostname, std::uint16_t port, int chunk_size)
{
    publisher::options opts;
    opts.hostname = std::move(hostname);
    opts.port = port;
    opts.chunk_size = chunk_size;
    return opts;
}

} // namespace

publisher::publisher (options opts, std::unique_ptr<transport> t)
    : _opts(std::move(opts))
    , _transport(std::move(t))
{
    validate(_opts);

    // Socket is created on first publish
    if (!_transport)
        _transport.reset(new udp_transport);
}

publisher::publisher (std::string hostname, std::uint16_t port, int chunk_size)
    : publisher(make_options(std::move(hostname), port, chunk_size))
{}

publisher::publisher (std::string hostname, std::string const & port, std::string const & chunk_size)
    : publisher(make_options(std::move(hostname)
        , parse_option<std::uint16_t>(port, 1, std::numeric_limits<std::uint16_t>::max(), "port")
        , parse_option<int>(chunk_size, 1, std::numeric_limits<int>::max(), "chunk size")))
{}

publisher::publisher (publisher &&) = default;
publisher & publisher::operator = (publisher &&) = default;
publisher::~publisher () = default;

void publisher::publish (message & msg)
{
    if (!msg.has_required_fields()) {
        throw error {
              make_error_code(errc::validation_error)
            , tr::_("missing required data parameter: \"short_message\" and \"host\" are required")
        };
    }

    msg.set_version(PROTOCOL_VERSION);

    auto payload = codec::prepare(msg);
    auto group_id = generate_group_id();
    auto chunks = frame(payload, _opts.chunk_size, group_id, _opts.split_small_payload);

    _transport->connect(_opts.hostname, _opts.port);

    for (auto const & c: chunks) {
        auto datagram = serialize(c);
        auto n = _transport->write(datagram.data(), datagram.size());

        GELF__TRACE(TAG, "chunk {}/{} of message {}: {} bytes written"
            , c.sequence_index + 1, c.sequence_count, to_string(group_id), n);

        // Abort due to write error
        if (n <= 0) {
            LOGE(TAG, "publish message {} aborted on chunk {} of {}"
                , to_string(group_id), c.sequence_index, c.sequence_count);

            throw transmission_error {group_id, c.sequence_index, c.sequence_count};
        }
    }

    // Increases stability if messages are sent in a loop
    if (_opts.send_delay.count() > 0)
        std::this_thread::sleep_for(_opts.send_delay);
}

GELF__NAMESPACE_END
