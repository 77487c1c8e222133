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
#include "transport.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

GELF__NAMESPACE_BEGIN

/**
 * Publishes GELF messages to Graylog server over UDP.
 *
 * @details Each message is split into chunks sent as separate datagrams.
 *          Publishing is aborted on the first failed chunk write; chunks
 *          already sent are not recalled and remaining ones are not sent.
 *          There are no retries.
 *
 *          Publisher instance is not thread-safe: chunks of messages published
 *          concurrently may interleave on the wire.
 */
class publisher
{
public:
    static constexpr std::uint16_t DEFAULT_PORT = 12201;
    static constexpr int CHUNK_SIZE_WAN = 1420;
    static constexpr int CHUNK_SIZE_LAN = 8154;
    static constexpr char const * PROTOCOL_VERSION = "1.0";

    struct options
    {
        std::string hostname;
        std::uint16_t port {DEFAULT_PORT};
        int chunk_size {CHUNK_SIZE_WAN};

        // Split a payload that fits into one chunk in two halves. The write
        // primitive of some platforms reports failure only on every second
        // write attempt, so a lone chunk write may fail silently. Disable for
        // transports with reliable write confirmation.
        bool split_small_payload {true};

        // Pause after successfully published message.
        std::chrono::microseconds send_delay {20};
    };

private:
    options _opts;
    std::unique_ptr<transport> _transport;

public:
    /**
     * @throws gelf::error with @c errc::configuration_error code.
     */
    GELF__EXPORT publisher (options opts, std::unique_ptr<transport> t = nullptr);

    /**
     * @throws gelf::error with @c errc::configuration_error code.
     */
    GELF__EXPORT publisher (std::string hostname, std::uint16_t port = DEFAULT_PORT
        , int chunk_size = CHUNK_SIZE_WAN);

    /**
     * Constructs publisher from textual @a port and @a chunk_size.
     *
     * @throws gelf::error with @c errc::configuration_error code if @a hostname
     *         is blank, @a port or @a chunk_size is not a number.
     */
    GELF__EXPORT publisher (std::string hostname, std::string const & port
        , std::string const & chunk_size = std::to_string(CHUNK_SIZE_WAN));

    publisher (publisher const &) = delete;
    publisher & operator = (publisher const &) = delete;

    GELF__EXPORT publisher (publisher &&);
    GELF__EXPORT publisher & operator = (publisher &&);
    GELF__EXPORT ~publisher ();

public:
    options const & opts () const noexcept
    {
        return _opts;
    }

    /**
     * Stamps protocol version on @a msg and sends it.
     *
     * @throws gelf::error with @c errc::validation_error, @c errc::framing_error,
     *         @c errc::codec_error or @c errc::transport_error code.
     * @throws gelf::transmission_error if a chunk could not be written.
     */
    GELF__EXPORT void publish (message & msg);
};

GELF__NAMESPACE_END
