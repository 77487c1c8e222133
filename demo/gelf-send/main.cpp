////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include <pfs/argvapi.hpp>
#include <pfs/filesystem.hpp>
#include <pfs/fmt.hpp>
#include <pfs/integer.hpp>
#include <pfs/log.hpp>
#include <pfs/string_view.hpp>
#include <pfs/gelf/publisher.hpp>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

using pfs::to_string;
static char const * TAG = "gelf-send";

static void print_usage (pfs::filesystem::path const & programName
    , std::string const & errorString = std::string{})
{
    if (!errorString.empty())
        LOGE(TAG, "{}", errorString);

    fmt::println("Usage:\n\n"
        "{0} --help | -h\n"
        "{0} --host=HOST [--port=PORT] [--chunk-size=SIZE | --lan] [--source=NAME]\n"
        "\t[--level=LEVEL] [--facility=NAME] [--no-split] [--field=KEY=VALUE]...\n"
        "\tSHORT_MESSAGE [FULL_MESSAGE]\n\n"

        "Options:\n\n"
        "--help | -h\n"
        "\tPrint this help and exit\n"
        "--host=HOST\n"
        "\tGraylog server host name or address\n"
        "--port=PORT\n"
        "\tGraylog server GELF UDP input port (default is 12201)\n"
        "--chunk-size=SIZE\n"
        "\tMaximum chunk payload size (default is 1420 for WAN)\n"
        "--lan\n"
        "\tUse chunk size suitable for LAN (8154)\n"
        "--source=NAME\n"
        "\tValue for `host` field of the message (default is local host name)\n"
        "--level=LEVEL\n"
        "\tSyslog severity level from 0 (emergency) to 7 (debug)\n"
        "--facility=NAME\n"
        "\tFacility name\n"
        "--no-split\n"
        "\tSend small message in a single chunk\n"
        "--field=KEY=VALUE\n"
        "\tAdditional field (can be repeated)\n\n"

        "Examples:\n\n"
        "  {0} --host=graylog.local --level=3 --field=app=billing \"Payment failed\"\n"
        , programName);
}

static std::string local_host_name ()
{
    char buf[256];

    if (::gethostname(buf, sizeof(buf)) != 0)
        return std::string{"localhost"};

    buf[sizeof(buf) - 1] = '\0';
    return std::string{buf};
}

int main (int argc, char * argv[])
{
    gelf::publisher::options opts;
    std::string source = local_host_name();
    int level = -1;
    std::string facility;
    std::vector<std::pair<std::string, std::string>> fields;
    std::vector<std::string> texts;

    auto commandLine = pfs::make_argvapi(argc, argv);
    auto programName = commandLine.program_name();
    auto commandLineIterator = commandLine.begin();

    if (!commandLineIterator.has_more()) {
        print_usage(programName);
        return EXIT_SUCCESS;
    }

    while (commandLineIterator.has_more()) {
        auto x = commandLineIterator.next();
        auto expectedArgError = false;

        if (x.is_option("help") || x.is_option("h")) {
            print_usage(programName);
            return EXIT_SUCCESS;
        } else if (x.is_option("host")) {
            if (x.has_arg())
                opts.hostname = to_string(x.arg());
            else
                expectedArgError = true;
        } else if (x.is_option("port")) {
            if (x.has_arg()) {
                std::error_code ec;
                opts.port = pfs::to_integer(x.arg().begin(), x.arg().end(), std::uint16_t{1}
                    , std::uint16_t{65535}, ec);

                if (ec) {
                    LOGE(TAG, "Bad port: {}", ec.message());
                    return EXIT_FAILURE;
                }
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("chunk-size")) {
            if (x.has_arg()) {
                std::error_code ec;
                opts.chunk_size = pfs::to_integer(x.arg().begin(), x.arg().end(), int{1}
                    , std::numeric_limits<int>::max(), ec);

                if (ec) {
                    LOGE(TAG, "Bad chunk size: {}", ec.message());
                    return EXIT_FAILURE;
                }
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("lan")) {
            opts.chunk_size = gelf::publisher::CHUNK_SIZE_LAN;
        } else if (x.is_option("no-split")) {
            opts.split_small_payload = false;
        } else if (x.is_option("source")) {
            if (x.has_arg())
                source = to_string(x.arg());
            else
                expectedArgError = true;
        } else if (x.is_option("facility")) {
            if (x.has_arg())
                facility = to_string(x.arg());
            else
                expectedArgError = true;
        } else if (x.is_option("level")) {
            if (x.has_arg()) {
                std::error_code ec;
                level = pfs::to_integer(x.arg().begin(), x.arg().end(), int{0}, int{7}, ec);

                if (ec) {
                    LOGE(TAG, "Bad level: {}", ec.message());
                    return EXIT_FAILURE;
                }
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("field")) {
            if (x.has_arg()) {
                auto kv = to_string(x.arg());
                auto pos = kv.find('=');

                if (pos == std::string::npos || pos == 0) {
                    LOGE(TAG, "Bad field, expected KEY=VALUE: {}", kv);
                    return EXIT_FAILURE;
                }

                fields.emplace_back(kv.substr(0, pos), kv.substr(pos + 1));
            } else {
                expectedArgError = true;
            }
        } else if (!x.optname().empty()) {
            print_usage(programName, fmt::format("Bad option: {}", to_string(x.optname())));
            return EXIT_FAILURE;
        } else {
            texts.push_back(to_string(x.arg()));
        }

        if (expectedArgError) {
            print_usage(programName, fmt::format("Expected argument for option: {}"
                , to_string(x.optname())));
            return EXIT_FAILURE;
        }
    }

    if (texts.empty() || texts.size() > 2) {
        print_usage(programName, "Expected short message and optional full message");
        return EXIT_FAILURE;
    }

    try {
        gelf::publisher pub {std::move(opts)};
        gelf::message msg {source, texts[0]};

        if (texts.size() > 1)
            msg.set_full_message(texts[1]);

        if (level >= 0)
            msg.set_level(static_cast<gelf::severity>(level));

        if (!facility.empty())
            msg.set_facility(facility);

        for (auto const & f: fields)
            msg.add_field(f.first, f.second);

        msg.stamp_time();
        pub.publish(msg);

        LOGI(TAG, "Message published to {}:{}", pub.opts().hostname, pub.opts().port);
    } catch (gelf::transmission_error const & ex) {
        LOGE(TAG, "Chunk {} not sent: {}", ex.chunk_index(), ex.what());
        return EXIT_FAILURE;
    } catch (gelf::error const & ex) {
        LOGE(TAG, "{}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
