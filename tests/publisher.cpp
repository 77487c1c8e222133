////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "tools.hpp"
#include "pfs/gelf/codec.hpp"
#include "pfs/gelf/publisher.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

using state_t = tools::recording_transport::state;

namespace {

gelf::publisher make_publisher (std::shared_ptr<state_t> s, int chunk_size = gelf::publisher::CHUNK_SIZE_WAN)
{
    gelf::publisher::options opts;
    opts.hostname = "graylog.local";
    opts.chunk_size = chunk_size;
    opts.send_delay = std::chrono::microseconds{0};

    return gelf::publisher {opts, std::unique_ptr<gelf::transport>{new tools::recording_transport{s}}};
}

gelf::errc code_of (std::function<void ()> f)
{
    try {
        f();
    } catch (gelf::error const & ex) {
        REQUIRE_EQ(ex.code().category(), gelf::get_error_category());
        return static_cast<gelf::errc>(ex.code().value());
    }

    return gelf::errc::success;
}

// Prepared payload size of the message after the version is stamped
std::size_t payload_size (gelf::message msg)
{
    msg.set_version(gelf::publisher::PROTOCOL_VERSION);
    return gelf::codec::prepare(msg).size();
}

} // namespace

TEST_CASE("configuration") {
    CHECK_EQ(code_of([] { gelf::publisher{""}; }), gelf::errc::configuration_error);
    CHECK_EQ(code_of([] { gelf::publisher{"   "}; }), gelf::errc::configuration_error);
    CHECK_EQ(code_of([] { gelf::publisher{"localhost", "abc"}; }), gelf::errc::configuration_error);
    CHECK_EQ(code_of([] { gelf::publisher{"localhost", ""}; }), gelf::errc::configuration_error);
    CHECK_EQ(code_of([] { gelf::publisher{"localhost", "70000"}; }), gelf::errc::configuration_error);
    CHECK_EQ(code_of([] { gelf::publisher{"localhost", "12201", "abc"}; }), gelf::errc::configuration_error);
    CHECK_EQ(code_of([] { gelf::publisher{"localhost", "12201", "0"}; }), gelf::errc::configuration_error);
    CHECK_EQ(code_of([] { gelf::publisher{"localhost", std::uint16_t{0}}; }), gelf::errc::configuration_error);
    CHECK_EQ(code_of([] { gelf::publisher{"localhost", std::uint16_t{12201}, -1}; }), gelf::errc::configuration_error);

    gelf::publisher p1 {"localhost"};
    CHECK_EQ(p1.opts().hostname, "localhost");
    CHECK_EQ(p1.opts().port, 12201);
    CHECK_EQ(p1.opts().chunk_size, 1420);
    CHECK(p1.opts().split_small_payload);

    gelf::publisher p2 {"localhost", "12202", "8154"};
    CHECK_EQ(p2.opts().port, 12202);
    CHECK_EQ(p2.opts().chunk_size, gelf::publisher::CHUNK_SIZE_LAN);
}

TEST_CASE("configuration error creates no transport") {
    auto s = std::make_shared<state_t>();
    gelf::publisher::options opts;
    opts.hostname = " ";

    CHECK_THROWS_AS(gelf::publisher(opts, std::unique_ptr<gelf::transport>{new tools::recording_transport{s}})
        , gelf::error);
    CHECK_EQ(s->connect_calls, 0);
}

TEST_CASE("validation") {
    auto s = std::make_shared<state_t>();
    auto pub = make_publisher(s);

    gelf::message msg;
    msg.set_host("app01");

    CHECK_EQ(code_of([&] { pub.publish(msg); }), gelf::errc::validation_error);

    msg.set_host("");
    msg.set_short_message("Disk is full");

    CHECK_EQ(code_of([&] { pub.publish(msg); }), gelf::errc::validation_error);

    CHECK_EQ(s->connect_calls, 0);
    CHECK(s->writes.empty());
    CHECK(msg.version().empty());
}

TEST_CASE("publish small message") {
    auto s = std::make_shared<state_t>();
    auto pub = make_publisher(s);

    gelf::message msg {"app01", "Disk is full"};
    msg.set_level(gelf::severity::error);

    pub.publish(msg);

    CHECK_EQ(msg.version(), "1.0");
    CHECK_EQ(s->connect_calls, 1);
    CHECK_EQ(s->hostname, "graylog.local");
    CHECK_EQ(s->port, 12201);

    // Small message is split in two
    REQUIRE_EQ(s->writes.size(), 2);

    auto c0 = tools::parse_datagram(s->writes[0]);
    auto c1 = tools::parse_datagram(s->writes[1]);

    CHECK_EQ(s->writes[0][0], '\x1E');
    CHECK_EQ(s->writes[0][1], '\x0F');
    CHECK_EQ(c0.group_id, c1.group_id);
    CHECK_EQ(c0.index, 0);
    CHECK_EQ(c1.index, 1);
    CHECK_EQ(c0.count, 2);
    CHECK_EQ(c1.count, 2);

    auto payload = tools::reassemble(s->writes);
    CHECK_EQ(payload, gelf::codec::prepare(msg));

    CHECK(c1.data.size() - c0.data.size() <= 1);

    auto json = gelf::codec::decompress(payload.data(), payload.size());
    CHECK_EQ(std::string(json.begin(), json.end()), gelf::codec::serialize(msg));
}

TEST_CASE("publish small message without split") {
    auto s = std::make_shared<state_t>();
    gelf::publisher::options opts;
    opts.hostname = "graylog.local";
    opts.split_small_payload = false;
    opts.send_delay = std::chrono::microseconds{0};

    gelf::publisher pub {opts, std::unique_ptr<gelf::transport>{new tools::recording_transport{s}}};
    gelf::message msg {"app01", "Disk is full"};

    pub.publish(msg);

    REQUIRE_EQ(s->writes.size(), 1);

    auto c0 = tools::parse_datagram(s->writes[0]);
    CHECK_EQ(c0.index, 0);
    CHECK_EQ(c0.count, 1);
    CHECK_EQ(c0.data, gelf::codec::prepare(msg));
}

TEST_CASE("publish large message") {
    auto s = std::make_shared<state_t>();
    auto pub = make_publisher(s, 100);

    gelf::message msg {"app01", "Disk is full"};
    msg.set_full_message(tools::random_text(1000));

    auto n = payload_size(msg);
    REQUIRE(n > 100);

    pub.publish(msg);

    auto expected_count = (n + 99) / 100;
    REQUIRE_EQ(s->writes.size(), expected_count);

    auto group_id = tools::parse_datagram(s->writes[0]).group_id;

    for (std::size_t i = 0; i < s->writes.size(); i++) {
        auto c = tools::parse_datagram(s->writes[i]);
        CHECK_EQ(c.group_id, group_id);
        CHECK_EQ(c.index, i);
        CHECK_EQ(c.count, expected_count);

        if (i + 1 < s->writes.size())
            CHECK_EQ(c.data.size(), 100);
    }

    CHECK_EQ(tools::reassemble(s->writes), gelf::codec::prepare(msg));
}

TEST_CASE("group identifiers differ between calls") {
    auto s = std::make_shared<state_t>();
    auto pub = make_publisher(s);
    gelf::message msg {"app01", "Disk is full"};
    std::set<std::string> ids;

    for (int i = 0; i < 10; i++)
        pub.publish(msg);

    REQUIRE_EQ(s->writes.size(), 20);

    for (auto const & d: s->writes)
        ids.insert(gelf::to_string(tools::parse_datagram(d).group_id));

    CHECK_EQ(ids.size(), 10);

    // Transport is connected only once
    CHECK_EQ(s->connect_calls, 1);
}

TEST_CASE("write failure aborts publishing") {
    gelf::message msg {"app01", "Disk is full"};
    msg.add_field("trace", tools::random_text(200));

    auto n = payload_size(msg);
    REQUIRE(n > 10);

    // Chunk size for exactly three chunks
    auto chunk_size = static_cast<int>((n + 2) / 3);

    for (std::int64_t failure_result: {std::int64_t{0}, std::int64_t{-1}}) {
        auto s = std::make_shared<state_t>();
        s->fail_write_index = 1;
        s->fail_write_result = failure_result;

        auto pub = make_publisher(s, chunk_size);

        try {
            pub.publish(msg);
            FAIL("Expected transmission error");
        } catch (gelf::transmission_error const & ex) {
            CHECK_EQ(ex.code(), gelf::make_error_code(gelf::errc::transmission_error));
            CHECK_EQ(ex.chunk_index(), 1);

            REQUIRE_EQ(s->writes.size(), 2);

            auto c0 = tools::parse_datagram(s->writes[0]);
            auto c1 = tools::parse_datagram(s->writes[1]);

            CHECK_EQ(c0.index, 0);
            CHECK_EQ(c1.index, 1);
            CHECK_EQ(c0.count, 3);
            CHECK_EQ(ex.group_id(), c0.group_id);
            CHECK_NE(std::string{ex.what()}.find(gelf::to_string(c0.group_id)), std::string::npos);
        }
    }
}

TEST_CASE("transport failure") {
    auto s = std::make_shared<state_t>();
    s->fail_connect = true;

    auto pub = make_publisher(s);
    gelf::message msg {"app01", "Disk is full"};

    CHECK_EQ(code_of([&] { pub.publish(msg); }), gelf::errc::transport_error);
    CHECK(s->writes.empty());

    // Connection is retried by next publish only
    CHECK_EQ(code_of([&] { pub.publish(msg); }), gelf::errc::transport_error);
    CHECK_EQ(s->connect_calls, 2);
}

TEST_CASE("too many chunks") {
    auto s = std::make_shared<state_t>();
    auto pub = make_publisher(s, 1);

    gelf::message msg {"app01", "Disk is full"};
    msg.set_full_message(tools::random_text(1000));

    REQUIRE(payload_size(msg) > 255);

    CHECK_EQ(code_of([&] { pub.publish(msg); }), gelf::errc::framing_error);
    CHECK_EQ(s->connect_calls, 0);
    CHECK(s->writes.empty());
}
