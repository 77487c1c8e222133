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
#include "pfs/gelf/message.hpp"
#include <string>
#include <vector>

TEST_CASE("required fields") {
    gelf::message msg;
    CHECK_FALSE(msg.has_required_fields());

    msg.set_host("app01");
    CHECK_FALSE(msg.has_required_fields());

    msg.set_short_message("   ");
    CHECK_FALSE(msg.has_required_fields());

    msg.set_short_message("Disk is full");
    CHECK(msg.has_required_fields());

    msg.set_host("\t\n");
    CHECK_FALSE(msg.has_required_fields());

    gelf::message msg1 {"app01", "Disk is full"};
    CHECK(msg1.has_required_fields());
}

TEST_CASE("field order") {
    gelf::message msg {"app01", "Disk is full"};

    msg.add_field("request_id", "r-42");
    msg.set_file("storage.cpp");
    msg.set_line(117);
    msg.set_facility("storage");
    msg.set_level(gelf::severity::critical);
    msg.set_timestamp(1700000000.5);
    msg.set_full_message("Disk /dev/sda1 is full");
    msg.set_version("1.0");
    msg.add_field("_attempt", 3);

    auto m = msg.to_map();

    std::vector<std::string> keys;

    for (auto const & item: m.items())
        keys.push_back(item.key());

    CHECK_EQ(keys, std::vector<std::string>{"version", "host", "short_message", "full_message"
        , "timestamp", "level", "facility", "line", "file", "_request_id", "_attempt"});

    CHECK_EQ(m["level"].get<int>(), 2);
    CHECK_EQ(m["line"].get<int>(), 117);
    CHECK_EQ(m["_attempt"].get<std::int64_t>(), 3);
    CHECK_EQ(m["_request_id"].get<std::string>(), "r-42");
}

TEST_CASE("unset optional fields are omitted") {
    gelf::message msg {"app01", "Disk is full"};

    auto m = msg.to_map();

    CHECK_EQ(m.size(), 2);
    CHECK(m.contains("host"));
    CHECK(m.contains("short_message"));
    CHECK_FALSE(m.contains("version"));
    CHECK_FALSE(m.contains("timestamp"));
}

TEST_CASE("additional fields") {
    gelf::message msg {"app01", "Disk is full"};

    msg.add_field("user", "alice");
    msg.add_field("ratio", 0.75);
    msg.add_field("user", "bob");

    auto const & fields = msg.additional_fields();

    REQUIRE_EQ(fields.size(), 2);
    CHECK_EQ(fields["_user"].get<std::string>(), "bob");
    CHECK_EQ(fields["_ratio"].get<double>(), doctest::Approx(0.75));

    CHECK_EQ(fields.begin().key(), "_user");

    CHECK_THROWS_AS(msg.add_field("", "x"), gelf::error);
    CHECK_THROWS_AS(msg.add_field("_", "x"), gelf::error);
    CHECK_THROWS_AS(msg.add_field("id", "x"), gelf::error);
    CHECK_THROWS_AS(msg.add_field("_id", "x"), gelf::error);
}

TEST_CASE("timestamp") {
    gelf::message msg {"app01", "Disk is full"};

    CHECK_FALSE(msg.timestamp());

    msg.stamp_time();

    REQUIRE(msg.timestamp());
    CHECK(*msg.timestamp() > 1.6e9);
}
