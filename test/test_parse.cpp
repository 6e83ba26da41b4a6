// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <vector>

using namespace suuid;
using namespace std::literals;

namespace {

    auto parse_failure_of(std::string_view text) -> std::optional<parse_error> {
        try {
            (void)uuid::parse(text);
        } catch (const parse_error & ex) {
            return ex;
        }
        return std::nullopt;
    }
}

TEST_SUITE("parse") {

TEST_CASE("version and variant pattern") {
    auto u = uuid::parse("00000000-0000-1000-8000-000000000000");

    constexpr std::array<uint8_t, 16> expected = {0, 0, 0, 0, 0, 0, 0x10, 0, 0x80, 0, 0, 0, 0, 0, 0, 0};
    CHECK(u.bytes == expected);
    CHECK(u.get_type() == uuid::type::time_based);
    CHECK(u.get_variant() == uuid::variant::standard);
}

TEST_CASE("accepted forms") {
    constexpr uuid expected("7d444840-9dc0-11d1-b245-5ffdce74fad2");

    CHECK(uuid::parse("7d444840-9dc0-11d1-b245-5ffdce74fad2") == expected);
    CHECK(uuid::parse("7d4448409dc011d1b2455ffdce74fad2") == expected);
    CHECK(uuid::parse("{7d444840-9dc0-11d1-b245-5ffdce74fad2}") == expected);
    CHECK(uuid::parse("urn:uuid:7d444840-9dc0-11d1-b245-5ffdce74fad2") == expected);
    CHECK(uuid::parse("URN:UUID:7D444840-9DC0-11D1-B245-5FFDCE74FAD2") == expected);
    CHECK(uuid::parse("Urn:Uuid:7d444840-9DC0-11d1-B245-5ffdce74fad2") == expected);

    static_assert(uuid::from_chars("{7d444840-9dc0-11d1-b245-5ffdce74fad2}").value() == expected);
    static_assert(uuid::from_chars("7D4448409DC011D1B2455FFDCE74FAD2").value() == expected);
}

TEST_CASE("rejected length") {
    CHECK(!uuid::from_chars(""));
    CHECK(!uuid::from_chars("7d444840-9dc0-11d1-b245-5ffdce74fad"));
    CHECK(!uuid::from_chars("7d444840-9dc0-11d1-b245-5ffdce74fad2 "));
    CHECK(!uuid::from_chars("7d4448409dc011d1b2455ffdce74fad"));

    auto err = parse_failure_of("7d444840-9dc0-11d1-b245-5ffdce74fad");
    REQUIRE(err);
    CHECK(err->failure() == parse_failure::length);
    CHECK(err->length() == 35);
    CHECK(err->position() == 35);
    CHECK(err->code() == errc::malformed_input);
    CHECK(std::string_view(err->what()).find("35") != std::string_view::npos);
}

TEST_CASE("rejected hyphens") {
    CHECK(!uuid::from_chars("7d4448409-dc0-11d1-b245-5ffdce74fad2"));
    CHECK(!uuid::from_chars("7d444840-9dc0-11d1-b245-5ffdce74fad2-"));
    CHECK(!uuid::from_chars("7d444840-9dc0-11d1-b2455-ffdce74fad2"));

    auto err = parse_failure_of("7d4448409-dc0-11d1-b245-5ffdce74fad2");
    REQUIRE(err);
    CHECK(err->failure() == parse_failure::hyphen);
    CHECK(err->position() == 8);

    err = parse_failure_of("{7d444840-9dc0-11d1-b2455-ffdce74fad2}");
    REQUIRE(err);
    CHECK(err->failure() == parse_failure::hyphen);
    CHECK(err->position() == 24);

    err = parse_failure_of("urn:uuid:7d444840-9dc0-11d1-b245+5ffdce74fad2");
    REQUIRE(err);
    CHECK(err->failure() == parse_failure::hyphen);
    CHECK(err->position() == 32);
}

TEST_CASE("rejected hex digits") {
    CHECK(!uuid::from_chars("7d444840-9dc0-11d1-b245-5ffdce74fadg"));
    CHECK(!uuid::from_chars("7d444840-9dc0-11d1-b2 5-5ffdce74fad2"));
    CHECK(!uuid::from_chars("7d4448409dc011d1b2455ffdce74fa-2"));
    CHECK(!uuid::from_chars("7d444840-9dc0-11d1-b245-5ffdce74fa\xff" "2"));

    auto err = parse_failure_of("7d444840-9dc0-11d1-b245-5ffdce74fadg");
    REQUIRE(err);
    CHECK(err->failure() == parse_failure::hex_digit);
    CHECK(err->position() == 35);

    err = parse_failure_of("7x444840-9dc0-11d1-b245-5ffdce74fad2");
    REQUIRE(err);
    CHECK(err->failure() == parse_failure::hex_digit);
    CHECK(err->position() == 1);

    err = parse_failure_of("{7d444840-9dc0-11d1-b245-5ffdce74fazz}");
    REQUIRE(err);
    CHECK(err->failure() == parse_failure::hex_digit);
    CHECK(err->position() == 35);

    err = parse_failure_of("g0000000000000000000000000000000");
    REQUIRE(err);
    CHECK(err->failure() == parse_failure::hex_digit);
    CHECK(err->position() == 0);
}

TEST_CASE("rejected wrappers") {
    CHECK(!uuid::from_chars("urn:uudi:7d444840-9dc0-11d1-b245-5ffdce74fad2"));
    CHECK(!uuid::from_chars("urn-uuid:7d444840-9dc0-11d1-b245-5ffdce74fad2"));
    CHECK(!uuid::from_chars("(7d444840-9dc0-11d1-b245-5ffdce74fad2)"));
    CHECK(!uuid::from_chars("{7d444840-9dc0-11d1-b245-5ffdce74fad2{"));

    auto err = parse_failure_of("urn:uudi:7d444840-9dc0-11d1-b245-5ffdce74fad2");
    REQUIRE(err);
    CHECK(err->failure() == parse_failure::urn_prefix);
    CHECK(err->position() == 6);
    CHECK(err->length() == 45);

    err = parse_failure_of("[7d444840-9dc0-11d1-b245-5ffdce74fad2}");
    REQUIRE(err);
    CHECK(err->failure() == parse_failure::brace);
    CHECK(err->position() == 0);

    err = parse_failure_of("{7d444840-9dc0-11d1-b245-5ffdce74fad2]");
    REQUIRE(err);
    CHECK(err->failure() == parse_failure::brace);
    CHECK(err->position() == 37);
}

TEST_CASE("renderings of generated values") {
    std::vector<uuid> values = {
        uuid::generate_time_based(),
        uuid::generate_random(),
        uuid::generate_unix_time_based(),
        uuid(),
        uuid::max()
    };

    for (auto & val: values) {
        auto canonical = val.to_string();
        std::string hex;
        for (char c: canonical) {
            if (c != '-')
                hex += c;
        }

        CHECK(uuid::parse(canonical) == val);
        CHECK(uuid::parse(hex) == val);
        CHECK(uuid::parse("{" + canonical + "}") == val);
        CHECK(uuid::parse("urn:uuid:" + canonical) == val);
    }
}

}
