// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <set>
#include <vector>
#include <algorithm>

using namespace suuid;

TEST_SUITE("random") {

TEST_CASE("system sources") {
    random_generator gen;

    std::set<uuid> seen;
    for (int i = 0; i < 1000; ++i) {
        auto u = gen.generate();
        CHECK(u.get_variant() == uuid::variant::standard);
        CHECK(u.get_type() == uuid::type::random);
        CHECK((u.bytes[6] & 0xF0) == 0x40);
        CHECK((u.bytes[8] & 0xC0) == 0x80);
        seen.insert(u);
    }
    CHECK(seen.size() == 1000);
}

TEST_CASE("system source fills large buffers") {
    //larger than a single getentropy request
    std::vector<uint8_t> buf(1024, 0);
    system_random_source().fill(buf);

    //any 16 byte window left at zero means part of the buffer was skipped
    for (size_t start = 0; start + 16 <= buf.size(); start += 16)
        CHECK(std::any_of(buf.begin() + start, buf.begin() + start + 16, [](uint8_t b) { return b != 0; }));

    std::vector<uint8_t> empty;
    system_random_source().fill(empty);
}

TEST_CASE("process-wide generator") {
    uuid u1 = uuid::generate_random();
    uuid u2 = uuid::generate_random();

    CHECK(u1.get_type() == uuid::type::random);
    CHECK(u2.get_variant() == uuid::variant::standard);
    CHECK(u1 != u2);
}

TEST_CASE("fixed bits") {
    fake_random random;
    random_generator gen({.random = &random});

    random.fill_byte = 0xFF;
    CHECK(gen.generate() == uuid("ffffffff-ffff-4fff-bfff-ffffffffffff"));

    random.fill_byte = 0x00;
    CHECK(gen.generate() == uuid("00000000-0000-4000-8000-000000000000"));

    CHECK(random.calls == 2);
}

TEST_CASE("entropy failure") {
    fake_random random;
    random.fail_after = 0;
    random_generator gen({.random = &random});

    try {
        (void)gen.generate();
        FAIL("generate() should throw");
    } catch (const uuid_error & ex) {
        CHECK(ex.code() == errc::entropy_unavailable);
    }

    random.fail_after.reset();
    CHECK(gen.generate().get_type() == uuid::type::random);
}

}
