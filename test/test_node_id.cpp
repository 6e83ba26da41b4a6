// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

using namespace suuid;

TEST_SUITE("node_id") {

TEST_CASE("random node id") {
    fake_random random;

    random.fill_byte = 0x00;
    CHECK(generate_random_node_id(random) == std::array<uint8_t, 6>{0x01, 0, 0, 0, 0, 0});

    random.fill_byte = 0xFE;
    CHECK(generate_random_node_id(random) == std::array<uint8_t, 6>{0xFF, 0xFE, 0xFE, 0xFE, 0xFE, 0xFE});

    random.fill_byte.reset();
    for (int i = 0; i < 10; ++i)
        CHECK((generate_random_node_id(random)[0] & 0x01) == 0x01);
}

TEST_CASE("random node id failure") {
    fake_random random;
    random.fail_after = 0;

    try {
        (void)generate_random_node_id(random);
        FAIL("generate_random_node_id() should throw");
    } catch (const uuid_error & ex) {
        CHECK(ex.code() == errc::node_resolution_failure);
        CHECK(std::string_view(ex.what()).find("fake entropy failure") != std::string_view::npos);
    }
}

TEST_CASE("resolved node id") {
    auto first = resolve_node_id(system_random_source());
    auto second = resolve_node_id(system_random_source());

    //hardware addresses are stable, random ones are multicast
    if ((first[0] & 0x01) == 0)
        CHECK(first == second);

    fake_random random;
    random.fail_after = 0;
    try {
        auto node = resolve_node_id(random);
        CHECK((node[0] & 0x01) == 0);
    } catch (const uuid_error & ex) {
        CHECK(ex.code() == errc::node_resolution_failure);
    }
}

}
