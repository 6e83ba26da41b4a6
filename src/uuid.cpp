// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <steady-uuid/generators.h>

#include "random_generator.h"
#include "clocks.h"

using namespace suuid;

static auto default_time_based_generator() -> time_based_generator & {
    static time_based_generator gen;
    return gen;
}

static auto default_unix_time_based_generator() -> unix_time_based_generator & {
    static unix_time_based_generator gen;
    return gen;
}

auto uuid::parse(std::string_view src) -> uuid {
    uuid ret;
    impl::parse_fault fault;
    if (!uuid::read_text(src, ret, fault))
        SUUID_THROW(parse_error(fault.failure, fault.position, src.size()));
    return ret;
}

auto uuid::generate_time_based() -> uuid {
    return default_time_based_generator().generate();
}

auto uuid::generate_random() -> uuid {
    random_generator gen;
    return gen.generate();
}

auto uuid::generate_unix_time_based() -> uuid {
    return default_unix_time_based_generator().generate();
}


time_based_generator::time_based_generator():
    time_based_generator(options{})
{}

time_based_generator::time_based_generator(const options & opts):
    m_state(std::make_unique<impl::time_based_clock_state>(opts))
{}

time_based_generator::~time_based_generator() noexcept = default;

auto time_based_generator::generate() -> uuid {
    auto [clock, clock_seq, node] = m_state->get();

    uint32_t clock_high = uint32_t(clock >> 32);
    uint32_t clock_low = uint32_t(clock);

    uuid_parts parts;
    parts.time_low = clock_low;
    parts.time_mid = uint16_t(clock_high);
    parts.time_hi_and_version = ((clock_high >> 16) & 0x0FFF) | 0x1000;
    parts.clock_seq = clock_seq | 0x8000;
    memcpy(parts.node, node.data(), node.size());

    return uuid(parts);
}

auto time_based_generator::node() -> std::array<uint8_t, 6> {
    return m_state->node();
}

auto time_based_generator::get_state() const -> state {
    return m_state->get_state();
}


auto random_generator::generate() -> uuid {
    uuid ret;
    m_random.fill(ret.bytes);

    ret.bytes[8] = (ret.bytes[8] & 0x3F) | 0x80;
    ret.bytes[6] = (ret.bytes[6] & 0x0F) | 0x40;

    return ret;
}


unix_time_based_generator::unix_time_based_generator():
    unix_time_based_generator(options{})
{}

unix_time_based_generator::unix_time_based_generator(const options & opts):
    m_state(std::make_unique<impl::unix_time_based_clock_state>(opts.random ? *opts.random : system_random_source(),
                                                                opts.clock ? *opts.clock : system_clock_source())),
    m_random(opts.random ? *opts.random : system_random_source())
{}

unix_time_based_generator::~unix_time_based_generator() noexcept = default;

auto unix_time_based_generator::generate() -> uuid {
    auto [clock, sequence] = m_state->get();

    uuid ret;
    auto dest = impl::write_uint48(clock, ret.bytes.data());
    impl::write_bytes(uint16_t(sequence | 0x7000), dest);
    m_random.fill(std::span{ret.bytes}.subspan<8>());

    ret.bytes[8] = (ret.bytes[8] & 0x3F) | 0x80;

    return ret;
}
