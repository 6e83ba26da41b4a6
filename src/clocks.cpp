// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "clocks.h"
#include "random_generator.h"

#include <mutex>

using namespace std::chrono;
using namespace std::literals;
using namespace suuid;
using namespace suuid::impl;

using hundred_nanoseconds = duration<int64_t, std::ratio<int64_t(1), int64_t(10'000'000)>>;

//gregorian offset of Unix epoch in 100ns intervals
static constexpr uint64_t gregorian_offset = ((uint64_t(0x01B21DD2)) << 32) + 0x13814000;
static_assert(gregorian_offset == 122192928000000000);

static constexpr uint16_t max_unix_time_counter = 0x0FFF;

namespace {

    class wall_clock_source final : public clock_source {
    public:
        auto now() -> system_clock::time_point override {
            return system_clock::now();
        }

        void pause() override {
        #if SUUID_MULTITHREADED
            std::this_thread::sleep_for(1us);
        #endif
        }
    };
}

auto suuid::system_clock_source() noexcept -> clock_source & {
    static wall_clock_source source;
    return source;
}


time_based_clock_state::time_based_clock_state(const time_based_generator::options & opts):
    m_random(opts.random ? *opts.random : system_random_source()),
    m_clock(opts.clock ? *opts.clock : system_clock_source()),
    m_node_policy(opts.node_policy),
    m_fixed_node(opts.node),
    m_max_wait_iterations(opts.max_wait_iterations)
{}

auto time_based_clock_state::get() -> clock_result_v1 {
    std::lock_guard guard{this->m_mutex};
    this->ensure_initialized();

    uint64_t timestamp = this->read_timestamp();
    uint16_t clock_seq;

    if (this->m_last_timestamp == 0) {
        clock_seq = get_random_clock_seq(this->m_random);
    } else if (timestamp < this->m_last_timestamp) {
        //clock went backwards
        clock_seq = (this->m_clock_seq + 1) & 0x3FFF;
    } else if (timestamp == this->m_last_timestamp) {
        clock_seq = (this->m_clock_seq + 1) & 0x3FFF;
        if (clock_seq == 0) {
            //all 16384 sequence values used within this tick (RFC 4122 4.2.1.1)
            timestamp = this->wait_for_next_tick(timestamp);
            clock_seq = get_random_clock_seq(this->m_random);
        }
    } else {
        clock_seq = get_random_clock_seq(this->m_random);
    }

    this->m_last_timestamp = timestamp;
    this->m_clock_seq = clock_seq;
    return {timestamp, clock_seq, this->m_node};
}

auto time_based_clock_state::node() -> std::array<uint8_t, 6> {
    std::lock_guard guard{this->m_mutex};
    this->ensure_initialized();
    return this->m_node;
}

auto time_based_clock_state::get_state() const -> time_based_generator::state {
    std::lock_guard guard{this->m_mutex};
    return {this->m_last_timestamp, this->m_clock_seq};
}

void time_based_clock_state::ensure_initialized() {
    if (this->m_init_error)
        SUUID_THROW(*this->m_init_error);
    if (this->m_initialized)
        return;

#if SUUID_USE_EXCEPTIONS
    try {
        this->init_new();
    } catch (const std::exception & ex) {
        this->m_init_error.emplace(errc::initialization_failure,
                                   std::string("failed to initialize time based generator: ") + ex.what());
        throw *this->m_init_error;
    }
#else
    this->init_new();
#endif
    this->m_initialized = true;
}

void time_based_clock_state::init_new() {
    if (this->m_fixed_node)
        this->m_node = *this->m_fixed_node;
    else if (this->m_node_policy == node_id::detect_system)
        this->m_node = resolve_node_id(this->m_random);
    else
        this->m_node = generate_random_node_id(this->m_random);

    this->m_clock_seq = get_random_clock_seq(this->m_random);
}

auto time_based_clock_state::read_timestamp() -> uint64_t {
    auto since_epoch = duration_cast<hundred_nanoseconds>(this->m_clock.now().time_since_epoch());
    return uint64_t(since_epoch.count()) + gregorian_offset;
}

auto time_based_clock_state::wait_for_next_tick(uint64_t timestamp) -> uint64_t {
    for (unsigned i = 0; ; ++i) {
        if (this->m_max_wait_iterations != 0 && i == this->m_max_wait_iterations)
            SUUID_THROW(uuid_error(errc::clock_stalled,
                                   "clock did not advance after " + std::to_string(i) + " waits"));
        this->m_clock.pause();
        auto now = this->read_timestamp();
        if (now != timestamp)
            return now;
    }
}


unix_time_based_clock_state::unix_time_based_clock_state(random_source & random, clock_source & clock) noexcept:
    m_random(random),
    m_clock(clock)
{}

auto unix_time_based_clock_state::get() -> clock_result_v7 {
    std::lock_guard guard{this->m_mutex};

    auto now = uint64_t(duration_cast<milliseconds>(this->m_clock.now().time_since_epoch()).count());
    if (now != this->m_last_millis) {
        this->m_last_millis = now;
        this->m_counter = 0;
    }

    uint16_t sequence;
    if (this->m_counter < max_unix_time_counter) {
        sequence = this->m_counter++;
    } else {
        //counter exhausted for this millisecond, use random bits (RFC 9562 6.2)
        sequence = get_random_value<uint16_t>(this->m_random) & max_unix_time_counter;
    }
    return {now, sequence};
}

auto unix_time_based_clock_state::get_state() const -> unix_time_based_generator::state {
    std::lock_guard guard{this->m_mutex};
    return {this->m_last_millis, this->m_counter};
}
