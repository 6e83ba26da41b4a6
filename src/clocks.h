// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_STEADY_UUID_CLOCKS_H_INCLUDED
#define HEADER_STEADY_UUID_CLOCKS_H_INCLUDED

#include <steady-uuid/generators.h>

#include "threading.h"


namespace suuid::impl {

    struct clock_result_v1 {
        uint64_t value;
        uint16_t sequence;
        std::array<uint8_t, 6> node;
    };

    struct clock_result_v7 {
        uint64_t value;
        uint16_t sequence;
    };

    class time_based_clock_state {
    public:
        explicit time_based_clock_state(const time_based_generator::options & opts);
        time_based_clock_state(const time_based_clock_state &) = delete;
        time_based_clock_state & operator=(const time_based_clock_state &) = delete;

        auto get() -> clock_result_v1;
        auto node() -> std::array<uint8_t, 6>;
        auto get_state() const -> time_based_generator::state;

    private:
        void ensure_initialized();
        void init_new();
        auto read_timestamp() -> uint64_t;
        auto wait_for_next_tick(uint64_t timestamp) -> uint64_t;

    private:
        random_source & m_random;
        clock_source & m_clock;
        const node_id m_node_policy;
        const std::optional<std::array<uint8_t, 6>> m_fixed_node;
        const unsigned m_max_wait_iterations;

        mutable mutex_if_multithreaded m_mutex;
        bool m_initialized = false;
        std::optional<uuid_error> m_init_error;
        uint64_t m_last_timestamp = 0;
        uint16_t m_clock_seq = 0;
        std::array<uint8_t, 6> m_node{};
    };

    class unix_time_based_clock_state {
    public:
        unix_time_based_clock_state(random_source & random, clock_source & clock) noexcept;
        unix_time_based_clock_state(const unix_time_based_clock_state &) = delete;
        unix_time_based_clock_state & operator=(const unix_time_based_clock_state &) = delete;

        auto get() -> clock_result_v7;
        auto get_state() const -> unix_time_based_generator::state;

    private:
        random_source & m_random;
        clock_source & m_clock;

        mutable mutex_if_multithreaded m_mutex;
        uint64_t m_last_millis = 0;
        uint16_t m_counter = 0;
    };
}

#endif
