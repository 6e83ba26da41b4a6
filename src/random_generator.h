// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_STEADY_UUID_RANDOM_GENERATOR_H_INCLUDED
#define HEADER_STEADY_UUID_RANDOM_GENERATOR_H_INCLUDED

#include <steady-uuid/sources.h>


namespace suuid::impl {

    template<std::unsigned_integral T>
    T get_random_value(random_source & random) {
        std::array<uint8_t, sizeof(T)> buf;
        random.fill(buf);
        T ret;
        read_bytes(buf.data(), ret);
        return ret;
    }

    inline uint16_t get_random_clock_seq(random_source & random) {
        return get_random_value<uint16_t>(random) & 0x3FFF;
    }
}

#endif
