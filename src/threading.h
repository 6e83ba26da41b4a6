// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_STEADY_UUID_THREADING_H_INCLUDED
#define HEADER_STEADY_UUID_THREADING_H_INCLUDED

#include <steady-uuid/common.h>

#if SUUID_MULTITHREADED
    #include <mutex>
    #include <thread>
#endif


namespace suuid::impl {

    struct null_mutex {
        void lock() {}
        bool try_lock() { return true; }
        void unlock() {}
    };

    #if SUUID_MULTITHREADED

        using mutex_if_multithreaded = std::mutex;

    #else

        using mutex_if_multithreaded = null_mutex;

    #endif
}

#endif
