// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_STEADY_UUID_SOURCES_H_INCLUDED
#define HEADER_STEADY_UUID_SOURCES_H_INCLUDED

#include <steady-uuid/common.h>

namespace suuid {

    /// Callback interface for a source of cryptographically secure random bytes
    class random_source {
    public:
        /**
         * Fills the entire destination with random bytes
         *
         * May be called concurrently from multiple threads.
         *
         * @throws uuid_error with errc::entropy_unavailable if the bytes cannot be produced
         */
        virtual void fill(std::span<uint8_t> dest) = 0;
    protected:
        random_source() noexcept = default;
        ~random_source() noexcept = default;
        random_source(const random_source &) noexcept = default;
        random_source & operator=(const random_source &) noexcept = default;
    };

    /// Callback interface for the wall clock used by time based generators
    class clock_source {
    public:
        /// Current time
        virtual auto now() -> std::chrono::system_clock::time_point = 0;
        /**
         * Wait a short while before the clock is read again
         *
         * Called while a generator waits for the clock to advance.
         */
        virtual void pause() = 0;
    protected:
        clock_source() noexcept = default;
        ~clock_source() noexcept = default;
        clock_source(const clock_source &) noexcept = default;
        clock_source & operator=(const clock_source &) noexcept = default;
    };

    /// Kernel CSPRNG (getrandom, BCryptGenRandom or /dev/urandom)
    SUUID_EXPORTED auto system_random_source() noexcept -> random_source &;

    /// std::chrono::system_clock. pause() sleeps for a microsecond.
    SUUID_EXPORTED auto system_clock_source() noexcept -> clock_source &;
}

#endif
