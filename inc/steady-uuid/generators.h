// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_STEADY_UUID_GENERATORS_H_INCLUDED
#define HEADER_STEADY_UUID_GENERATORS_H_INCLUDED

#include <steady-uuid/uuid.h>
#include <steady-uuid/sources.h>
#include <steady-uuid/node_id.h>

#include <memory>

namespace suuid {

    namespace impl {
        class time_based_clock_state;
        class unix_time_based_clock_state;
    }

    /**
     * Generator of version 1 UUIDs
     *
     * Thread safe. All calls on one instance are serialized.
     *
     * The node id and initial clock sequence are obtained on the first call to generate()
     * or node(). If that fails the failure is remembered and every later call throws
     * uuid_error with errc::initialization_failure without retrying.
     */
    class time_based_generator {
    public:
        struct options {
            /// Source of random bytes. nullptr means system_random_source()
            random_source * random = nullptr;
            /// Source of time. nullptr means system_clock_source()
            clock_source * clock = nullptr;
            /// How to obtain node id if `node` is not set
            node_id node_policy = node_id::detect_system;
            /// Fixed node id to use
            std::optional<std::array<uint8_t, 6>> node;
            /**
             * How many times to pause waiting for the clock to advance after
             * clock sequence is exhausted within one clock tick.
             * 0 means wait forever.
             */
            unsigned max_wait_iterations = 0;
        };

        struct state {
            /// 100ns intervals since 1582-10-15, 0 if nothing was generated yet
            uint64_t last_timestamp;
            /// 14-bit clock sequence
            uint16_t clock_seq;
        };

    public:
        SUUID_EXPORTED time_based_generator();
        SUUID_EXPORTED explicit time_based_generator(const options & opts);
        SUUID_EXPORTED ~time_based_generator() noexcept;
        time_based_generator(const time_based_generator &) = delete;
        time_based_generator & operator=(const time_based_generator &) = delete;

        /**
         * Generates a version 1 UUID
         *
         * May block if more than 16384 UUIDs are requested within one 100ns tick.
         *
         * @throws uuid_error with errc::initialization_failure, errc::entropy_unavailable
         * or errc::clock_stalled
         */
        SUUID_EXPORTED auto generate() -> uuid;

        /// Node id placed in generated UUIDs. Initializes the generator if necessary.
        SUUID_EXPORTED auto node() -> std::array<uint8_t, 6>;

        /// Snapshot of the clock state
        SUUID_EXPORTED auto get_state() const -> state;

    private:
        std::unique_ptr<impl::time_based_clock_state> m_state;
    };

    /**
     * Generator of version 4 UUIDs
     *
     * Stateless. Thread safe if the random source is.
     */
    class random_generator {
    public:
        struct options {
            /// Source of random bytes. nullptr means system_random_source()
            random_source * random = nullptr;
        };

    public:
        random_generator() noexcept:
            m_random(system_random_source())
        {}
        explicit random_generator(const options & opts) noexcept:
            m_random(opts.random ? *opts.random : system_random_source())
        {}

        /**
         * Generates a version 4 UUID
         *
         * @throws uuid_error with errc::entropy_unavailable
         */
        SUUID_EXPORTED auto generate() -> uuid;

    private:
        random_source & m_random;
    };

    /**
     * Generator of version 7 UUIDs
     *
     * Thread safe. All calls on one instance are serialized.
     *
     * Within one millisecond the 12-bit sequence after the version nibble counts up from 0.
     * Once it reaches 4095 the remaining UUIDs in that millisecond get random sequence
     * values and are not ordered relative to each other.
     */
    class unix_time_based_generator {
    public:
        struct options {
            /// Source of random bytes. nullptr means system_random_source()
            random_source * random = nullptr;
            /// Source of time. nullptr means system_clock_source()
            clock_source * clock = nullptr;
        };

        struct state {
            /// Unix milliseconds, 0 if nothing was generated yet
            uint64_t last_millis;
            /// Next 12-bit sequence value within last_millis
            uint16_t counter;
        };

    public:
        SUUID_EXPORTED unix_time_based_generator();
        SUUID_EXPORTED explicit unix_time_based_generator(const options & opts);
        SUUID_EXPORTED ~unix_time_based_generator() noexcept;
        unix_time_based_generator(const unix_time_based_generator &) = delete;
        unix_time_based_generator & operator=(const unix_time_based_generator &) = delete;

        /**
         * Generates a version 7 UUID
         *
         * If this throws the counter may still have advanced.
         *
         * @throws uuid_error with errc::entropy_unavailable
         */
        SUUID_EXPORTED auto generate() -> uuid;

        /// Snapshot of the clock state
        SUUID_EXPORTED auto get_state() const -> state;

    private:
        std::unique_ptr<impl::unix_time_based_clock_state> m_state;
        random_source & m_random;
    };
}

#endif
