// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_STEADY_UUID_NODE_ID_H_INCLUDED
#define HEADER_STEADY_UUID_NODE_ID_H_INCLUDED

#include <steady-uuid/common.h>
#include <steady-uuid/sources.h>

namespace suuid {

    /// How to obtain node id for version 1 UUIDs
    enum class node_id {
        detect_system,
        generate_random
    };

    /**
     * Returns the hardware address of the first network interface that is not
     * loopback or point-to-point and has a 6 byte address.
     *
     * If there is no such interface falls back on generate_random_node_id()
     *
     * @throws uuid_error with errc::node_resolution_failure if the fallback fails
     */
    SUUID_EXPORTED auto resolve_node_id(random_source & random) -> std::array<uint8_t, 6>;

    /**
     * Returns a random node id with the multicast bit set.
     *
     * The multicast bit prevents conflicts with IEEE 802 addresses obtained from
     * network cards (RFC 4122 section 4.5)
     *
     * @throws uuid_error with errc::node_resolution_failure if random bytes are unavailable
     */
    SUUID_EXPORTED auto generate_random_node_id(random_source & random) -> std::array<uint8_t, 6>;
}

#endif
