// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <steady-uuid/node_id.h>
#include <steady-uuid/error.h>

#if __has_include(<ifaddrs.h>)
    #define HAVE_IFADDRS_H 1
    #include <ifaddrs.h>
    #include <net/if.h>
    #include <sys/socket.h>
    #include <sys/types.h>

    #if __has_include(<net/if_dl.h>)
        #define HAVE_NET_IF_DL_H 1
        #include <net/if_dl.h>
    #elif __has_include(<linux/if_packet.h>)
        #define HAVE_LINUX_IF_PACKET_H 1
        #include <linux/if_packet.h>
    #endif

#elif defined(_WIN32) || defined(_WIN64)
    #define WIN32_LEAN_AND_MEAN

    #include <Windows.h>
    #include <WinSock2.h>
    #include <iphlpapi.h>

    #ifndef __MINGW32__
        #pragma comment(lib, "iphlpapi.lib")
    #endif
#endif

#include <cstring>
#include <cstdlib>

using namespace suuid;

static auto get_hardware_node_id(std::span<uint8_t, 6> dest) -> bool {

#if defined(HAVE_IFADDRS_H) && (defined(HAVE_NET_IF_DL_H) || defined(HAVE_LINUX_IF_PACKET_H))

    struct ifaddrs * addrs = nullptr;
    if (getifaddrs(&addrs) != 0)
        return false;

    struct autofree_addrs_t {
        struct ifaddrs * addrs;
        ~autofree_addrs_t() { freeifaddrs(addrs); }
    } autofree_addrs{addrs};

    for (auto cur = addrs; cur; cur = cur->ifa_next) {
        if (!cur->ifa_addr)
            continue;
        if (cur->ifa_flags & (IFF_LOOPBACK | IFF_POINTOPOINT))
            continue;

        const uint8_t * res = nullptr;
#if defined(HAVE_NET_IF_DL_H)
        if (cur->ifa_addr->sa_family != AF_LINK)
            continue;
        auto sdlp = (const struct sockaddr_dl *)cur->ifa_addr;
        if (sdlp->sdl_alen != 6)
            continue;
        res = (const uint8_t *)LLADDR(sdlp);
#else
        if (cur->ifa_addr->sa_family != AF_PACKET)
            continue;
        auto sllp = (const struct sockaddr_ll *)cur->ifa_addr;
        if (sllp->sll_halen != 6)
            continue;
        res = sllp->sll_addr;
#endif

        memcpy(dest.data(), res, 6);
        return true;
    }

#elif defined(_WIN32) || defined(_WIN64)

    ULONG addresses_size = sizeof(IP_ADAPTER_ADDRESSES);
    auto addresses = (IP_ADAPTER_ADDRESSES *)malloc(addresses_size);
    if (!addresses)
        return false;
    struct autofree_addresses_t {
        decltype(addresses) & addresses;
        ~autofree_addresses_t() { free(addresses); }
    } autofree_addresses{addresses};

    for ( ; ; ) {

        ULONG err = GetAdaptersAddresses(AF_UNSPEC, GAA_FLAG_INCLUDE_ALL_INTERFACES, nullptr, addresses, &addresses_size);
        if (err == ERROR_BUFFER_OVERFLOW) {
            free(addresses);
            addresses = (IP_ADAPTER_ADDRESSES *)malloc(addresses_size);
            if (!addresses)
                return false;
            continue;
        }
        if (err != 0)
            return false;
        break;
    }

    for (auto cur = addresses; cur; cur = cur->Next) {
        if (cur->IfType == IF_TYPE_SOFTWARE_LOOPBACK || cur->IfType == IF_TYPE_PPP)
            continue;
        if (cur->PhysicalAddressLength != 6)
            continue;
        memcpy(dest.data(), cur->PhysicalAddress, 6);
        return true;
    }

#endif

    return false;
}

auto suuid::generate_random_node_id(random_source & random) -> std::array<uint8_t, 6> {

    std::array<uint8_t, 6> ret;

#if SUUID_USE_EXCEPTIONS
    try {
        random.fill(ret);
    } catch (const uuid_error & ex) {
        throw uuid_error(errc::node_resolution_failure,
                         std::string("failed to generate random node id: ") + ex.what());
    }
#else
    random.fill(ret);
#endif

    // Set multicast bit, to prevent conflicts
    // with IEEE 802 addresses obtained from
    // network cards
    ret[0] |= 0x01;

    return ret;
}

auto suuid::resolve_node_id(random_source & random) -> std::array<uint8_t, 6> {

    std::array<uint8_t, 6> ret;
    if (get_hardware_node_id(ret))
        return ret;

    return generate_random_node_id(random);
}
