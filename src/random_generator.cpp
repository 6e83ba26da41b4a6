// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "random_generator.h"

#include <steady-uuid/error.h>

#include <algorithm>
#include <cerrno>

#if defined(__linux__) && __has_include(<sys/random.h>)
    #define HAVE_GETRANDOM 1
    #include <sys/random.h>
    #include <errno.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
    #define HAVE_GETENTROPY 1
    #include <unistd.h>
    #if __has_include(<sys/random.h>)
        #include <sys/random.h>
    #endif
    #include <errno.h>
#elif defined(_WIN32) || defined(_WIN64)
    #define WIN32_LEAN_AND_MEAN

    #include <Windows.h>
    #include <bcrypt.h>

    #ifndef __MINGW32__
        #pragma comment(lib, "bcrypt.lib")
    #endif
#else
    #include <fcntl.h>
    #include <unistd.h>
    #include <errno.h>
#endif

using namespace suuid;

namespace {

#if HAVE_GETENTROPY
    constexpr size_t max_getentropy_size = 256;
#endif

    [[noreturn]] void throw_entropy_error(const char * call, int err) {
        SUUID_THROW(uuid_error(errc::entropy_unavailable,
                               std::string(call) + " failed: " + std::generic_category().message(err)));
    }

    class kernel_random_source final : public random_source {
    public:
        void fill(std::span<uint8_t> dest) override {

        #if HAVE_GETRANDOM

            while (!dest.empty()) {
                auto res = getrandom(dest.data(), dest.size(), 0);
                if (res < 0) {
                    if (errno == EINTR)
                        continue;
                    throw_entropy_error("getrandom", errno);
                }
                dest = dest.subspan(size_t(res));
            }

        #elif HAVE_GETENTROPY

            //getentropy fails with EIO for requests above 256 bytes
            while (!dest.empty()) {
                auto chunk = std::min(dest.size(), max_getentropy_size);
                if (getentropy(dest.data(), chunk) != 0)
                    throw_entropy_error("getentropy", errno);
                dest = dest.subspan(chunk);
            }

        #elif defined(_WIN32) || defined(_WIN64)

            auto status = BCryptGenRandom(nullptr, dest.data(), ULONG(dest.size()), BCRYPT_USE_SYSTEM_PREFERRED_RNG);
            if (!BCRYPT_SUCCESS(status))
                throw_entropy_error("BCryptGenRandom", EIO);

        #else

            int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
            if (fd < 0)
                throw_entropy_error("open(/dev/urandom)", errno);

            struct autoclose_fd_t {
                int fd;
                ~autoclose_fd_t() { close(fd); }
            } autoclose_fd{fd};

            while (!dest.empty()) {
                auto res = read(fd, dest.data(), dest.size());
                if (res < 0) {
                    if (errno == EINTR)
                        continue;
                    throw_entropy_error("read(/dev/urandom)", errno);
                }
                if (res == 0)
                    throw_entropy_error("read(/dev/urandom)", EIO);
                dest = dest.subspan(size_t(res));
            }

        #endif
        }
    };
}

auto suuid::system_random_source() noexcept -> random_source & {
    static kernel_random_source source;
    return source;
}
