// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_STEADY_UUID_COMMON_H_INCLUDED
#define HEADER_STEADY_UUID_COMMON_H_INCLUDED

// Config macros:
//
// The following macros must be defined identically when using and building this library:
//
// SUUID_MULTITHREADED - auto-detected. Set to 1 to force multi-threaded build and 0 to force single threaded 1
// SUUID_USE_EXCEPTIONS - auto-detected. Set to 1 to force usage of exceptions and 0 to force not using them
// SUUID_SHARED - set to 1 when using/building a shared library version of the library
//
// The following macro should be set when building the library itself but not when using it:
//
// SUUID_BUILDING_SUUID - set 1 if building the library itself.

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cstdio>

#include <concepts>
#include <compare>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <optional>
#include <limits>
#include <chrono>
#include <istream>
#include <ostream>

#if !defined(SUUID_MULTITHREADED)
    #if defined(_MSC_VER) && !defined(_MT)
        #define SUUID_MULTITHREADED 0
    #elif defined(_LIBCPP_VERSION) && (defined(_LIBCPP_HAS_NO_THREADS) || defined(_LIBCPP_HAS_THREADS) && !_LIBCPP_HAS_THREADS)
        #define SUUID_MULTITHREADED 0
    #elif defined(__GLIBCXX__) && !_GLIBCXX_HAS_GTHREADS
        #define SUUID_MULTITHREADED 0
    #elif !__has_include(<thread>) || !__has_include(<mutex>) || !__has_include(<atomic>)
        #define SUUID_MULTITHREADED 0
    #else
        #define SUUID_MULTITHREADED 1
    #endif
#endif

#if !defined(SUUID_USE_EXCEPTIONS)
    #if defined(__GNUC__) && !defined(__EXCEPTIONS)
        #define SUUID_USE_EXCEPTIONS 0
    #elif defined(__clang__) && !defined(__cpp_exceptions)
        #define SUUID_USE_EXCEPTIONS 0
    #elif defined(_MSC_VER) && !_HAS_EXCEPTIONS
        #define SUUID_USE_EXCEPTIONS 0
    #else
        #define SUUID_USE_EXCEPTIONS 1
    #endif
#endif

#if SUUID_SHARED
    #if defined(_WIN32) || defined(_WIN64)
        #if SUUID_BUILDING_SUUID
            #define SUUID_EXPORTED __declspec(dllexport)
        #else
            #define SUUID_EXPORTED __declspec(dllimport)
        #endif
    #elif defined(__GNUC__)
        #define SUUID_EXPORTED [[gnu::visibility("default")]]
    #else
        #define SUUID_EXPORTED
    #endif
#else
    #define SUUID_EXPORTED
#endif


//See https://github.com/llvm/llvm-project/issues/77773 for the sad story of how feature test
//macros are useless with libc++
#if (__cpp_lib_format >= 201907L || (defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 170000)) && __has_include(<format>)

    #define SUUID_SUPPORTS_STD_FORMAT 1

#endif

#if defined(FMT_VERSION) && FMT_VERSION >= 60000 && defined(FMT_THROW)

    #define SUUID_SUPPORTS_FMT_FORMAT 1

#endif

#if SUUID_USE_FMT && !SUUID_SUPPORTS_FMT_FORMAT

    #error "SUUID_USE_FMT is requested but fmt library (of version >= 6.0) is not detected. Did you forget to include <fmt/format.h> before this header?"

#endif

#if SUUID_SUPPORTS_STD_FORMAT
    #include <format>
#endif

namespace suuid
{
    namespace impl {
        template<class T, size_t Extent>
        std::true_type is_span_helper(std::span<T, Extent> * x);

        std::false_type is_span_helper(...);

        template<class T>
        constexpr bool is_span = decltype(is_span_helper((T *)nullptr))::value;

        template<class T>
        concept byte_like = std::is_standard_layout_v<T> &&
                            sizeof(T) == sizeof(uint8_t) &&
        requires {
            static_cast<T>(uint8_t{});
            static_cast<uint8_t>(T{});
        };

        static_assert(byte_like<char>);
        static_assert(byte_like<unsigned char>);
        static_assert(byte_like<signed char>);
        static_assert(byte_like<std::byte>);

        void invalid_constexpr_call(const char *);

        #if SUUID_USE_EXCEPTIONS
            #define SUUID_THROW(x) throw x
        #else
            [[noreturn]] inline void fail(const char* message) {
                fprintf(stderr, "suuid: fatal error: %s", message);
                abort();
            }
            #define SUUID_THROW(x) ::suuid::impl::fail((x).what())
        #endif

        template<std::same_as<size_t> S>
        constexpr size_t hash_combine(S prev, S next) {
            constexpr auto digits = std::numeric_limits<S>::digits;
            static_assert(digits == 64 || digits == 32);

            if constexpr (digits == 64) {
                S x = prev + 0x9e3779b9 + next;
                const S m = 0xe9846af9b1a615d;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 28;
                return x;
            } else {
                S x = prev + 0x9e3779b9 + next;
                const S m1 = 0x21f0aaad;
                const S m2 = 0x735a2d97;
                x ^= x >> 16;
                x *= m1;
                x ^= x >> 15;
                x *= m2;
                x ^= x >> 15;
                return x;
            }
        }

        template<impl::byte_like Byte, class T>
        constexpr const Byte * read_bytes(const Byte * bytes, T & val) noexcept {
            T tmp = uint8_t(*bytes++);
            for(unsigned i = 0; i < sizeof(T) - 1; ++i)
                tmp = (tmp << 8) | uint8_t(*bytes++);
            val = tmp;
            return bytes;
        }

        template<impl::byte_like Byte, class T>
        constexpr Byte * write_bytes(T val, Byte * bytes) noexcept {
            bytes[sizeof(T) - 1] = Byte(static_cast<uint8_t>(val));
            if constexpr (sizeof(T) > 1) {
                for(unsigned i = 1; i != sizeof(T); ++i) {
                    val >>= 8;
                    bytes[sizeof(T) - i - 1] = Byte(static_cast<uint8_t>(val));
                }
            }
            return bytes + sizeof(T);
        }

        /// Writes the low 48 bits of val in big-endian order
        template<impl::byte_like Byte>
        constexpr Byte * write_uint48(uint64_t val, Byte * bytes) noexcept {
            for (unsigned i = 0; i < 6; ++i)
                bytes[i] = Byte(static_cast<uint8_t>(val >> (40 - 8 * i)));
            return bytes + 6;
        }

        inline constexpr uint8_t invalid_nibble = 0xFF;

        consteval auto make_hex_nibbles() {
            std::array<uint8_t, 256> ret{};
            for (auto & n: ret)
                n = invalid_nibble;
            for (uint8_t i = 0; i < 10; ++i)
                ret[uint8_t('0' + i)] = i;
            for (uint8_t i = 0; i < 6; ++i) {
                ret[uint8_t('a' + i)] = uint8_t(10 + i);
                ret[uint8_t('A' + i)] = uint8_t(10 + i);
            }
            return ret;
        }

        /// Maps every byte value to its hex digit value or invalid_nibble
        inline constexpr std::array<uint8_t, 256> hex_nibbles = make_hex_nibbles();

        static_assert(hex_nibbles[uint8_t('0')] == 0);
        static_assert(hex_nibbles[uint8_t('f')] == 15);
        static_assert(hex_nibbles[uint8_t('F')] == 15);
        static_assert(hex_nibbles[uint8_t('g')] == invalid_nibble);
        static_assert(hex_nibbles[0xFF] == invalid_nibble);

        inline constexpr char hex_digits[] = "0123456789abcdef";

        /**
         * Decodes two hex characters into a byte
         *
         * @returns 0 on success, 1 if the first character is invalid, 2 if only the second is
         */
        constexpr unsigned decode_hex_pair(char high, char low, uint8_t & val) noexcept {
            uint8_t h = hex_nibbles[uint8_t(high)];
            uint8_t l = hex_nibbles[uint8_t(low)];
            if (h == invalid_nibble)
                return 1;
            if (l == invalid_nibble)
                return 2;
            val = uint8_t((h << 4) | l);
            return 0;
        }
    }
}

#endif
