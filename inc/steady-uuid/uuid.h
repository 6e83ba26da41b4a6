// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_STEADY_UUID_UUID_H_INCLUDED
#define HEADER_STEADY_UUID_UUID_H_INCLUDED

#include <steady-uuid/common.h>
#include <steady-uuid/error.h>

#include <algorithm>
#include <iterator>

namespace suuid {

    struct uuid_parts {
        uint32_t    time_low;
        uint16_t    time_mid;
        uint16_t    time_hi_and_version;
        uint16_t    clock_seq;
        uint8_t     node[6];
    };

    namespace impl {
        struct parse_fault {
            parse_failure failure = parse_failure::length;
            size_t position = 0;
        };
    }

    class uuid {
    public:
        /// UUID variant
        /// see https://datatracker.ietf.org/doc/html/rfc4122#section-4.1.1
        /// and https://datatracker.ietf.org/doc/rfc9562/ section 4.1
        enum class variant: uint8_t {
            reserved_ncs        = 0,
            standard            = 1,
            reserved_microsoft  = 2,
            reserved_future     = 3
        };

        /// UUID type
        /// Only valid for variant::standard UUIDs
        /// see https://datatracker.ietf.org/doc/html/rfc4122#section-4.1.3
        /// and https://datatracker.ietf.org/doc/rfc9562/ section 4.2
        enum class type : uint8_t {
            none                    = 0,
            time_based              = 1,
            dce_security            = 2,
            name_based_md5          = 3,
            random                  = 4,
            name_based_sha1         = 5,
            reordered_time_based    = 6,
            unix_time_based         = 7,
            custom                  = 8,
            reserved9               = 9,
            reserved10              = 10,
            reserved11              = 11,
            reserved12              = 12,
            reserved13              = 13,
            reserved14              = 14,
            reserved15              = 15
        };

        /// Length of the canonical textual form
        static constexpr size_t canonical_length = 36;

    private:
        static constexpr size_t hex_length = 32;
        static constexpr size_t braced_length = canonical_length + 2;
        static constexpr size_t urn_length = canonical_length + 9;

        static constexpr char urn_prefix[] = "urn:uuid:";
        static constexpr size_t hyphens[] = {8, 13, 18, 23};
        static constexpr size_t canonical_pairs[] = {0, 2, 4, 6, 9, 11, 14, 16, 19, 21, 24, 26, 28, 30, 32, 34};

        static constexpr bool read_hex(std::string_view src, size_t pos, uint8_t & val, impl::parse_fault & fault) noexcept {
            if (auto bad = impl::decode_hex_pair(src[pos], src[pos + 1], val)) {
                fault = {parse_failure::hex_digit, pos + bad - 1};
                return false;
            }
            return true;
        }

        static constexpr void write_hex(uint8_t val, char * str) noexcept {
            *str++ = impl::hex_digits[val >> 4];
            *str++ = impl::hex_digits[val & 0x0F];
        }

        static constexpr char ascii_lower(char c) noexcept {
            return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c;
        }

        /// Decodes any accepted textual form into dest. On failure fills fault and returns false.
        static constexpr bool read_text(std::string_view src, uuid & dest, impl::parse_fault & fault) noexcept {

            if (src.size() == hex_length) {
                for (size_t i = 0; i < dest.bytes.size(); ++i) {
                    if (!uuid::read_hex(src, i * 2, dest.bytes[i], fault))
                        return false;
                }
                return true;
            }

            size_t offset;
            switch (src.size()) {
            case canonical_length:
                offset = 0;
                break;
            case braced_length:
                if (src.front() != '{') {
                    fault = {parse_failure::brace, 0};
                    return false;
                }
                if (src.back() != '}') {
                    fault = {parse_failure::brace, braced_length - 1};
                    return false;
                }
                offset = 1;
                break;
            case urn_length:
                for (size_t i = 0; i < std::size(urn_prefix) - 1; ++i) {
                    if (uuid::ascii_lower(src[i]) != urn_prefix[i]) {
                        fault = {parse_failure::urn_prefix, i};
                        return false;
                    }
                }
                offset = std::size(urn_prefix) - 1;
                break;
            default:
                fault = {parse_failure::length, src.size()};
                return false;
            }

            for (size_t pos: hyphens) {
                if (src[offset + pos] != '-') {
                    fault = {parse_failure::hyphen, offset + pos};
                    return false;
                }
            }
            for (size_t i = 0; i < std::size(canonical_pairs); ++i) {
                if (!uuid::read_hex(src, offset + canonical_pairs[i], dest.bytes[i], fault))
                    return false;
            }
            return true;
        }

    public:
        std::array<uint8_t, 16> bytes{};

    public:
        ///Constructs a Nil UUID
        constexpr uuid() noexcept = default;

        ///Constructs uuid from a canonical string literal
        consteval uuid(const char (&src)[canonical_length + 1]) noexcept {
            impl::parse_fault fault;
            if (!uuid::read_text(std::string_view(src, canonical_length), *this, fault))
                impl::invalid_constexpr_call("invalid uuid string");
        }

        /// Constructs uuid from a span of 16 byte-like objects
        template<impl::byte_like Byte>
        constexpr uuid(std::span<Byte, 16> src) noexcept {
            std::transform(src.begin(), src.end(), this->bytes.data(), [](Byte b) {
                return static_cast<uint8_t>(b);
            });
        }

        /// Constructs uuid from anything convertible to a span of 16 byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
            requires decltype(std::span{x})::extent == 16;
        })
        constexpr uuid(const T & src) noexcept:
            uuid{std::span{src}}
        {}

        /// Constructs uuid from an RFC 4122 field structure
        constexpr uuid(const uuid_parts & parts) noexcept {
            auto dest = this->bytes.data();
            dest = impl::write_bytes(parts.time_low, dest);
            dest = impl::write_bytes(parts.time_mid, dest);
            dest = impl::write_bytes(parts.time_hi_and_version, dest);
            dest = impl::write_bytes(parts.clock_seq, dest);
            std::copy(std::begin(parts.node), std::end(parts.node), dest);
        }

        /// Generates a version 1 UUID using the process-wide time based generator
        SUUID_EXPORTED static auto generate_time_based() -> uuid;
        /// Generates a version 4 UUID using the system random source
        SUUID_EXPORTED static auto generate_random() -> uuid;
        /// Generates a version 7 UUID using the process-wide unix time based generator
        SUUID_EXPORTED static auto generate_unix_time_based() -> uuid;

        /// Returns a Max UUID
        static constexpr uuid max() noexcept
            { return uuid("ffffffff-ffff-ffff-ffff-ffffffffffff"); }

        /// Resets the object to a Nil UUID
        constexpr void clear() noexcept {
            *this = uuid();
        }

        /// Returns the UUID variant
        constexpr auto get_variant() const noexcept -> variant {
            uint8_t val = this->bytes[8];
            if ((val & 0x80) == 0)
                return variant::reserved_ncs;
            if ((val & 0x40) == 0)
                return variant::standard;
            if ((val & 0x20) == 0)
                return variant::reserved_microsoft;
            return variant::reserved_future;
        }

        /// Returns the UUID type
        /// Only meaningful if get_variant() returns variant::standard
        constexpr auto get_type() const noexcept -> type {
            return static_cast<type>(this->bytes[6] >> 4);
        }

        constexpr friend auto operator==(const uuid & lhs, const uuid & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const uuid & lhs, const uuid & rhs) noexcept -> std::strong_ordering = default;

        /// Converts uuid to an RFC 4122 field structure
        constexpr auto to_parts() const noexcept -> uuid_parts {
            uuid_parts ret;
            auto ptr = this->bytes.data();
            ptr = impl::read_bytes(ptr, ret.time_low);
            ptr = impl::read_bytes(ptr, ret.time_mid);
            ptr = impl::read_bytes(ptr, ret.time_hi_and_version);
            ptr = impl::read_bytes(ptr, ret.clock_seq);
            std::copy(ptr, ptr + 6, ret.node);
            return ret;
        }

        /**
         * Parses uuid from text
         *
         * Accepts 32 hex digits, the 36 character canonical form, the canonical form
         * enclosed in `{}` or prefixed with case-insensitive `urn:uuid:`.
         * Hex digits may be in either case.
         */
        static constexpr std::optional<uuid> from_chars(std::string_view src) noexcept {
            uuid ret;
            impl::parse_fault fault;
            if (!uuid::read_text(src, ret, fault))
                return std::nullopt;
            return ret;
        }

        /**
         * Parses uuid from text
         *
         * Same rules as from_chars()
         * @throws parse_error describing what is wrong and where
         */
        SUUID_EXPORTED static auto parse(std::string_view src) -> uuid;

        /// Formats uuid into a span of characters
        template<size_t Extent>
        [[nodiscard]]
        constexpr auto to_chars(std::span<char, Extent> dest) const noexcept ->
            std::conditional_t<Extent == std::dynamic_extent, bool, void> {

            if constexpr (Extent == std::dynamic_extent) {
                if (dest.size() < canonical_length)
                    return false;
            } else {
                static_assert(Extent >= canonical_length, "destination is too small");
            }

            char * out = dest.data();
            const uint8_t * src = this->bytes.data();
            for (int i = 0; i < 4; ++i, ++src, out += 2)
                uuid::write_hex(*src, out);
            *out++ = '-';
            for (int i = 0; i < 3; ++i) {
                for (int j = 0; j < 2; ++j, ++src, out += 2) {
                    uuid::write_hex(*src, out);
                }
                *out++ = '-';
            }
            for (int i = 0; i < 6; ++i, ++src, out += 2)
                uuid::write_hex(*src, out);

            if constexpr (Extent == std::dynamic_extent)
                return true;
        }

        /// Formats uuid into anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires std::is_same_v<std::remove_reference_t<decltype(*std::span{x}.begin())>, char>;
        })
        [[nodiscard]]
        constexpr auto to_chars(T & dest) const noexcept {
            return this->to_chars(std::span{dest});
        }

        /// Returns a character array with formatted uuid
        constexpr auto to_chars() const noexcept -> std::array<char, canonical_length> {
            std::array<char, canonical_length> ret;
            to_chars(ret);
            return ret;
        }

    #if __cpp_lib_constexpr_string >= 201907L
        constexpr
    #endif
        /// Returns a string with formatted uuid
        auto to_string() const -> std::string
        {
            std::string ret(canonical_length, '\0');
            (void)to_chars(ret);
            return ret;
        }

        /// Prints uuid into an ostream
        friend std::ostream & operator<<(std::ostream & str, const uuid val) {
            auto buf = val.to_chars();
            std::copy(buf.begin(), buf.end(), std::ostreambuf_iterator<char>(str));
            return str;
        }

        /// Reads canonical form uuid from an istream
        friend std::istream & operator>>(std::istream & str, uuid & val) {
            std::array<char, canonical_length> buf;
            auto * strbuf = str.rdbuf();
            for(char & c: buf) {
                auto res = strbuf->sbumpc();
                if (res == std::char_traits<char>::eof()) {
                    str.setstate(std::ios_base::eofbit | std::ios_base::failbit);
                    return str;
                }
                c = char(res);
            }
            if (auto maybe_val = uuid::from_chars(std::string_view(buf.data(), buf.size())))
                val = *maybe_val;
            else
                str.setstate(std::ios_base::failbit);
            return str;
        }

        /// Returns hash code for the uuid
        friend constexpr size_t hash_value(const uuid & val) noexcept {
            static_assert(sizeof(uuid) > sizeof(size_t) && sizeof(uuid) % sizeof(size_t) == 0);
            size_t temp;
            const uint8_t * data = val.bytes.data();
            size_t ret = 0;
            for(unsigned i = 0; i < sizeof(uuid) / sizeof(size_t); ++i) {
                memcpy(&temp, data, sizeof(size_t));
                ret = impl::hash_combine(ret, temp);
                data += sizeof(size_t);
            }
            return ret;
        }
    };

    static_assert(sizeof(uuid) == 16);

    namespace impl {
        template<class Derived>
        struct formatter_base
        {
            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator
            {
                auto it = ctx.begin();
                if (it != ctx.end() && *it != '}')
                    static_cast<Derived *>(this)->raise_exception("Invalid format args");
                return it;
            }

            template <typename FormatContext>
            auto format(uuid val, FormatContext & ctx) const -> decltype(ctx.out())
            {
                auto buf = val.to_chars();
                return std::copy(buf.begin(), buf.end(), ctx.out());
            }
        };
    }
}

/// std::hash specialization for uuid
template<>
struct std::hash<suuid::uuid> {

    constexpr size_t operator()(const suuid::uuid & val) const noexcept {
        return hash_value(val);
    }
};


#if SUUID_SUPPORTS_STD_FORMAT

/// uuid formatter for std::format
template<>
struct std::formatter<::suuid::uuid, char> : public ::suuid::impl::formatter_base<std::formatter<::suuid::uuid, char>>
{
    [[noreturn]] void raise_exception(const char * message) {
        SUUID_THROW(std::format_error(message));
    }
};

#endif

#if SUUID_SUPPORTS_FMT_FORMAT

/// uuid formatter for fmt::format
template<>
struct fmt::formatter<::suuid::uuid, char> : public ::suuid::impl::formatter_base<fmt::formatter<::suuid::uuid, char>>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
