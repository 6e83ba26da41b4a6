// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_STEADY_UUID_ERROR_H_INCLUDED
#define HEADER_STEADY_UUID_ERROR_H_INCLUDED

#include <steady-uuid/common.h>

#include <system_error>

namespace suuid {

    /// Error conditions reported by this library
    enum class errc {
        /// The secure random source failed to fill a buffer
        entropy_unavailable = 1,
        /// Neither a hardware address nor a random node id could be obtained
        node_resolution_failure,
        /// A generator failed its one-time initialization. The failure is permanent for that generator.
        initialization_failure,
        /// Text is not a valid uuid
        malformed_input,
        /// The clock did not advance within the configured number of waits
        clock_stalled
    };

    /// Error category for errc values
    SUUID_EXPORTED auto uuid_category() noexcept -> const std::error_category &;

    inline auto make_error_code(errc e) noexcept -> std::error_code {
        return {int(e), uuid_category()};
    }

    /// Base class for all exceptions thrown by this library
    class SUUID_EXPORTED uuid_error : public std::system_error {
    public:
        uuid_error(errc code, const std::string & what):
            std::system_error(make_error_code(code), what)
        {}
        uuid_error(errc code, const char * what):
            std::system_error(make_error_code(code), what)
        {}
    };

    /// What exactly was wrong with text passed to uuid::parse()
    enum class parse_failure : uint8_t {
        /// Length is not 32, 36, 38 or 45
        length,
        /// 45 character input does not start with `urn:uuid:`
        urn_prefix,
        /// 38 character input is not enclosed in `{` and `}`
        brace,
        /// A `-` is missing from its required position
        hyphen,
        /// A character that must be a hex digit is not
        hex_digit
    };

    /// Exception thrown by uuid::parse()
    class SUUID_EXPORTED parse_error : public uuid_error {
    public:
        parse_error(parse_failure failure, size_t position, size_t length);

        /// The kind of failure
        auto failure() const noexcept -> parse_failure
            { return m_failure; }
        /// Offset of the offending character in the input. For length failures it is the input length.
        auto position() const noexcept -> size_t
            { return m_position; }
        /// Length of the rejected input
        auto length() const noexcept -> size_t
            { return m_length; }
    private:
        parse_failure m_failure;
        size_t m_position;
        size_t m_length;
    };
}

template<>
struct std::is_error_code_enum<suuid::errc> : std::true_type {};

#endif
