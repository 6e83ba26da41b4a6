// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <steady-uuid/error.h>

using namespace suuid;

namespace {

    class uuid_category_impl final : public std::error_category {
    public:
        auto name() const noexcept -> const char * override {
            return "steady-uuid";
        }

        auto message(int code) const -> std::string override {
            switch (errc(code)) {
                case errc::entropy_unavailable:     return "secure random source is unavailable";
                case errc::node_resolution_failure: return "unable to obtain node id";
                case errc::initialization_failure:  return "generator failed to initialize";
                case errc::malformed_input:         return "malformed uuid text";
                case errc::clock_stalled:           return "clock did not advance";
            }
            return "unknown error";
        }
    };

    auto describe(parse_failure failure, size_t position, size_t length) -> std::string {
        switch (failure) {
            case parse_failure::length:
                return "invalid uuid length " + std::to_string(length) + ", expected 32, 36, 38 or 45";
            case parse_failure::urn_prefix:
                return "invalid urn prefix at position " + std::to_string(position) + ", expected \"urn:uuid:\"";
            case parse_failure::brace:
                return std::string("expected '") + (position == 0 ? '{' : '}') + "' at position " + std::to_string(position);
            case parse_failure::hyphen:
                return "expected '-' at position " + std::to_string(position);
            case parse_failure::hex_digit:
                return "invalid hex digit at position " + std::to_string(position);
        }
        return "invalid uuid";
    }
}

auto suuid::uuid_category() noexcept -> const std::error_category & {
    static const uuid_category_impl category;
    return category;
}

parse_error::parse_error(parse_failure failure, size_t position, size_t length):
    uuid_error(errc::malformed_input, describe(failure, position, length)),
    m_failure(failure),
    m_position(position),
    m_length(length)
{}
