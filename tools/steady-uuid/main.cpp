// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <fmt/format.h>

#include <steady-uuid/uuid.h>

#include <charconv>

using namespace suuid;

static constexpr const char usage[] = "nothing to generate; only accept `v1` `v4` & `v7` as the arg";

int main(int argc, char ** argv)
{
    if (argc < 2 || argc > 3) {
        fmt::print("{}\n", usage);
        return 0;
    }

    std::string_view kind = argv[1];

    unsigned long count = 1;
    if (argc == 3) {
        std::string_view arg = argv[2];
        auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), count);
        if (ec != std::errc{} || ptr != arg.data() + arg.size() || count == 0) {
            fmt::print("{}\n", usage);
            return 2;
        }
    }

    uuid (*generate)() = nullptr;
    if (kind == "v1")
        generate = uuid::generate_time_based;
    else if (kind == "v4")
        generate = uuid::generate_random;
    else if (kind == "v7")
        generate = uuid::generate_unix_time_based;
    else {
        fmt::print("{}\n", usage);
        return 0;
    }

    try {
        for (unsigned long i = 0; i < count; ++i)
            fmt::print("{}\n", generate());
    } catch (const uuid_error & ex) {
        fmt::print(stderr, "steady-uuid: {}\n", ex.what());
        return 1;
    }
    return 0;
}
