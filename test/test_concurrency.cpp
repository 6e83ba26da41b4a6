// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#if SUUID_MULTITHREADED

#include <set>
#include <thread>
#include <vector>
#include <mutex>

using namespace suuid;

namespace {

    constexpr size_t thread_count = 100;
    constexpr size_t per_thread = 10;

    template<class Func>
    auto generate_concurrently(Func func) -> std::set<uuid> {
        std::mutex lock;
        std::set<uuid> ret;
        size_t errors = 0;

        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([&]() {
                std::vector<uuid> local;
                size_t local_errors = 0;
                for (size_t j = 0; j < per_thread; ++j) {
                    try {
                        local.push_back(func());
                    } catch (const uuid_error &) {
                        ++local_errors;
                    }
                }
                std::lock_guard guard{lock};
                ret.insert(local.begin(), local.end());
                errors += local_errors;
            });
        }
        for (auto & thread: threads)
            thread.join();

        CHECK(errors == 0);
        return ret;
    }
}

TEST_SUITE("concurrency") {

TEST_CASE("time based") {
    SUBCASE("process-wide") {
        auto ids = generate_concurrently([]() { return uuid::generate_time_based(); });
        CHECK(ids.size() == thread_count * per_thread);
    }
    SUBCASE("shared instance") {
        time_based_generator gen;
        auto ids = generate_concurrently([&]() { return gen.generate(); });
        CHECK(ids.size() == thread_count * per_thread);
    }
}

TEST_CASE("unix time based") {
    SUBCASE("process-wide") {
        auto ids = generate_concurrently([]() { return uuid::generate_unix_time_based(); });
        CHECK(ids.size() == thread_count * per_thread);
    }
    SUBCASE("shared instance") {
        unix_time_based_generator gen;
        auto ids = generate_concurrently([&]() { return gen.generate(); });
        CHECK(ids.size() == thread_count * per_thread);
    }
}

TEST_CASE("random") {
    auto ids = generate_concurrently([]() { return uuid::generate_random(); });
    CHECK(ids.size() == thread_count * per_thread);
}

}

#endif
