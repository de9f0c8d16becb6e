// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hdfetch/core/rate_limiter.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace hdfetch::core;
using namespace std::chrono_literals;

namespace {

constexpr std::uint64_t KiB = 1024;
constexpr std::uint64_t MiB = 1024 * KiB;

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

TEST_CASE("Rate parsing", "[rate]") {
    SECTION("Accepted") {
        CHECK(parse_rate("50M") == 50 * MiB);
        CHECK(parse_rate("512k") == 512 * KiB);
        CHECK(parse_rate("512K") == 512 * KiB);
        CHECK(parse_rate("1.5G") == 1536 * MiB);
        CHECK(parse_rate("0.5m") == 512 * KiB);
        CHECK(parse_rate(" 10M ") == 10 * MiB);
    }

    SECTION("Rejected") {
        auto bad = GENERATE(as<std::string>{}, "50", "M", "-1M", "10X", "", "1.2.3M", "1e3K", "+5M", "0M", "5 M");
        auto rate = parse_rate(bad);
        REQUIRE_FALSE(rate);
        CHECK(rate.error() == FetchErrc::rate_parse_failed);
    }
}

TEST_CASE("Unlimited bucket", "[rate]") {
    TokenBucket bucket;
    CHECK_FALSE(bucket.limit());

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 1000; ++i) {
        REQUIRE_FALSE(bucket.acquire(MiB, {}));
    }
    CHECK(since(start) < 500ms);
    CHECK(bucket.granted_bytes() == 1000 * MiB);
}

TEST_CASE("Burst defaults to one second of budget", "[rate]") {
    TokenBucket bucket(10 * MiB);
    CHECK(bucket.limit() == 10 * MiB);
    CHECK(bucket.burst_bytes() == 10 * MiB);

    TokenBucket small(10 * MiB, 64 * KiB);
    CHECK(small.burst_bytes() == 64 * KiB);
}

TEST_CASE("Throughput stays under the limit", "[rate][slow]") {
    constexpr std::uint64_t limit = 200 * KiB;
    constexpr std::uint64_t burst = 20 * KiB;
    TokenBucket bucket(limit, burst);

    SECTION("Single caller") {
        auto start = std::chrono::steady_clock::now();
        for (int i = 0; i < 20; ++i) {
            REQUIRE_FALSE(bucket.acquire(10 * KiB, {}));
        }
        // 200 KiB at 200 KiB/s with 20 KiB up front: at least 0.9 s
        auto elapsed = since(start);
        CHECK(elapsed >= 850ms);
        CHECK(elapsed < 2500ms);
    }

    SECTION("Shared by many workers") {
        std::atomic<int> errors{0};
        auto start = std::chrono::steady_clock::now();
        {
            std::vector<std::jthread> workers;
            for (int w = 0; w < 4; ++w) {
                workers.emplace_back([&bucket, &errors] {
                    for (int i = 0; i < 10; ++i) {
                        if (bucket.acquire(5 * KiB, {})) ++errors;
                    }
                });
            }
        }
        auto elapsed = since(start);
        CHECK(errors == 0);
        CHECK(bucket.granted_bytes() == 200 * KiB);
        CHECK(elapsed >= 850ms);
        CHECK(elapsed < 2500ms);
    }
}

TEST_CASE("Waiting is cancellable", "[rate]") {
    TokenBucket bucket(KiB, KiB);
    REQUIRE_FALSE(bucket.acquire(KiB, {}));

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(100ms);
        stop.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    auto ec = bucket.acquire(10 * KiB, stop.get_token());  // Would take ~10 s
    CHECK(ec == FetchErrc::cancelled);
    CHECK(since(start) < 2s);
    CHECK(bucket.granted_bytes() == KiB);
}

TEST_CASE("Cancelled wait returns its reservation", "[rate]") {
    TokenBucket bucket(100 * KiB, 100 * KiB);

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(50ms);
        stop.request_stop();
    });
    CHECK(bucket.acquire(512 * KiB, stop.get_token()) == FetchErrc::cancelled);
    CHECK(bucket.granted_bytes() == 0);

    // The bucket is full again, so a small request within the burst is immediate
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(bucket.acquire(10 * KiB, {}));
    CHECK(since(start) < 500ms);
    CHECK(bucket.granted_bytes() == 10 * KiB);
}
