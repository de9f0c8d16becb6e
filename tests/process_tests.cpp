// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hdfetch/media/process.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace hdfetch::media;
using namespace std::chrono_literals;

TEST_CASE("Process capture", "[process]") {
    SECTION("Stdout and exit code") {
        auto result = run_process({"sh", "-c", "echo hello; exit 3"});
        REQUIRE(result);
        CHECK(result->output == "hello\n");
        CHECK(result->exit_code == 3);
    }

    SECTION("Missing executable") {
        auto result = run_process({"hdfetch-no-such-program-xyz"});
        CHECK_FALSE(result);
    }

    SECTION("Empty argv") {
        CHECK(run_process({}).error() == std::errc::invalid_argument);
    }
}

TEST_CASE("Concurrent captures do not wait on each other", "[process][slow]") {
    std::atomic<bool> running{true};
    std::jthread sibling([&running] {
        while (running) {
            auto r = run_process({"sleep", "1"});
            if (!r) break;
        }
    });

    auto worst = std::chrono::steady_clock::duration::zero();
    auto deadline = std::chrono::steady_clock::now() + 2500ms;
    int failures = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        auto start = std::chrono::steady_clock::now();
        auto r = run_process({"echo", "x"});
        worst = std::max(worst, std::chrono::steady_clock::now() - start);
        if (!r || r->output != "x\n") ++failures;
    }
    running = false;

    CHECK(failures == 0);
    CHECK(worst < 500ms);
}
