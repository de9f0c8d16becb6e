// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hdfetch/core/segment_planner.hpp>
#include <hdfetch/core/segment.hpp>
#include <hdfetch/core/config.hpp>

using namespace hdfetch::core;

namespace {

// Contiguous, non-overlapping, exactly [0, total)
void check_partition(const std::vector<ByteRange>& ranges, std::uint64_t total) {
    REQUIRE_FALSE(ranges.empty());
    std::uint64_t expected_offset = 0;
    for (const auto& r : ranges) {
        CHECK(r.bounded);
        CHECK(r.offset == expected_offset);
        expected_offset = r.end();
    }
    CHECK(expected_offset == total);
}

} // namespace

TEST_CASE("Segment splitting math", "[planner]") {
    SECTION("Equal segment sizes") {
        auto ranges = plan_segments(100'000'000, true, 4);
        REQUIRE(ranges);
        REQUIRE(ranges->size() == 4);
        for (const auto& r : *ranges) {
            CHECK(r.length == 25'000'000);
        }
        check_partition(*ranges, 100'000'000);
    }

    SECTION("Last segment is truncated") {
        auto ranges = plan_segments(10, true, 4);
        REQUIRE(ranges);
        // ceil(10 / 4) = 3 -> 3, 3, 3, 1
        REQUIRE(ranges->size() == 4);
        CHECK((*ranges)[0].length == 3);
        CHECK((*ranges)[3].length == 1);
        check_partition(*ranges, 10);
    }

    SECTION("Coverage may need fewer segments than requested") {
        // ceil(9 / 4) = 3 covers 9 bytes in three segments
        auto ranges = plan_segments(9, true, 4);
        REQUIRE(ranges);
        CHECK(ranges->size() == 3);
        check_partition(*ranges, 9);
    }

    SECTION("More threads than bytes") {
        auto ranges = plan_segments(3, true, 8);
        REQUIRE(ranges);
        CHECK(ranges->size() == 3);
        check_partition(*ranges, 3);
    }

    SECTION("Inclusive range header") {
        auto ranges = plan_segments(1000, true, 2);
        REQUIRE(ranges);
        CHECK((*ranges)[0].header_value() == "0-499");
        CHECK((*ranges)[1].header_value() == "500-999");
    }
}

TEST_CASE("Partition property", "[planner]") {
    auto total = GENERATE(std::uint64_t{1}, std::uint64_t{2}, std::uint64_t{7}, std::uint64_t{31},
                          std::uint64_t{4096}, std::uint64_t{1'000'003}, std::uint64_t{5'368'709'121});
    auto threads = GENERATE(1u, 2u, 3u, 4u, 7u, 16u, 32u);

    auto ranges = plan_segments(total, true, threads);
    REQUIRE(ranges);
    CHECK(ranges->size() <= threads);
    check_partition(*ranges, total);
}

TEST_CASE("Planner edge cases", "[planner]") {
    SECTION("Empty resource") {
        auto ranges = plan_segments(0, true, 8);
        REQUIRE(ranges);
        REQUIRE(ranges->size() == 1);
        CHECK((*ranges)[0].empty());
    }

    SECTION("Unknown size gives one unbounded segment") {
        auto ranges = plan_segments(std::nullopt, true, 8);
        REQUIRE(ranges);
        REQUIRE(ranges->size() == 1);
        CHECK_FALSE((*ranges)[0].bounded);
        CHECK((*ranges)[0].offset == 0);
        CHECK((*ranges)[0].header_value() == "0-");
    }

    SECTION("No range support and several threads") {
        auto ranges = plan_segments(1000, false, 8);
        REQUIRE_FALSE(ranges);
        CHECK(ranges.error() == FetchErrc::unsupported_range);
    }

    SECTION("No range support with one thread") {
        auto ranges = plan_segments(1000, false, 1);
        REQUIRE(ranges);
        REQUIRE(ranges->size() == 1);
        CHECK((*ranges)[0].length == 1000);
    }

    SECTION("Thread count is clamped") {
        CHECK(clamp_threads(0) == 1);
        CHECK(clamp_threads(4) == 4);
        CHECK(clamp_threads(1000) == MAX_THREADS);

        auto ranges = plan_segments(1'000'000, true, 1000);
        REQUIRE(ranges);
        CHECK(ranges->size() == MAX_THREADS);

        auto single = plan_segments(1'000'000, true, 0);
        REQUIRE(single);
        CHECK(single->size() == 1);
    }

    SECTION("Deterministic") {
        CHECK(*plan_segments(123'456'789, true, 7) == *plan_segments(123'456'789, true, 7));
    }
}

TEST_CASE("Segment bookkeeping", "[segment]") {
    Segment segment(2, ByteRange{1000, 500, true});

    CHECK(segment.index() == 2);
    CHECK(segment.state() == SegmentState::pending);
    CHECK(segment.remaining() == 500);

    CHECK(segment.begin_attempt() == 1);
    segment.state(SegmentState::in_flight);
    segment.add_received(200);
    CHECK(segment.remaining() == 300);

    segment.reset_received();
    CHECK(segment.received() == 0);
    CHECK(segment.begin_attempt() == 2);
    CHECK(segment.attempts() == 2);
}
