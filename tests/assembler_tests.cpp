// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hdfetch/disk/assembler.hpp>
#include <hdfetch/core/segment_planner.hpp>
#include "fakes.hpp"
#include <sstream>

using namespace hdfetch;
using namespace hdfetch::test;

namespace {

// Feed segment `index` to the assembler in small chunks
void deliver(disk::Assembler& assembler, const std::vector<core::ByteRange>& ranges,
             const std::vector<std::byte>& payload, std::uint32_t index, std::size_t chunk = 37) {
    const auto& r = ranges[index];
    for (std::uint64_t pos = 0; pos < r.length; pos += chunk) {
        auto n = std::min<std::uint64_t>(chunk, r.length - pos);
        auto data = std::span<const std::byte>(payload.data() + r.offset + pos, static_cast<std::size_t>(n));
        REQUIRE_FALSE(assembler.write(index, pos, data));
    }
    REQUIRE_FALSE(assembler.complete(index));
}

std::vector<std::byte> bytes_of(const std::string& s) {
    std::vector<std::byte> out(s.size());
    std::transform(s.begin(), s.end(), out.begin(), [](char c) { return static_cast<std::byte>(c); });
    return out;
}

} // namespace

TEST_CASE("Random access assembly", "[assembler]") {
    TempDir dir;
    const auto payload = make_payload(1000);
    const auto ranges = *core::plan_segments(payload.size(), true, 4);
    const auto output = dir.path() / "video.mp4";

    disk::RandomAccessAssembler assembler(output);
    REQUIRE_FALSE(assembler.open(ranges));
    CHECK(assembler.partial_path() == dir.path() / "video.mp4.part");
    CHECK(std::filesystem::file_size(assembler.partial_path()) == payload.size());

    SECTION("Out of order completion") {
        for (std::uint32_t index : {3u, 1u, 0u, 2u}) {
            deliver(assembler, ranges, payload, index);
        }
        REQUIRE_FALSE(assembler.finish());
        CHECK(read_file(output) == payload);
        CHECK_FALSE(std::filesystem::exists(assembler.partial_path()));

        // Finished output survives discard
        assembler.discard();
        CHECK(std::filesystem::exists(output));
    }

    SECTION("Finish requires every segment") {
        deliver(assembler, ranges, payload, 0);
        deliver(assembler, ranges, payload, 1);
        deliver(assembler, ranges, payload, 3);

        CHECK(assembler.finish() == disk::DiskErrc::incomplete_output);
        CHECK_FALSE(std::filesystem::exists(output));

        assembler.discard();
        CHECK_FALSE(std::filesystem::exists(assembler.partial_path()));
    }

    SECTION("Writes past a slot are rejected") {
        std::vector<std::byte> too_much(ranges[0].length + 1);
        CHECK(assembler.write(0, 0, too_much) == disk::DiskErrc::slot_overflow);
        CHECK(assembler.write(9, 0, too_much) == disk::DiskErrc::handle_invalid);
    }
}

TEST_CASE("Sequential assembly", "[assembler]") {
    const auto payload = make_payload(1001, 7);
    const auto ranges = *core::plan_segments(payload.size(), true, 4);
    REQUIRE(ranges.size() == 4);

    std::ostringstream sink;
    disk::SequentialAssembler assembler(sink);
    REQUIRE_FALSE(assembler.open(ranges));

    SECTION("Any completion order gives the same bytes") {
        auto order = GENERATE(std::vector<std::uint32_t>{0, 1, 2, 3},
                              std::vector<std::uint32_t>{3, 2, 1, 0},
                              std::vector<std::uint32_t>{2, 0, 3, 1},
                              std::vector<std::uint32_t>{1, 3, 0, 2});
        for (auto index : order) {
            deliver(assembler, ranges, payload, index);
        }
        REQUIRE_FALSE(assembler.finish());
        CHECK(bytes_of(sink.str()) == payload);
    }

    SECTION("Flushes strictly by index") {
        deliver(assembler, ranges, payload, 2);
        CHECK(assembler.next_index() == 0);
        CHECK(sink.str().empty());

        deliver(assembler, ranges, payload, 0);
        CHECK(assembler.next_index() == 1);
        CHECK(sink.str().size() == ranges[0].length);

        deliver(assembler, ranges, payload, 1);
        CHECK(assembler.next_index() == 3);

        CHECK(assembler.finish() == disk::DiskErrc::incomplete_output);
        deliver(assembler, ranges, payload, 3);
        CHECK_FALSE(assembler.finish());
    }

    SECTION("Reset drops a partially written slot") {
        auto half = std::span<const std::byte>(payload.data(), 10);
        REQUIRE_FALSE(assembler.write(0, 0, half));
        assembler.reset(0);
        for (std::uint32_t index = 0; index < 4; ++index) {
            deliver(assembler, ranges, payload, index);
        }
        REQUIRE_FALSE(assembler.finish());
        CHECK(bytes_of(sink.str()) == payload);
    }
}
