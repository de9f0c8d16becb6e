// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/core/http_session.hpp>
#include <hdfetch/core/locator.hpp>
#include <hdfetch/core/rate_limiter.hpp>
#include <hdfetch/media/muxer.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <expected>
#include <optional>
#include <span>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace hdfetch::test {

// Deterministic pseudo-random payload
inline std::vector<std::byte> make_payload(std::size_t size, std::uint32_t seed = 1) {
    std::vector<std::byte> data(size);
    std::uint32_t x = seed * 2654435761u + 1;
    for (auto& b : data) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        b = static_cast<std::byte>(x & 0xff);
    }
    return data;
}

inline std::vector<std::byte> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::byte> data(raw.size());
    std::transform(raw.begin(), raw.end(), data.begin(), [](char c) { return static_cast<std::byte>(c); });
    return data;
}

// Scratch directory removed on scope exit
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
            ("hdfetch-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Regular files left in the directory
    [[nodiscard]] std::vector<std::string> files() const {
        std::vector<std::string> names;
        for (const auto& entry : std::filesystem::directory_iterator(path_)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

private:
    std::filesystem::path path_;
};

//=============================================================================
// MemorySource
//=============================================================================

// In-memory RangeSource with fault injection and per-range delays
class MemorySource final : public core::RangeSource {
public:
    struct Fault {
        std::error_code error;
        std::uint32_t times{1};
        std::uint64_t after_bytes{0};                 // Bytes delivered before failing
        std::optional<std::uint64_t> at_offset;      // Only requests starting here
    };

    explicit MemorySource(std::size_t chunk_size = 64 * 1024) : chunk_size_(chunk_size) {}

    void add(const std::string& address, std::vector<std::byte> data,
             bool ranges = true, bool report_length = true) {
        auto lock = std::lock_guard(mutex_);
        resources_[address] = Resource{std::move(data), ranges, report_length};
    }

    void inject(const std::string& address, Fault fault) {
        auto lock = std::lock_guard(mutex_);
        faults_[address].push_back(fault);
    }

    // Requests starting at `offset` sleep first, to force out-of-order completion
    void delay(std::uint64_t offset, std::chrono::milliseconds d) {
        auto lock = std::lock_guard(mutex_);
        delays_[offset] = d;
    }

    // Sleep between chunks, keeps transfers in flight long enough to observe
    void chunk_delay(std::chrono::milliseconds d) noexcept { chunk_delay_ = d; }

    [[nodiscard]] std::expected<core::ResourceInfo, std::error_code>
    probe(const std::string& address) override {
        probes_.fetch_add(1);
        auto lock = std::lock_guard(mutex_);
        auto it = resources_.find(address);
        if (it == resources_.end()) {
            return std::unexpected(make_error_code(core::FetchErrc::not_found));
        }
        core::ResourceInfo info;
        info.status_code = 200;
        info.accepts_ranges = it->second.ranges;
        if (it->second.report_length) {
            info.content_length = it->second.data.size();
        }
        return info;
    }

    [[nodiscard]] std::error_code
    fetch(const std::string& address, const core::ByteRange& range,
          const core::ChunkSink& sink, std::stop_token stoken) override {
        fetches_.fetch_add(1);
        const auto now = in_flight_.fetch_add(1) + 1;
        auto peak = max_in_flight_.load();
        while (now > peak && !max_in_flight_.compare_exchange_weak(peak, now)) {
        }
        auto ec = serve(address, range, sink, stoken);
        in_flight_.fetch_sub(1);
        return ec;
    }

    [[nodiscard]] std::uint32_t fetch_calls() const noexcept { return fetches_.load(); }
    [[nodiscard]] std::uint32_t probe_calls() const noexcept { return probes_.load(); }
    [[nodiscard]] std::uint32_t max_in_flight() const noexcept { return max_in_flight_.load(); }

    [[nodiscard]] std::vector<core::ByteRange> requests(const std::string& address) const {
        auto lock = std::lock_guard(mutex_);
        auto it = requests_.find(address);
        return it == requests_.end() ? std::vector<core::ByteRange>{} : it->second;
    }

private:
    struct Resource {
        std::vector<std::byte> data;
        bool ranges{true};
        bool report_length{true};
    };

    std::error_code serve(const std::string& address, const core::ByteRange& range,
                          const core::ChunkSink& sink, std::stop_token stoken) {
        const Resource* resource = nullptr;
        std::optional<Fault> fault;
        std::chrono::milliseconds wait{0};
        {
            auto lock = std::lock_guard(mutex_);
            requests_[address].push_back(range);

            auto it = resources_.find(address);
            if (it == resources_.end()) {
                return make_error_code(core::FetchErrc::not_found);
            }
            resource = &it->second;

            auto& pending = faults_[address];
            for (auto f = pending.begin(); f != pending.end(); ++f) {
                if (f->at_offset && *f->at_offset != range.offset) continue;
                fault = *f;
                if (--f->times == 0) pending.erase(f);
                break;
            }
            if (auto d = delays_.find(range.offset); d != delays_.end()) {
                wait = d->second;
            }
        }

        const auto size = static_cast<std::uint64_t>(resource->data.size());
        // A server without range support answers 200 with the whole body
        if (!resource->ranges && (range.offset > 0 || (range.bounded && range.length != size))) {
            return make_error_code(core::FetchErrc::unsupported_range);
        }
        if (range.offset > size || (range.bounded && range.end() > size)) {
            return make_error_code(core::FetchErrc::http_error);
        }

        if (wait.count() > 0) {
            std::this_thread::sleep_for(wait);
        }

        const auto end = range.bounded ? range.end() : size;
        std::uint64_t sent = 0;
        for (auto pos = range.offset; pos < end;) {
            if (stoken.stop_requested()) {
                return make_error_code(core::FetchErrc::cancelled);
            }
            if (fault && sent >= fault->after_bytes) {
                return fault->error;
            }

            auto n = std::min<std::uint64_t>(chunk_size_, end - pos);
            if (fault) {
                n = std::min(n, fault->after_bytes - sent);
            }
            auto chunk = std::span<const std::byte>(resource->data.data() + pos, static_cast<std::size_t>(n));
            if (auto ec = sink(chunk)) {
                return ec;
            }
            pos += n;
            sent += n;

            if (chunk_delay_.count() > 0) {
                std::this_thread::sleep_for(chunk_delay_);
            }
        }
        if (fault) {
            return fault->error;
        }
        return {};
    }

    std::size_t chunk_size_;
    std::chrono::milliseconds chunk_delay_{0};

    mutable std::mutex mutex_;
    std::map<std::string, Resource> resources_;
    std::map<std::string, std::vector<Fault>> faults_;
    std::map<std::uint64_t, std::chrono::milliseconds> delays_;
    std::map<std::string, std::vector<core::ByteRange>> requests_;

    std::atomic<std::uint32_t> fetches_{0};
    std::atomic<std::uint32_t> probes_{0};
    std::atomic<std::uint32_t> in_flight_{0};
    std::atomic<std::uint32_t> max_in_flight_{0};
};

//=============================================================================
// FakeResolver
//=============================================================================

class FakeResolver final : public core::Resolver {
public:
    void add(const std::string& identifier, core::Resolution resolution) {
        auto lock = std::lock_guard(mutex_);
        results_[identifier] = std::move(resolution);
    }

    void fail(const std::string& identifier, core::FetchErrc errc) {
        auto lock = std::lock_guard(mutex_);
        errors_[identifier] = make_error_code(errc);
    }

    [[nodiscard]] std::expected<core::Resolution, std::error_code>
    resolve(std::string_view identifier, core::Quality, bool) override {
        auto lock = std::lock_guard(mutex_);
        calls_.emplace_back(identifier);
        if (auto e = errors_.find(std::string(identifier)); e != errors_.end()) {
            return std::unexpected(e->second);
        }
        auto it = results_.find(std::string(identifier));
        if (it == results_.end()) {
            return std::unexpected(make_error_code(core::FetchErrc::video_unavailable));
        }
        return it->second;
    }

    [[nodiscard]] std::expected<std::vector<core::FormatOption>, std::error_code>
    list_formats(std::string_view) override {
        return std::vector<core::FormatOption>{};
    }

    [[nodiscard]] std::vector<std::string> calls() const {
        auto lock = std::lock_guard(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, core::Resolution> results_;
    std::map<std::string, std::error_code> errors_;
    std::vector<std::string> calls_;
};

//=============================================================================
// RecordingMuxer
//=============================================================================

// Writes video bytes followed by audio bytes to the output. Extraction
// copies the input unchanged.
class RecordingMuxer final : public media::Muxer {
public:
    struct Call {
        std::filesystem::path video;
        std::filesystem::path audio;
        std::filesystem::path output;
    };

    struct Extraction {
        std::filesystem::path input;
        std::filesystem::path output;
    };

    explicit RecordingMuxer(bool fail = false) : fail_(fail) {}

    [[nodiscard]] std::error_code mux(const std::filesystem::path& video,
                                      const std::filesystem::path& audio,
                                      const std::filesystem::path& output) override {
        auto lock = std::lock_guard(mutex_);
        calls_.push_back({video, audio, output});
        if (fail_) {
            return make_error_code(core::FetchErrc::mux_failed);
        }

        std::ofstream out(output, std::ios::binary);
        for (const auto& in : {video, audio}) {
            auto data = read_file(in);
            out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        return {};
    }

    [[nodiscard]] std::error_code extract_audio(const std::filesystem::path& input,
                                                const std::filesystem::path& output) override {
        auto lock = std::lock_guard(mutex_);
        extractions_.push_back({input, output});
        if (fail_) {
            return make_error_code(core::FetchErrc::mux_failed);
        }

        auto data = read_file(input);
        std::ofstream out(output, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return {};
    }

    [[nodiscard]] std::vector<Call> calls() const {
        auto lock = std::lock_guard(mutex_);
        return calls_;
    }

    [[nodiscard]] std::vector<Extraction> extractions() const {
        auto lock = std::lock_guard(mutex_);
        return extractions_;
    }

private:
    bool fail_;
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::vector<Extraction> extractions_;
};

//=============================================================================
// CountingLimiter
//=============================================================================

// Unlimited limiter that records what passed through it
class CountingLimiter final : public core::RateLimiter {
public:
    [[nodiscard]] std::error_code acquire(std::uint64_t bytes, std::stop_token stoken) override {
        if (stoken.stop_requested()) {
            return make_error_code(core::FetchErrc::cancelled);
        }
        calls_.fetch_add(1, std::memory_order_relaxed);
        granted_.fetch_add(bytes, std::memory_order_relaxed);
        return {};
    }

    [[nodiscard]] std::optional<std::uint64_t> limit() const noexcept override { return std::nullopt; }
    [[nodiscard]] std::uint64_t granted_bytes() const noexcept override { return granted_.load(); }
    [[nodiscard]] std::uint64_t calls() const noexcept { return calls_.load(); }

private:
    std::atomic<std::uint64_t> granted_{0};
    std::atomic<std::uint64_t> calls_{0};
};

// Range-capable locator of known size
inline core::Locator locator(std::string address, std::uint64_t size,
                             core::MediaKind kind = core::MediaKind::muxed,
                             std::string container = "mp4", bool ranges = true) {
    core::Locator l;
    l.address = std::move(address);
    l.total_size = size;
    l.supports_ranges = ranges;
    l.kind = kind;
    l.container = std::move(container);
    return l;
}

} // namespace hdfetch::test
