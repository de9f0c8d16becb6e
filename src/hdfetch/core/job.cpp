// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/core/job.hpp>
#include <hdfetch/core/segment_planner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace hdfetch::core {

std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::queued:      return "queued";
        case JobState::resolving:   return "resolving";
        case JobState::downloading: return "downloading";
        case JobState::assembling:  return "assembling";
        case JobState::muxing:      return "muxing";
        case JobState::done:        return "done";
        case JobState::failed:      return "failed";
        case JobState::canceled:    return "canceled";
    }
    return "unknown";
}

std::string sanitize_filename(std::string_view title) {
    constexpr std::string_view reserved = "<>:\"/\\|?*";
    constexpr std::size_t max_length = 200;

    std::string name;
    name.reserve(title.size());
    for (char c : title) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f || reserved.find(c) != std::string_view::npos) {
            name += '_';
        } else {
            name += c;
        }
    }

    // No leading/trailing blanks or dots ("." and ".." included)
    auto first = name.find_first_not_of(" .");
    if (first == std::string::npos) {
        return "video";
    }
    auto last = name.find_last_not_of(" .");
    name = name.substr(first, last - first + 1);

    if (name.size() > max_length) {
        name.resize(max_length);
        // Do not cut a UTF-8 sequence in half
        while (!name.empty() && (static_cast<unsigned char>(name.back()) & 0xC0) == 0x80) {
            name.pop_back();
        }
        if (!name.empty() && (static_cast<unsigned char>(name.back()) & 0x80)) {
            name.pop_back();
        }
    }
    return name;
}

//=============================================================================
// Job
//=============================================================================

Job::Job(std::uint32_t id, std::string identifier, JobOptions options, JobServices services)
    : id_(id)
    , identifier_(std::move(identifier))
    , options_(std::move(options))
    , services_(services) {
    options_.threads = clamp_threads(options_.threads);
}

Job::~Job() {
    discard_partials();
}

std::error_code Job::transition(JobState next) noexcept {
    auto current = state_.load(std::memory_order_acquire);
    do {
        if (!can_transition(current, next)) {
            return make_error_code(FetchErrc::invalid_transition);
        }
    } while (!state_.compare_exchange_weak(current, next,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire));

    spdlog::debug("Job {} [{}]: {} -> {}", id_, identifier_, to_string(current), to_string(next));
    return {};
}

std::error_code Job::run(std::stop_token stoken) {
    std::stop_callback forward(stoken, [this] { stop_.request_stop(); });
    return execute(stop_.get_token());
}

std::error_code Job::execute(std::stop_token stoken) {
    if (auto ec = transition(JobState::resolving)) {
        return ec;
    }
    {
        auto lock = std::lock_guard(mutex_);
        started_ = std::chrono::steady_clock::now();
    }

    auto resolution = services_.resolver.resolve(identifier_, options_.quality, options_.audio_only);
    if (stoken.stop_requested()) {
        return finish_with(JobState::canceled, make_error_code(FetchErrc::cancelled));
    }
    if (!resolution) {
        return finish_with(JobState::failed, resolution.error());
    }
    if (auto ec = prepare_streams(*resolution)) {
        return finish_with(JobState::failed, ec);
    }
    probe_sizes();

    if (auto ec = transition(JobState::downloading)) {
        return finish_with(JobState::failed, ec);
    }
    for (auto& stream : streams_) {
        auto ec = download(stream, stoken);
        if (ec == FetchErrc::cancelled || stoken.stop_requested()) {
            return finish_with(JobState::canceled, make_error_code(FetchErrc::cancelled));
        }
        if (ec) {
            return finish_with(JobState::failed, ec);
        }
    }

    if (auto ec = transition(JobState::assembling)) {
        return finish_with(JobState::failed, ec);
    }
    for (auto& stream : streams_) {
        if (auto ec = stream.assembler->finish()) {
            return finish_with(JobState::failed, ec);
        }
    }
    // Sizes that were unknown up front are known now
    total_bytes_.store(bytes_done_.load(std::memory_order_relaxed), std::memory_order_relaxed);

    // Audio conversion finishes the single stream; it is not a mux
    if (options_.audio_only && options_.extract_audio) {
        if (auto ec = extract()) {
            return finish_with(JobState::failed, ec);
        }
    }

    if (streams_.size() == 2) {
        if (auto ec = transition(JobState::muxing)) {
            return finish_with(JobState::failed, ec);
        }
        if (auto ec = mux()) {
            return finish_with(JobState::failed, ec);
        }
    }

    return finish_with(JobState::done, {});
}

std::error_code Job::prepare_streams(const Resolution& resolution) {
    std::vector<Locator> chosen;
    for (const auto& locator : resolution.locators) {
        if (!options_.audio_only || locator.kind == MediaKind::audio) {
            chosen.push_back(locator);
        }
    }
    if (options_.audio_only && chosen.empty()) {
        // No audio-only stream: take the audio track from a muxed one
        auto muxed = std::ranges::find(resolution.locators, MediaKind::muxed, &Locator::kind);
        if (muxed != resolution.locators.end()) {
            chosen.push_back(*muxed);
        }
    }
    if (chosen.empty()) {
        return make_error_code(FetchErrc::quality_unavailable);
    }
    if (chosen.size() > 2) {
        return make_error_code(FetchErrc::resolve_failed);
    }
    if (chosen.size() == 2) {
        // Video first, audio second
        if (chosen[0].kind == MediaKind::audio) {
            std::swap(chosen[0], chosen[1]);
        }
        if (chosen[0].kind != MediaKind::video || chosen[1].kind != MediaKind::audio) {
            return make_error_code(FetchErrc::resolve_failed);
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.output_dir, ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", options_.output_dir.string(), ec.message());
        return ec;
    }

    const auto stem = sanitize_filename(resolution.title.empty() ? identifier_ : resolution.title);
    auto extension = [](const Locator& locator) {
        return locator.container.empty() ? std::string("bin") : locator.container;
    };

    std::vector<Stream> streams;
    std::filesystem::path output;
    if (options_.audio_only && options_.extract_audio) {
        output = options_.output_dir / (stem + "." + AUDIO_CONTAINER);
        streams.push_back(Stream{chosen[0], options_.output_dir / (stem + ".audio." + extension(chosen[0])), nullptr, 0});
    } else if (chosen.size() == 1) {
        output = options_.output_dir / (stem + "." + extension(chosen[0]));
        streams.push_back(Stream{chosen[0], output, nullptr, 0});
    } else {
        output = options_.output_dir / (stem + "." + MERGE_CONTAINER);
        streams.push_back(Stream{chosen[0], options_.output_dir / (stem + ".video." + extension(chosen[0])), nullptr, 0});
        streams.push_back(Stream{chosen[1], options_.output_dir / (stem + ".audio." + extension(chosen[1])), nullptr, 0});
    }

    auto lock = std::lock_guard(mutex_);
    title_ = resolution.title;
    output_path_ = std::move(output);
    streams_ = std::move(streams);
    return {};
}

void Job::probe_sizes() {
    std::uint64_t total = 0;
    bool known = true;

    for (auto& stream : streams_) {
        if (!stream.locator.total_size) {
            auto info = services_.source.probe(stream.locator.address);
            if (info && info->content_length) {
                auto lock = std::lock_guard(mutex_);
                stream.locator.total_size = info->content_length;
            } else {
                spdlog::debug("Job {}: size of {} stream unknown, fetching as one segment",
                              id_, to_string(stream.locator.kind));
            }
        }

        if (stream.locator.total_size) {
            total += *stream.locator.total_size;
        } else {
            known = false;
        }
    }

    if (known) {
        total_bytes_.store(total, std::memory_order_relaxed);
    }
}

std::error_code Job::download(Stream& stream, std::stop_token stoken) {
    auto ranges = plan_segments(stream.locator, options_.threads);
    if (!ranges && ranges.error() == FetchErrc::unsupported_range) {
        spdlog::info("Job {}: server does not accept ranges, using a single segment", id_);
        ranges = plan_segments(stream.locator, 1);
    }
    if (!ranges) {
        return ranges.error();
    }

    const bool multi = ranges->size() > 1;
    auto ec = fetch(stream, std::move(*ranges), stream.locator.supports_ranges, stoken);

    // Advertised range support turned out to be false
    if (ec == FetchErrc::unsupported_range && multi) {
        spdlog::warn("Job {}: server ignored a range request, refetching as one segment", id_);
        {
            auto lock = std::lock_guard(mutex_);
            stream.locator.supports_ranges = false;
        }
        ranges = plan_segments(stream.locator, 1);
        if (!ranges) {
            return ranges.error();
        }
        ec = fetch(stream, std::move(*ranges), false, stoken);
    }
    return ec;
}

std::error_code Job::fetch(Stream& stream, std::vector<ByteRange> ranges,
                           bool resumable, std::stop_token stoken) {
    if (stream.assembler) {
        stream.assembler->discard();
    }
    auto assembler = std::make_unique<disk::RandomAccessAssembler>(stream.path);
    if (auto ec = assembler->open(ranges)) {
        return ec;
    }

    std::vector<std::unique_ptr<Segment>> segments;
    segments.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        segments.push_back(std::make_unique<Segment>(static_cast<std::uint32_t>(i), ranges[i]));
    }

    {
        auto lock = std::lock_guard(mutex_);
        stream.segment_count = segments.size();
        stream.assembler = std::move(assembler);
    }

    spdlog::debug("Job {}: fetching {} stream in {} segment(s)",
                  id_, to_string(stream.locator.kind), segments.size());

    WorkerPool pool(services_.source, services_.limiter, *stream.assembler,
                    bytes_done_, options_.retry, options_.threads);
    auto ec = pool.run(stream.locator.address, segments, resumable, stoken);

    if (ec == FetchErrc::unsupported_range) {
        // Bytes of the abandoned plan are fetched again
        std::uint64_t received = 0;
        for (const auto& segment : segments) {
            received += segment->received();
        }
        bytes_done_.fetch_sub(received, std::memory_order_relaxed);
    }
    return ec;
}

std::error_code Job::mux() {
    const auto& video = streams_[0].path;
    const auto& audio = streams_[1].path;
    const auto output = output_path();

    if (auto ec = services_.muxer.mux(video, audio, output)) {
        spdlog::error("Job {}: mux failed, keeping {} and {}", id_, video.string(), audio.string());
        return ec;
    }

    for (const auto& path : {video, audio}) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            spdlog::warn("Could not remove {}: {}", path.string(), ec.message());
        }
    }
    return {};
}

std::error_code Job::extract() {
    const auto& input = streams_[0].path;
    const auto output = output_path();

    if (auto ec = services_.muxer.extract_audio(input, output)) {
        spdlog::error("Job {}: audio extraction failed, keeping {}", id_, input.string());
        return ec;
    }

    std::error_code ec;
    std::filesystem::remove(input, ec);
    if (ec) {
        spdlog::warn("Could not remove {}: {}", input.string(), ec.message());
    }
    return {};
}

std::error_code Job::finish_with(JobState terminal, std::error_code ec) {
    if (terminal != JobState::done) {
        discard_partials();
    }

    {
        auto lock = std::lock_guard(mutex_);
        error_ = ec;
        finished_ = std::chrono::steady_clock::now();
    }

    if (transition(terminal)) {
        spdlog::error("Job {} [{}]: cannot enter {}", id_, identifier_, to_string(terminal));
    }

    switch (terminal) {
        case JobState::done:
            spdlog::debug("Job {} [{}]: saved {}", id_, identifier_, output_path().string());
            break;
        case JobState::canceled:
            spdlog::info("Job {} [{}]: canceled", id_, identifier_);
            break;
        default:
            spdlog::error("Job {} [{}] failed: {} ({})", id_, identifier_, ec.message(), error_kind(ec));
            break;
    }
    return ec;
}

void Job::discard_partials() noexcept {
    for (auto& stream : streams_) {
        if (stream.assembler) {
            stream.assembler->discard();
        }
    }
}

std::error_code Job::error() const {
    auto lock = std::lock_guard(mutex_);
    return error_;
}

std::filesystem::path Job::output_path() const {
    auto lock = std::lock_guard(mutex_);
    return output_path_;
}

std::string Job::title() const {
    auto lock = std::lock_guard(mutex_);
    return title_;
}

std::chrono::milliseconds Job::elapsed() const {
    auto lock = std::lock_guard(mutex_);
    if (started_ == std::chrono::steady_clock::time_point{}) {
        return std::chrono::milliseconds{0};
    }
    auto end = finished_ == std::chrono::steady_clock::time_point{}
        ? std::chrono::steady_clock::now()
        : finished_;
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - started_);
}

std::vector<Locator> Job::locators() const {
    auto lock = std::lock_guard(mutex_);
    std::vector<Locator> result;
    for (const auto& stream : streams_) {
        result.push_back(stream.locator);
    }
    return result;
}

std::vector<std::size_t> Job::segment_counts() const {
    auto lock = std::lock_guard(mutex_);
    std::vector<std::size_t> result;
    for (const auto& stream : streams_) {
        result.push_back(stream.segment_count);
    }
    return result;
}

} // namespace hdfetch::core
