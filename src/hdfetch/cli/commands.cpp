// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/cli/commands.hpp>
#include <hdfetch/cli/progress_bar.hpp>
#include <hdfetch/core/http_session.hpp>
#include <hdfetch/core/rate_limiter.hpp>
#include <hdfetch/core/segment_planner.hpp>
#include <hdfetch/media/muxer.hpp>
#include <hdfetch/media/ytdlp_resolver.hpp>
#include <hdfetch/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <charconv>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace chrono = std::chrono;

namespace hdfetch::cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

UsageError usage(std::string message) {
    return {make_error_code(core::FetchErrc::invalid_argument), std::move(message)};
}

std::optional<std::uint32_t> parse_count(std::string_view text) noexcept {
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string seconds(chrono::milliseconds elapsed) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << static_cast<double>(elapsed.count()) / 1000.0;
    return ss.str();
}

// Curl global state for the lifetime of a command
struct CurlScope {
    CurlScope() { core::HttpSession::global_init(); }
    ~CurlScope() { core::HttpSession::global_cleanup(); }
};

} // namespace

void request_interrupt() noexcept {
    g_interrupted = 1;
}

bool interrupt_requested() noexcept {
    return g_interrupted != 0;
}

//=============================================================================
// Argument parsing
//=============================================================================

std::vector<std::string> split_identifiers(std::string_view list) {
    std::vector<std::string> ids;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto item = list.substr(0, comma);

        auto first = item.find_first_not_of(" \t");
        if (first != std::string_view::npos) {
            auto last = item.find_last_not_of(" \t");
            ids.emplace_back(item.substr(first, last - first + 1));
        }

        if (comma == std::string_view::npos) break;
        list.remove_prefix(comma + 1);
    }
    return ids;
}

std::expected<CliArgs, UsageError> parse_args(int argc, const char* const argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string_view(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--audio-only") {
            args.audio_only = true;
        } else if (arg == "--keep-audio") {
            args.keep_audio = true;
        } else if (arg == "--list-formats") {
            args.list_formats = true;
        } else if (arg == "--concurrent") {
            args.concurrent = true;
        } else if (arg == "--all-or-nothing") {
            args.all_or_nothing = true;
        } else if (arg == "-o" || arg == "--output") {
            auto v = value();
            if (!v || v->empty()) return std::unexpected(usage("--output needs a directory"));
            args.output_dir = std::string(*v);
        } else if (arg == "--threads") {
            auto v = value();
            auto n = v ? parse_count(*v) : std::nullopt;
            if (!n || *n == 0) return std::unexpected(usage("--threads needs a positive number"));
            args.threads = core::clamp_threads(*n);
        } else if (arg == "--retries") {
            auto v = value();
            auto n = v ? parse_count(*v) : std::nullopt;
            if (!n || *n == 0) return std::unexpected(usage("--retries needs a number of at least 1"));
            args.retries = *n;
        } else if (arg == "--quality") {
            auto v = value();
            auto q = v ? core::parse_quality(*v) : std::nullopt;
            if (!q) return std::unexpected(usage("--quality must be one of 1080p, 1440p, 2160p, best"));
            args.quality = *q;
        } else if (arg == "--limit-rate") {
            auto v = value();
            if (!v) return std::unexpected(usage("--limit-rate needs a rate such as 50M"));
            auto rate = core::parse_rate(*v);
            if (!rate) {
                return std::unexpected(UsageError{rate.error(),
                    "Invalid rate '" + std::string(*v) + "': use a number with a K, M or G suffix"});
            }
            args.rate_limit = *rate;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            return std::unexpected(usage("Unknown option: " + std::string(arg)));
        } else {
            for (auto& id : split_identifiers(arg)) {
                args.identifiers.push_back(std::move(id));
            }
        }
    }

    if (args.identifiers.empty()) {
        return std::unexpected(usage("No video identifier specified"));
    }
    return args;
}

std::uint32_t concurrency_for(const CliArgs& args) noexcept {
    if (!args.concurrent) return 1;
    auto n = static_cast<std::uint32_t>(std::min<std::size_t>(args.identifiers.size(), core::MAX_CONCURRENT_JOBS));
    return std::max<std::uint32_t>(n, 1);
}

int exit_code_for(const core::Summary& summary) noexcept {
    const auto done = summary.succeeded();
    if (done == summary.jobs.size()) return EXIT_ALL_DONE;
    if (done == 0) return EXIT_ALL_FAILED;
    return EXIT_PARTIAL;
}

//=============================================================================
// Commands
//=============================================================================

int download(const CliArgs& args) {
    CurlScope curl;

    core::TokenBucket limiter(args.rate_limit);
    core::HttpSession session;
    media::YtDlpResolver resolver;
    media::FfmpegMuxer muxer;

    core::JobOptions options;
    options.quality = args.quality;
    options.audio_only = args.audio_only;
    options.extract_audio = !args.keep_audio;
    options.threads = args.threads;
    options.output_dir = args.output_dir;
    options.retry.max_attempts = args.retries;

    core::SchedulerConfig config;
    config.concurrency = concurrency_for(args);
    config.all_or_nothing = args.all_or_nothing;

    std::cout << "Downloading " << args.identifiers.size() << " video(s)"
              << " | quality: " << core::to_string(args.quality)
              << " | output: " << args.output_dir
              << " | threads: " << args.threads;
    if (args.rate_limit) {
        std::cout << " | limit: " << ProgressBar::format_speed(*args.rate_limit);
    }
    std::cout << std::endl;

    core::JobScheduler scheduler(config, options, core::JobServices{resolver, session, limiter, muxer});

    core::Summary summary;
    std::atomic<bool> finished{false};
    std::jthread worker([&] {
        summary = scheduler.run(args.identifiers);
        finished.store(true, std::memory_order_release);
    });

    ProgressBar bar(std::cout);
    Spinner spinner(std::cout);
    bool cancelling = false;
    std::uint64_t last_bytes = 0;
    auto last_tick = chrono::steady_clock::now();
    std::uint64_t speed = 0;

    while (!finished.load(std::memory_order_acquire)) {
        if (interrupt_requested() && !cancelling) {
            cancelling = true;
            spdlog::warn("Interrupted, cancelling active downloads");
            scheduler.cancel();
        }

        if (!args.quiet) {
            auto p = scheduler.progress();
            auto now = chrono::steady_clock::now();
            auto dt = chrono::duration_cast<chrono::milliseconds>(now - last_tick).count();
            if (dt >= 1000) {
                speed = (p.bytes_done - std::min(p.bytes_done, last_bytes)) * 1000 / static_cast<std::uint64_t>(dt);
                last_bytes = p.bytes_done;
                last_tick = now;
            }

            const auto finished_jobs = p.done + p.failed + p.canceled;
            bar.label(std::to_string(finished_jobs) + "/" + std::to_string(args.identifiers.size()));
            if (p.bytes_total == 0) {
                spinner.update(p.bytes_done == 0
                    ? "Resolving " + std::to_string(p.active) + " job(s)..."
                    : ProgressBar::format_bytes(p.bytes_done) + " downloaded");
            } else {
                spinner.clear();
                bar.total(p.bytes_total);
                bar.update(p.bytes_done, speed);
            }
        }
        std::this_thread::sleep_for(core::PROGRESS_INTERVAL);
    }
    worker.join();

    if (!args.quiet) {
        spinner.clear();
        bar.clear();
    }

    std::cout << "Finished in " << seconds(summary.elapsed) << " seconds: "
              << summary.succeeded() << " succeeded, "
              << summary.failed() << " failed, "
              << summary.canceled() << " canceled" << std::endl;

    for (const auto& job : summary.jobs) {
        if (job.state == core::JobState::done) {
            std::cout << "  " << job.identifier << " -> " << job.output.string()
                      << " (" << ProgressBar::format_bytes(job.bytes) << ")" << std::endl;
        } else if (job.state == core::JobState::failed) {
            std::cout << "  " << job.identifier << ": " << core::error_kind(job.error)
                      << ": " << job.error.message() << std::endl;
        }
    }

    return exit_code_for(summary);
}

int list_formats(const CliArgs& args) {
    media::YtDlpResolver resolver;
    const auto& id = args.identifiers.front();

    auto formats = resolver.list_formats(id);
    if (!formats) {
        std::cerr << "Error: " << id << ": " << core::error_kind(formats.error())
                  << ": " << formats.error().message() << std::endl;
        return EXIT_ALL_FAILED;
    }

    std::cout << "Available formats for " << id << ":\n";
    std::cout << std::left
              << std::setw(10) << "ID"
              << std::setw(6) << "EXT"
              << std::setw(12) << "RESOLUTION"
              << std::setw(5) << "FPS"
              << std::setw(14) << "VCODEC"
              << std::setw(12) << "ACODEC"
              << std::setw(11) << "SIZE"
              << "NOTE\n";

    for (const auto& f : *formats) {
        std::cout << std::setw(10) << f.format_id
                  << std::setw(6) << f.container
                  << std::setw(12) << (f.resolution.empty() ? "-" : f.resolution)
                  << std::setw(5) << (f.fps > 0 ? std::to_string(static_cast<int>(f.fps)) : "-")
                  << std::setw(14) << (f.video_codec.empty() ? "-" : f.video_codec.substr(0, 13))
                  << std::setw(12) << (f.audio_codec.empty() ? "-" : f.audio_codec.substr(0, 11))
                  << std::setw(11) << (f.size ? ProgressBar::format_bytes(*f.size) : "-")
                  << f.note << '\n';
    }
    std::cout << std::flush;
    return EXIT_ALL_DONE;
}

void print_help(std::string_view program_name) {
    std::cout << "hdfetch " << version.to_string() << " - segmented parallel video downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <ID>[,<ID>...]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  --threads <N>           Segments fetched in parallel per video (default: 4, max: 32)\n";
    std::cout << "  --quality <Q>           1080p, 1440p, 2160p or best (default: best)\n";
    std::cout << "  -o, --output <DIR>      Output directory (default: downloads)\n";
    std::cout << "  --audio-only            Download the audio track only, converted to mp3\n";
    std::cout << "  --keep-audio            With --audio-only, keep the original audio format\n";
    std::cout << "  --list-formats          List available formats of the first video and exit\n";
    std::cout << "  --concurrent            Download up to 4 videos at the same time\n";
    std::cout << "  --limit-rate <RATE>     Total bandwidth cap, e.g. 500K, 50M, 1.5G\n";
    std::cout << "  --all-or-nothing        Cancel the remaining videos after a failure\n";
    std::cout << "  --retries <N>           Attempts per segment (default: 3)\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             No progress bar, warnings and errors only\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "\n";
    std::cout << "EXIT STATUS:\n";
    std::cout << "  0 all videos downloaded, 1 none downloaded, 2 some failed, 3 usage error\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " dQw4w9WgXcQ\n";
    std::cout << "  " << program_name << " --quality 1080p --threads 8 -o videos dQw4w9WgXcQ\n";
    std::cout << "  " << program_name << " --concurrent --limit-rate 10M id1,id2,id3\n";
}

void print_version() {
    std::cout << "hdfetch " << version.to_string() << " (built " << BUILD_DATE << ")" << std::endl;
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann/json\n";
}

} // namespace hdfetch::cli
