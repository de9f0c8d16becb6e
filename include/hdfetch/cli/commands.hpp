// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/core/config.hpp>
#include <hdfetch/core/locator.hpp>
#include <hdfetch/core/scheduler.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace hdfetch::cli {

// Process exit codes
enum ExitCode : int {
    EXIT_ALL_DONE = 0,
    EXIT_ALL_FAILED = 1,
    EXIT_PARTIAL = 2,
    EXIT_USAGE = 3
};

// Command line arguments
struct CliArgs {
    std::vector<std::string> identifiers;
    std::string output_dir{core::DEFAULT_OUTPUT_DIR};
    std::uint32_t threads{core::DEFAULT_THREADS};
    core::Quality quality{core::Quality::best};
    std::optional<std::uint64_t> rate_limit;   // bytes/sec
    std::uint32_t retries{core::RETRY_COUNT};
    bool audio_only{false};
    bool keep_audio{false};
    bool list_formats{false};
    bool concurrent{false};
    bool all_or_nothing{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

struct UsageError {
    std::error_code code;  // invalid_argument or rate_parse_failed
    std::string message;
};

[[nodiscard]] std::expected<CliArgs, UsageError> parse_args(int argc, const char* const argv[]);

// "a, b,c" -> {"a", "b", "c"}; empty items dropped
[[nodiscard]] std::vector<std::string> split_identifiers(std::string_view list);

// Jobs run at once: min(N, MAX_CONCURRENT_JOBS) with --concurrent, else 1
[[nodiscard]] std::uint32_t concurrency_for(const CliArgs& args) noexcept;

[[nodiscard]] int exit_code_for(const core::Summary& summary) noexcept;

// Download every identifier and print the summary. Returns the exit code.
[[nodiscard]] int download(const CliArgs& args);

// Print the format table of the first identifier. Returns the exit code.
[[nodiscard]] int list_formats(const CliArgs& args);

void print_help(std::string_view program_name);
void print_version();

// Async-signal-safe interrupt flag polled by download()
void request_interrupt() noexcept;
[[nodiscard]] bool interrupt_requested() noexcept;

} // namespace hdfetch::cli
