// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <expected>
#include <string>
#include <system_error>
#include <vector>

namespace hdfetch::media {

struct ProcessResult {
    int exit_code{0};
    std::string output;  // Captured stdout
};

// Run `argv` (argv[0] searched in PATH) and wait for it. stdout is captured
// when `capture` is set, stderr is inherited.
[[nodiscard]] std::expected<ProcessResult, std::error_code>
run_process(const std::vector<std::string>& argv, bool capture = true);

} // namespace hdfetch::media
