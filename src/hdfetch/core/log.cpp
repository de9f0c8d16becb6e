// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/core/log.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hdfetch::core {

void init_logging(bool verbose, bool quiet) {
    auto logger = spdlog::stderr_color_mt("hdfetch");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    if (verbose) {
        logger->set_level(spdlog::level::debug);
    } else if (quiet) {
        logger->set_level(spdlog::level::warn);
    } else {
        logger->set_level(spdlog::level::info);
    }
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(std::move(logger));
}

} // namespace hdfetch::core
