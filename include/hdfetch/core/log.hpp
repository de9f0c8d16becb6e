// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

namespace hdfetch::core {

// Install the process-wide stderr logger. verbose = debug, quiet = warn,
// otherwise info.
void init_logging(bool verbose, bool quiet);

} // namespace hdfetch::core
