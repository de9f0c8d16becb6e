// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/core/segment.hpp>

namespace hdfetch::core {

std::string ByteRange::header_value() const {
    if (!bounded) {
        return std::to_string(offset) + "-";
    }
    return std::to_string(offset) + "-" + std::to_string(last());
}

std::uint64_t Segment::remaining() const noexcept {
    if (!range_.bounded) return 0;
    auto got = received();
    if (got >= range_.length) return 0;
    return range_.length - got;
}

} // namespace hdfetch::core
