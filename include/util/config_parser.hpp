#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace gzinspect::config {

// Optional JSON defaults for the command line. Every key may be absent.
struct InspectConfigFromFile {
    std::optional<std::uint64_t> block_size;
    std::optional<std::uint64_t> max_member_bytes;
    std::optional<std::string> output_format;
    std::optional<bool> progress;
    std::optional<LogLevel> log_level;

    void Reset();
    Result LoadFile(const std::string& path);
};

} // namespace gzinspect::config
