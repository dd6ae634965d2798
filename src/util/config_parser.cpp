#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

#include <cerrno>

namespace gzinspect::config {

void InspectConfigFromFile::Reset() {
    block_size.reset();
    max_member_bytes.reset();
    output_format.reset();
    progress.reset();
    log_level.reset();
}

Result InspectConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ENOENT, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(EINVAL, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace gzinspect::config
