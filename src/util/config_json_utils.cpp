#include "util/config_json_utils.hpp"

#include <fstream>

namespace gzinspect::config::detail {

namespace {

// Returns false if the key is present with the wrong type.
bool GetPositiveU64(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v <= 0) {
        err = std::string(key) + " must be positive";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetString(const nlohmann::json& j, const char* key, std::optional<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetBool(const nlohmann::json& j, const char* key, std::optional<bool>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, InspectConfigFromFile& cfg, std::string& err) {
    if (!GetPositiveU64(j, "BlockSize", cfg.block_size, err)) return false;
    if (!GetPositiveU64(j, "MaxMemberBytes", cfg.max_member_bytes, err)) return false;
    if (!GetBool(j, "Progress", cfg.progress, err)) return false;

    if (!GetString(j, "OutputFormat", cfg.output_format, err)) return false;
    if (cfg.output_format && *cfg.output_format != "human" && *cfg.output_format != "json") {
        err = "OutputFormat must be \"human\" or \"json\"";
        return false;
    }

    std::optional<std::string> level;
    if (!GetString(j, "LogLevel", level, err)) return false;
    if (level) {
        cfg.log_level = ParseLogLevel(*level);
        if (!cfg.log_level) {
            err = "unknown LogLevel: " + *level;
            return false;
        }
    }

    return true;
}

} // namespace gzinspect::config::detail
