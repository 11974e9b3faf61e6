#ifndef PIPEFLOW_COMMON_UTILS_H
#define PIPEFLOW_COMMON_UTILS_H

#include "types.h"
#include <string>
#include <string_view>
#include <cstdint>
#include <cctype>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace pipeflow {

// Convert a parsed YAML tree into the equivalent JSON value (scalars typed)
nlohmann::json yaml_to_json(const YAML::Node& node);

// Load a JSON or YAML document; the extension picks the parser (.yaml/.yml → YAML)
nlohmann::json load_document(const std::string& file_path);

std::string base64_encode(std::string_view input);

// RFC 3986 percent-encoding of everything but unreserved characters
std::string url_encode(std::string_view input);

inline bool is_absolute_url(std::string_view url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

// "2026-01-31T12:00:00.000Z"
std::string format_iso8601(TimePoint tp);
TimePoint parse_iso8601(const std::string& text);

inline int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

// Value → text the way a template or header would show it (strings unquoted, null empty)
std::string value_to_text(const nlohmann::json& value);

// JS-like truthiness: null, false, 0 and "" are falsy; objects and arrays are truthy
bool is_truthy(const nlohmann::json& value);

inline std::string to_upper(std::string text) {
    for (auto& c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return text;
}

inline std::string to_lower(std::string text) {
    for (auto& c : text) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return text;
}

std::string trim(std::string_view text);

} // namespace pipeflow

#endif // PIPEFLOW_COMMON_UTILS_H
