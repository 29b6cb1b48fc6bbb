#include "metadata.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace voicelink {
namespace voice {

using json = nlohmann::json;

namespace {
std::optional<std::string> string_at(const json& obj, const char* section, const char* key) {
    if (!obj.contains(section) || !obj[section].is_object()) {
        return std::nullopt;
    }
    const json& inner = obj[section];
    if (!inner.contains(key) || !inner[key].is_string()) {
        return std::nullopt;
    }
    return inner[key].get<std::string>();
}

template <typename T>
std::optional<T> number_at(const json& obj, const char* section, const char* key) {
    if (!obj.contains(section) || !obj[section].is_object()) {
        return std::nullopt;
    }
    const json& inner = obj[section];
    if (!inner.contains(key) || !inner[key].is_number_unsigned()) {
        return std::nullopt;
    }
    return inner[key].get<T>();
}
} // namespace

Metadata Metadata::from_dca_json(const std::string& text) {
    if (!json::accept(text)) {
        throw std::runtime_error("DCA metadata is not valid JSON");
    }
    const json j = json::parse(text);
    if (!j.is_object()) {
        throw std::runtime_error("DCA metadata is not a JSON object");
    }

    Metadata meta;
    meta.title = string_at(j, "info", "title");
    meta.artist = string_at(j, "info", "artist");
    meta.source_url = string_at(j, "origin", "location");
    meta.channels = number_at<uint8_t>(j, "opus", "channels");
    meta.sample_rate = number_at<uint32_t>(j, "opus", "sample_rate");
    return meta;
}

} // namespace voice
} // namespace voicelink
