#ifndef VOICELINK_METADATA_H
#define VOICELINK_METADATA_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace voicelink {
namespace voice {

/**
 * @struct Metadata
 * @brief Descriptive information about a source, where known.
 */
struct Metadata {
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> source_url;
    std::optional<uint8_t> channels;
    std::optional<uint32_t> sample_rate;
    std::optional<std::chrono::milliseconds> duration;

    /**
     * @brief Reads the JSON header of a DCA file.
     * @details Uses `info.title`, `info.artist`, `origin.location`, `opus.channels` and
     *          `opus.sample_rate`; missing keys stay empty.
     * @throws std::runtime_error if the text is not a JSON object.
     */
    static Metadata from_dca_json(const std::string& text);
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_METADATA_H
