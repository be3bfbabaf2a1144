/**
 * @file encoder_tool.h
 * @brief Interface to the external video re-encoding tool
 */

#ifndef KCENON_MEDIA_RELAY_COMPRESS_ENCODER_TOOL_H
#define KCENON_MEDIA_RELAY_COMPRESS_ENCODER_TOOL_H

#include <kcenon/media_relay/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace kcenon::media_relay {

/**
 * @brief Parameters for one re-encode
 */
struct encode_request {
    std::filesystem::path input;
    std::filesystem::path output;
    uint64_t video_bitrate = 0;        ///< Target video bitrate, bits per second
    uint64_t max_rate = 0;             ///< Peak video bitrate, bits per second
    uint64_t buffer_size = 0;          ///< Rate-control buffer, bits
    std::string video_codec = "libx264";
    std::string preset = "fast";
    std::string audio_codec = "aac";
    std::string audio_bitrate = "128k";
};

/**
 * @brief External re-encoding collaborator
 */
class encoder_tool {
public:
    virtual ~encoder_tool() = default;

    /**
     * @brief Capability probe
     * @return true if the tool can be run
     */
    [[nodiscard]] virtual auto is_available() -> bool = 0;

    /**
     * @brief Run the tool in analysis-only mode
     * @return Diagnostic output of the tool, or error if it could not run
     */
    [[nodiscard]] virtual auto analyze(const std::filesystem::path& input)
        -> result<std::string> = 0;

    /**
     * @brief Re-encode input to output, overwriting output
     * @return Exit code of the tool, or error if it could not run
     */
    [[nodiscard]] virtual auto encode(const encode_request& request) -> result<int> = 0;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_COMPRESS_ENCODER_TOOL_H
