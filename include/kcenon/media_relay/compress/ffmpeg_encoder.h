/**
 * @file ffmpeg_encoder.h
 * @brief encoder_tool backed by the ffmpeg command-line tool
 */

#ifndef KCENON_MEDIA_RELAY_COMPRESS_FFMPEG_ENCODER_H
#define KCENON_MEDIA_RELAY_COMPRESS_FFMPEG_ENCODER_H

#include <kcenon/media_relay/compress/encoder_tool.h>

#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Runs ffmpeg as a subprocess
 *
 * - probe:   ffmpeg -version
 * - analyze: ffmpeg -i <in> -f null -
 * - encode:  ffmpeg -i <in> -c:v libx264 -preset fast -b:v B -maxrate M
 *            -bufsize S -c:a aac -b:a 128k -y <out>
 */
class ffmpeg_encoder final : public encoder_tool {
public:
    explicit ffmpeg_encoder(std::string executable = "ffmpeg");

    [[nodiscard]] auto is_available() -> bool override;
    [[nodiscard]] auto analyze(const std::filesystem::path& input)
        -> result<std::string> override;
    [[nodiscard]] auto encode(const encode_request& request) -> result<int> override;

    /**
     * @brief Command line for an encode request
     */
    [[nodiscard]] auto build_encode_command(const encode_request& request) const
        -> std::vector<std::string>;

    [[nodiscard]] auto executable() const -> const std::string& { return executable_; }

private:
    std::string executable_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_COMPRESS_FFMPEG_ENCODER_H
