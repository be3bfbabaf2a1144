/**
 * @file size_adaptive_compressor.h
 * @brief Optional re-encode toward a size-derived target bitrate
 */

#ifndef KCENON_MEDIA_RELAY_COMPRESS_SIZE_ADAPTIVE_COMPRESSOR_H
#define KCENON_MEDIA_RELAY_COMPRESS_SIZE_ADAPTIVE_COMPRESSOR_H

#include <kcenon/media_relay/compress/encoder_tool.h>
#include <kcenon/media_relay/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::media_relay {

/**
 * @brief Compressor configuration
 */
struct compressor_config {
    bool enabled = true;
    uint64_t min_input_size = 10ULL * 1024 * 1024;     ///< Smaller inputs are not re-encoded
    uint64_t min_target_size = 5ULL * 1024 * 1024;     ///< Floor for the target size
    double target_ratio = 0.5;                         ///< Target size as a fraction of input
    double accept_ratio = 0.9;                         ///< Reject outputs above this fraction
    std::chrono::seconds default_duration{120};        ///< Used when duration is unknown
    uint64_t min_valid_size = 1024 * 1024;             ///< Smallest output accepted or reused

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Result of the compression stage; always names an existing file
 */
struct compression_outcome {
    std::filesystem::path path;   ///< Compressed output, or the original input
    bool compressed = false;      ///< true if path is the compressed output
    bool reused = false;          ///< true if an earlier compressed output was reused
    uint64_t input_size = 0;
    uint64_t output_size = 0;     ///< Size of path
    std::string reason;           ///< Why the original was kept, empty on success
};

/**
 * @brief Re-encodes a file toward a target size, falling back to the input
 *
 * target_size = max(min_target_size, target_ratio * input_size)
 * target_bitrate = target_size * 8 / duration_seconds
 *
 * The encoder writes "<stem>.encoding.mp4" beside the output, which is
 * renamed into place only after it passes validation.
 */
class size_adaptive_compressor {
public:
    size_adaptive_compressor(std::shared_ptr<encoder_tool> encoder, compressor_config config);
    ~size_adaptive_compressor();

    size_adaptive_compressor(const size_adaptive_compressor&) = delete;
    auto operator=(const size_adaptive_compressor&) -> size_adaptive_compressor& = delete;
    size_adaptive_compressor(size_adaptive_compressor&&) noexcept;
    auto operator=(size_adaptive_compressor&&) noexcept -> size_adaptive_compressor&;

    /**
     * @brief Compress input into output, or keep input
     * @param item_id Item identifier for logs
     * @param input Source file
     * @param output Compressed artifact path
     * @return Outcome; never fails
     */
    [[nodiscard]] auto compress(std::string_view item_id,
                                const std::filesystem::path& input,
                                const std::filesystem::path& output) -> compression_outcome;

    /**
     * @brief Parse "Duration: HH:MM:SS" from encoder diagnostics
     * @return Duration, or nullopt if absent or zero
     */
    [[nodiscard]] static auto parse_duration(std::string_view diagnostics)
        -> std::optional<std::chrono::seconds>;

    /**
     * @brief Target size in bytes for an input size
     */
    [[nodiscard]] static auto compute_target_size(uint64_t input_size,
                                                  const compressor_config& config)
        -> uint64_t;

    /**
     * @brief Target video bitrate in bits per second
     */
    [[nodiscard]] static auto compute_target_bitrate(uint64_t input_size,
                                                     std::chrono::seconds duration,
                                                     const compressor_config& config)
        -> uint64_t;

    /**
     * @brief Temporary path the encoder writes to for an output path
     */
    [[nodiscard]] static auto encoding_path_for(const std::filesystem::path& output)
        -> std::filesystem::path;

    [[nodiscard]] auto config() const -> const compressor_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_COMPRESS_SIZE_ADAPTIVE_COMPRESSOR_H
