/**
 * @file chunked_uploader.h
 * @brief Pushes a local file to the video platform in bounded chunks
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_CHUNKED_UPLOADER_H
#define KCENON_MEDIA_RELAY_TRANSFER_CHUNKED_UPLOADER_H

#include <kcenon/media_relay/core/progress_sink.h>
#include <kcenon/media_relay/core/retry_policy.h>
#include <kcenon/media_relay/core/types.h>
#include <kcenon/media_relay/transfer/video_destination.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace kcenon::media_relay {

/**
 * @brief Uploader configuration
 */
struct uploader_config {
    std::size_t chunk_size = 256 * 1024;   // 256KB
    std::size_t stall_threshold = 5;       ///< Chunks without any progress that count as a stall
    std::size_t max_total_tag_length = 490;
    std::size_t min_tag_count = 5;
    retry_policy retry = default_retry();

    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Default upload retry: 15 attempts, min(2^n, 120)s
     */
    [[nodiscard]] static auto default_retry() -> retry_policy;
};

/**
 * @brief Confirmation of a finished upload
 */
struct upload_receipt {
    std::string remote_id;
    uint64_t bytes = 0;
    std::size_t retries = 0;
};

/**
 * @brief Resumable chunked uploader
 *
 * Transient failures (timeouts, stalls, 5xx) are retried on the same
 * session with exponential backoff; the retry budget covers the whole
 * upload. Client errors fail immediately with remote_client_error.
 * Exhausting the budget fails with upload_failed.
 */
class chunked_uploader {
public:
    chunked_uploader(std::shared_ptr<video_destination> destination,
                     uploader_config config,
                     std::shared_ptr<progress_sink> progress = nullptr,
                     sleep_function sleeper = thread_sleeper());
    ~chunked_uploader();

    chunked_uploader(const chunked_uploader&) = delete;
    auto operator=(const chunked_uploader&) -> chunked_uploader& = delete;
    chunked_uploader(chunked_uploader&&) noexcept;
    auto operator=(chunked_uploader&&) noexcept -> chunked_uploader&;

    /**
     * @brief Upload a file
     * @param item_id Item identifier for logs and progress
     * @param path Local file
     * @param metadata Publish metadata; the tag ceiling is enforced again
     * @return Receipt, or remote_client_error, upload_failed or a file error
     */
    [[nodiscard]] auto upload(std::string_view item_id,
                              const std::filesystem::path& path,
                              publish_metadata metadata) -> result<upload_receipt>;

    [[nodiscard]] auto config() const -> const uploader_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_CHUNKED_UPLOADER_H
