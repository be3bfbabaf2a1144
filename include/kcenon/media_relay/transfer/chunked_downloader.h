/**
 * @file chunked_downloader.h
 * @brief Pulls a remote file to local storage in bounded chunks
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_CHUNKED_DOWNLOADER_H
#define KCENON_MEDIA_RELAY_TRANSFER_CHUNKED_DOWNLOADER_H

#include <kcenon/media_relay/core/progress_sink.h>
#include <kcenon/media_relay/core/retry_policy.h>
#include <kcenon/media_relay/core/types.h>
#include <kcenon/media_relay/transfer/media_source.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::media_relay {

/**
 * @brief Downloader configuration
 */
struct downloader_config {
    std::size_t chunk_size = 256 * 1024;     // 256KB
    uint64_t min_valid_size = 1024 * 1024;   // existing artifacts above 1MB are reused
    retry_policy retry = default_retry();

    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Default download retry: 5 attempts, min(2^n, 60)s after a
     *        timeout, 10s after any other transient error
     */
    [[nodiscard]] static auto default_retry() -> retry_policy;
};

/**
 * @brief What to download and where
 */
struct download_request {
    std::string item_id;                  ///< For logs and progress
    std::string locator;                  ///< Remote source URL
    std::filesystem::path destination;    ///< Final artifact path
    std::optional<uint64_t> expected_size;///< Exact size required for reuse, if known
};

/**
 * @brief Result of a download
 */
struct download_outcome {
    std::filesystem::path path;
    uint64_t bytes = 0;
    bool reused = false;   ///< true if an existing artifact was returned
};

/**
 * @brief Chunked downloader with per-chunk retry
 *
 * Bytes are written to "<destination>.part" and renamed onto destination
 * after the final chunk. A failed chunk is retried on the same stream; the
 * attempt counter resets after every successful chunk.
 */
class chunked_downloader {
public:
    /**
     * @brief Construct a downloader
     * @param source Remote source
     * @param config Downloader configuration
     * @param progress Progress sink, may be null
     * @param sleeper Sleep hook used between retries
     */
    chunked_downloader(std::shared_ptr<media_source> source,
                       downloader_config config,
                       std::shared_ptr<progress_sink> progress = nullptr,
                       sleep_function sleeper = thread_sleeper());
    ~chunked_downloader();

    chunked_downloader(const chunked_downloader&) = delete;
    auto operator=(const chunked_downloader&) -> chunked_downloader& = delete;
    chunked_downloader(chunked_downloader&&) noexcept;
    auto operator=(chunked_downloader&&) noexcept -> chunked_downloader&;

    /**
     * @brief Download a file, reusing a valid existing artifact
     * @return Outcome, or a permanent error, download_failed after retries
     *         are exhausted, or file_size_mismatch
     */
    [[nodiscard]] auto download(const download_request& request) -> result<download_outcome>;

    [[nodiscard]] auto config() const -> const downloader_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_CHUNKED_DOWNLOADER_H
