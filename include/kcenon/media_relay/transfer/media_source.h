/**
 * @file media_source.h
 * @brief Interface to the remote object store media is downloaded from
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_MEDIA_SOURCE_H
#define KCENON_MEDIA_RELAY_TRANSFER_MEDIA_SOURCE_H

#include <kcenon/media_relay/core/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::media_relay {

/**
 * @brief Chunked download of one remote file
 *
 * Allows downloading large files in chunks without loading the entire file
 * into memory. A failed read does not advance the stream, so the caller can
 * simply call read() again to retry the same chunk.
 */
class media_download_stream {
public:
    virtual ~media_download_stream() = default;

    /**
     * @brief Read the next chunk
     * @param buffer Buffer to read into; its size is the chunk size
     * @return Bytes read, or transfer_timeout, connection_lost,
     *         remote_server_error or a permanent error
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief Check if stream has more data
     */
    [[nodiscard]] virtual auto has_more() const -> bool = 0;

    /**
     * @brief Get bytes read so far
     */
    [[nodiscard]] virtual auto bytes_read() const -> uint64_t = 0;

    /**
     * @brief Total size to download, or 0 if the source does not report one
     */
    [[nodiscard]] virtual auto total_size() const -> uint64_t = 0;

    /**
     * @brief Fraction complete, 0.0 to 1.0
     */
    [[nodiscard]] virtual auto progress() const -> double = 0;
};

/**
 * @brief Remote store serving media files by file identifier
 */
class media_source {
public:
    virtual ~media_source() = default;

    /**
     * @brief Open a download session
     * @param file_id Identifier extracted from the item locator
     * @return Stream, or source_not_found, source_access_denied or a
     *         transient transport error
     */
    [[nodiscard]] virtual auto open_download(std::string_view file_id)
        -> result<std::unique_ptr<media_download_stream>> = 0;

    /**
     * @brief Source name for log messages
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_MEDIA_SOURCE_H
