/**
 * @file video_destination.h
 * @brief Interface to the video platform media is published to
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_VIDEO_DESTINATION_H
#define KCENON_MEDIA_RELAY_TRANSFER_VIDEO_DESTINATION_H

#include <kcenon/media_relay/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Metadata sent with an upload
 */
struct publish_metadata {
    std::string title;
    std::string description;
    std::vector<std::string> tags;
    std::string category_id = "22";
    std::string privacy_status = "public";
    bool made_for_kids = false;
};

/**
 * @brief Status returned after each uploaded chunk
 */
struct upload_chunk_status {
    double progress = 0.0;                 ///< Fraction complete, 0.0 to 1.0
    std::optional<std::string> remote_id;  ///< Set once the platform confirms
};

/**
 * @brief Resumable upload of one file
 *
 * Each next_chunk() call sends the next chunk. After a failure the session
 * resumes from the last byte the platform acknowledged.
 */
class video_upload_session {
public:
    virtual ~video_upload_session() = default;

    /**
     * @brief Send the next chunk
     * @return Status, or transfer_timeout, connection_lost,
     *         remote_server_error or remote_client_error
     */
    [[nodiscard]] virtual auto next_chunk() -> result<upload_chunk_status> = 0;

    /**
     * @brief Bytes acknowledged by the platform
     */
    [[nodiscard]] virtual auto bytes_sent() const -> uint64_t = 0;

    /**
     * @brief Size of the file being uploaded
     */
    [[nodiscard]] virtual auto total_size() const -> uint64_t = 0;
};

/**
 * @brief Video platform accepting resumable uploads
 */
class video_destination {
public:
    virtual ~video_destination() = default;

    /**
     * @brief Start a resumable upload
     * @param path Local file to upload
     * @param metadata Publish metadata
     * @param chunk_size Bytes per next_chunk() call
     * @return Session or error
     */
    [[nodiscard]] virtual auto create_upload_session(const std::filesystem::path& path,
                                                     const publish_metadata& metadata,
                                                     std::size_t chunk_size)
        -> result<std::unique_ptr<video_upload_session>> = 0;

    /**
     * @brief Destination name for log messages
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_VIDEO_DESTINATION_H
