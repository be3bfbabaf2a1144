/**
 * @file local_video_destination.h
 * @brief video_destination publishing into a local directory
 */

#ifndef KCENON_MEDIA_RELAY_LOCAL_LOCAL_VIDEO_DESTINATION_H
#define KCENON_MEDIA_RELAY_LOCAL_LOCAL_VIDEO_DESTINATION_H

#include <kcenon/media_relay/transfer/video_destination.h>

#include <filesystem>
#include <mutex>

namespace kcenon::media_relay {

/**
 * @brief Directory standing in for the video platform
 *
 * Each upload is assigned the next sequential identifier N and produces
 * "<root>/N.mp4" plus "<root>/N.json" holding the publish metadata. Bytes
 * are staged in "<root>/N.mp4.part" until the final chunk.
 */
class local_video_destination final : public video_destination {
public:
    explicit local_video_destination(std::filesystem::path root);

    [[nodiscard]] auto create_upload_session(const std::filesystem::path& path,
                                             const publish_metadata& metadata,
                                             std::size_t chunk_size)
        -> result<std::unique_ptr<video_upload_session>> override;

    [[nodiscard]] auto name() const -> std::string override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    [[nodiscard]] auto next_remote_id() -> std::string;

    std::filesystem::path root_;
    std::mutex id_mutex_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_LOCAL_LOCAL_VIDEO_DESTINATION_H
