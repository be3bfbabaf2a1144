/**
 * @file local_media_source.h
 * @brief media_source serving files from a local directory
 */

#ifndef KCENON_MEDIA_RELAY_LOCAL_LOCAL_MEDIA_SOURCE_H
#define KCENON_MEDIA_RELAY_LOCAL_LOCAL_MEDIA_SOURCE_H

#include <kcenon/media_relay/transfer/media_source.h>

#include <filesystem>

namespace kcenon::media_relay {

/**
 * @brief Directory standing in for the remote object store
 *
 * A file identifier resolves to "<root>/<file_id>" or, if that does not
 * exist, "<root>/<file_id>.mp4".
 */
class local_media_source final : public media_source {
public:
    explicit local_media_source(std::filesystem::path root);

    [[nodiscard]] auto open_download(std::string_view file_id)
        -> result<std::unique_ptr<media_download_stream>> override;

    [[nodiscard]] auto name() const -> std::string override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_LOCAL_LOCAL_MEDIA_SOURCE_H
