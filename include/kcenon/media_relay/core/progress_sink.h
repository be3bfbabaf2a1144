/**
 * @file progress_sink.h
 * @brief Progress reporting interface for long-running transfers
 */

#ifndef KCENON_MEDIA_RELAY_CORE_PROGRESS_SINK_H
#define KCENON_MEDIA_RELAY_CORE_PROGRESS_SINK_H

#include <cstdint>
#include <string>
#include <string_view>

namespace kcenon::media_relay {

/**
 * @brief Transfer direction reported with a progress event
 */
enum class transfer_direction {
    download,
    upload
};

[[nodiscard]] constexpr auto to_string(transfer_direction dir) -> const char* {
    return dir == transfer_direction::download ? "download" : "upload";
}

/**
 * @brief One progress observation
 */
struct progress_event {
    std::string_view item_id;
    transfer_direction direction = transfer_direction::download;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;    ///< 0 when the total is unknown
    double percent = 0.0;        ///< 0.0 to 100.0
};

/**
 * @brief Receiver for transfer progress
 *
 * Injected into the downloader and uploader; called after every chunk.
 */
class progress_sink {
public:
    virtual ~progress_sink() = default;

    virtual void on_progress(const progress_event& event) = 0;
};

/**
 * @brief Discards all progress events
 */
class null_progress_sink final : public progress_sink {
public:
    void on_progress(const progress_event&) override {}
};

/**
 * @brief Logs progress at info level whenever the whole percentage changes
 */
class logging_progress_sink final : public progress_sink {
public:
    void on_progress(const progress_event& event) override;

private:
    std::string last_item_;
    transfer_direction last_direction_ = transfer_direction::download;
    int last_percent_ = -1;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CORE_PROGRESS_SINK_H
