/**
 * @file progress_sink.cpp
 * @brief Logging implementation of progress_sink
 */

#include <kcenon/media_relay/core/progress_sink.h>
#include <kcenon/media_relay/core/logging.h>

namespace kcenon::media_relay {

void logging_progress_sink::on_progress(const progress_event& event) {
    const int percent = static_cast<int>(event.percent);
    if (event.item_id == last_item_ && event.direction == last_direction_ &&
        percent == last_percent_) {
        return;
    }
    last_item_ = std::string(event.item_id);
    last_direction_ = event.direction;
    last_percent_ = percent;

    item_log_context ctx;
    ctx.item_id = last_item_;
    ctx.bytes_transferred = event.bytes_transferred;
    if (event.total_bytes > 0) {
        ctx.file_size = event.total_bytes;
    }
    ctx.progress_percent = event.percent;

    auto category = event.direction == transfer_direction::download
                        ? log_category::download
                        : log_category::upload;
    MR_LOG_INFO_CTX(category,
                    std::string(to_string(event.direction)) + " " +
                        std::to_string(percent) + "%",
                    ctx);
}

}  // namespace kcenon::media_relay
