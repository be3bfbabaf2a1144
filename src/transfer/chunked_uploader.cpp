/**
 * @file chunked_uploader.cpp
 * @brief Implementation of chunked_uploader
 */

#include <kcenon/media_relay/transfer/chunked_uploader.h>
#include <kcenon/media_relay/core/logging.h>
#include <kcenon/media_relay/transfer/publish_metadata_builder.h>

#include <optional>

namespace kcenon::media_relay {

auto uploader_config::default_retry() -> retry_policy {
    retry_policy policy;
    policy.max_attempts = 15;
    policy.initial_delay = std::chrono::milliseconds{2000};
    policy.max_delay = std::chrono::milliseconds{120000};
    return policy;
}

auto uploader_config::validate() const -> result<void> {
    if (chunk_size == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "upload chunk_size must be positive"});
    }
    if (stall_threshold == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "stall_threshold must be positive"});
    }
    return retry.validate();
}

// ============================================================================
// chunked_uploader::impl
// ============================================================================

class chunked_uploader::impl {
public:
    impl(std::shared_ptr<video_destination> destination,
         uploader_config cfg,
         std::shared_ptr<progress_sink> progress,
         sleep_function sleeper)
        : destination_(std::move(destination))
        , config_(std::move(cfg))
        , progress_(progress ? std::move(progress)
                             : std::make_shared<null_progress_sink>())
        , sleep_(sleeper ? std::move(sleeper) : thread_sleeper()) {}

    auto upload(std::string_view item_id,
                const std::filesystem::path& path,
                publish_metadata metadata) -> result<upload_receipt> {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return unexpected(error{error_code::file_not_found,
                                    "upload source not found: " + path.string()});
        }
        const auto file_size = std::filesystem::file_size(path, ec);
        if (ec) {
            return unexpected(error{error_code::file_read_error,
                                    "cannot stat " + path.string() + ": " + ec.message()});
        }

        trim_tags(metadata.tags, config_.max_total_tag_length, config_.min_tag_count);

        item_log_context ctx;
        ctx.item_id = std::string(item_id);
        ctx.filename = path.filename().string();
        ctx.file_size = file_size;
        MR_LOG_INFO_CTX(log_category::upload,
            "Starting upload to " + destination_->name(), ctx);

        std::size_t retries = 0;
        std::unique_ptr<video_upload_session> session;
        while (!session) {
            auto created = destination_->create_upload_session(path, metadata,
                                                               config_.chunk_size);
            if (created) {
                session = std::move(created.value());
                break;
            }
            if (auto terminal = handle_failure(ctx, created.error(), retries)) {
                return unexpected(std::move(*terminal));
            }
        }

        double last_progress = -1.0;
        uint64_t last_sent = 0;
        std::size_t unchanged = 0;

        while (true) {
            auto status = session->next_chunk();
            if (status) {
                if (status.value().remote_id) {
                    report(item_id, *session, 1.0);
                    ctx.error_message.reset();
                    ctx.attempt.reset();
                    ctx.delay_ms.reset();
                    MR_LOG_INFO_CTX(log_category::upload,
                        "Upload confirmed, remote id " + *status.value().remote_id, ctx);
                    return upload_receipt{*status.value().remote_id, file_size, retries};
                }

                const double fraction = status.value().progress;
                report(item_id, *session, fraction);
                const auto sent = session->bytes_sent();
                if (fraction != last_progress || sent != last_sent) {
                    last_progress = fraction;
                    last_sent = sent;
                    unchanged = 0;
                    continue;
                }
                if (++unchanged < config_.stall_threshold) {
                    continue;
                }
                unchanged = 0;
                status = unexpected(error{error_code::transfer_stalled,
                                          "upload stalled at " + std::to_string(sent) +
                                              " of " + std::to_string(session->total_size()) +
                                              " bytes"});
            }

            if (auto terminal = handle_failure(ctx, status.error(), retries)) {
                return unexpected(std::move(*terminal));
            }
        }
    }

    std::shared_ptr<video_destination> destination_;
    uploader_config config_;
    std::shared_ptr<progress_sink> progress_;
    sleep_function sleep_;

private:
    void report(std::string_view item_id, const video_upload_session& session,
                double fraction) {
        progress_event event;
        event.item_id = item_id;
        event.direction = transfer_direction::upload;
        event.bytes_transferred = session.bytes_sent();
        event.total_bytes = session.total_size();
        event.percent = fraction * 100.0;
        progress_->on_progress(event);
    }

    /**
     * @brief Decide whether to retry after a failure
     * @return Empty on retry (after sleeping), otherwise the terminal error
     */
    auto handle_failure(item_log_context& ctx, const error& err, std::size_t& retries)
        -> std::optional<error> {
        ctx.error_message = err.message;

        if (!is_retryable(err.code)) {
            MR_LOG_ERROR_CTX(log_category::upload,
                std::string("Upload rejected (") + to_string(err.code) + "), not retrying",
                ctx);
            return err;
        }

        ++retries;
        ctx.attempt = static_cast<uint32_t>(retries);
        if (retries > config_.retry.max_attempts) {
            MR_LOG_ERROR_CTX(log_category::upload, "Maximum retries reached for upload", ctx);
            return error{error_code::upload_failed,
                         "upload failed after " +
                             std::to_string(config_.retry.max_attempts) +
                             " retries: " + err.message};
        }

        auto delay = retry_delay_for(config_.retry, err.code, retries);
        ctx.delay_ms = static_cast<uint64_t>(delay.count());
        MR_LOG_WARN_CTX(log_category::upload,
            std::string(to_string(err.code)) + ", retry " + std::to_string(retries) + "/" +
            std::to_string(config_.retry.max_attempts), ctx);
        sleep_(delay);
        return std::nullopt;
    }
};

// ============================================================================
// chunked_uploader
// ============================================================================

chunked_uploader::chunked_uploader(std::shared_ptr<video_destination> destination,
                                   uploader_config config,
                                   std::shared_ptr<progress_sink> progress,
                                   sleep_function sleeper)
    : impl_(std::make_unique<impl>(std::move(destination), std::move(config),
                                   std::move(progress), std::move(sleeper))) {}

chunked_uploader::~chunked_uploader() = default;

chunked_uploader::chunked_uploader(chunked_uploader&&) noexcept = default;
auto chunked_uploader::operator=(chunked_uploader&&) noexcept -> chunked_uploader& = default;

auto chunked_uploader::upload(std::string_view item_id,
                              const std::filesystem::path& path,
                              publish_metadata metadata) -> result<upload_receipt> {
    return impl_->upload(item_id, path, std::move(metadata));
}

auto chunked_uploader::config() const -> const uploader_config& {
    return impl_->config_;
}

}  // namespace kcenon::media_relay
