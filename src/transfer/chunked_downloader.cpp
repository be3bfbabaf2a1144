/**
 * @file chunked_downloader.cpp
 * @brief Implementation of chunked_downloader
 */

#include <kcenon/media_relay/transfer/chunked_downloader.h>
#include <kcenon/media_relay/catalog/item.h>
#include <kcenon/media_relay/core/logging.h>

#include <fstream>
#include <vector>

namespace kcenon::media_relay {

auto downloader_config::default_retry() -> retry_policy {
    retry_policy policy;
    policy.max_attempts = 5;
    policy.initial_delay = std::chrono::milliseconds{2000};
    policy.max_delay = std::chrono::milliseconds{60000};
    policy.non_timeout_delay = std::chrono::milliseconds{10000};
    return policy;
}

auto downloader_config::validate() const -> result<void> {
    if (chunk_size == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "download chunk_size must be positive"});
    }
    return retry.validate();
}

// ============================================================================
// chunked_downloader::impl
// ============================================================================

class chunked_downloader::impl {
public:
    impl(std::shared_ptr<media_source> source,
         downloader_config cfg,
         std::shared_ptr<progress_sink> progress,
         sleep_function sleeper)
        : source_(std::move(source))
        , config_(std::move(cfg))
        , progress_(progress ? std::move(progress)
                             : std::make_shared<null_progress_sink>())
        , sleep_(sleeper ? std::move(sleeper) : thread_sleeper()) {}

    auto download(const download_request& request) -> result<download_outcome> {
        if (auto existing = check_existing(request)) {
            return *existing;
        }

        auto file_id = extract_source_file_id(request.locator);
        if (!file_id) {
            MR_LOG_ERROR(log_category::download, file_id.error().message);
            return unexpected(file_id.error());
        }

        item_log_context ctx;
        ctx.item_id = request.item_id;
        ctx.filename = request.destination.filename().string();
        MR_LOG_INFO_CTX(log_category::download,
            "Starting download of " + file_id.value() + " from " + source_->name(), ctx);

        auto stream = open_with_retry(request, file_id.value());
        if (!stream) {
            return unexpected(stream.error());
        }
        return transfer(request, *stream.value());
    }

    std::shared_ptr<media_source> source_;
    downloader_config config_;
    std::shared_ptr<progress_sink> progress_;
    sleep_function sleep_;

private:
    auto check_existing(const download_request& request) const
        -> std::optional<download_outcome> {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(request.destination, ec)) {
            return std::nullopt;
        }
        auto size = std::filesystem::file_size(request.destination, ec);
        if (ec) {
            return std::nullopt;
        }

        const bool valid = request.expected_size ? size == *request.expected_size
                                                 : size > config_.min_valid_size;
        if (!valid) {
            MR_LOG_DEBUG(log_category::download,
                "Existing artifact " + request.destination.string() + " (" +
                std::to_string(size) + " bytes) is not reusable");
            return std::nullopt;
        }

        item_log_context ctx;
        ctx.item_id = request.item_id;
        ctx.filename = request.destination.filename().string();
        ctx.file_size = size;
        MR_LOG_INFO_CTX(log_category::download,
            "Found existing download at " + request.destination.string(), ctx);
        return download_outcome{request.destination, size, true};
    }

    /**
     * @brief Decide whether to retry after a transient failure
     * @return Empty on retry (after sleeping), otherwise the terminal error
     */
    auto handle_failure(const download_request& request, const error& err,
                        std::size_t& attempt) -> std::optional<error> {
        if (!is_retryable(err.code)) {
            return err;
        }

        ++attempt;
        item_log_context ctx;
        ctx.item_id = request.item_id;
        ctx.attempt = static_cast<uint32_t>(attempt);
        ctx.error_message = err.message;

        if (attempt > config_.retry.max_attempts) {
            MR_LOG_ERROR_CTX(log_category::download,
                "Download failed after " + std::to_string(config_.retry.max_attempts) +
                " retries", ctx);
            return error{error_code::download_failed,
                         "download failed after " +
                             std::to_string(config_.retry.max_attempts) +
                             " retries: " + err.message};
        }

        auto delay = retry_delay_for(config_.retry, err.code, attempt);
        ctx.delay_ms = static_cast<uint64_t>(delay.count());
        MR_LOG_WARN_CTX(log_category::download,
            std::string(is_timeout(err.code) ? "Chunk download timed out"
                                             : "Download error") +
            ", retrying (" + std::to_string(attempt) + "/" +
            std::to_string(config_.retry.max_attempts) + ")", ctx);
        sleep_(delay);
        return std::nullopt;
    }

    auto open_with_retry(const download_request& request, const std::string& file_id)
        -> result<std::unique_ptr<media_download_stream>> {
        std::size_t attempt = 0;
        while (true) {
            auto stream = source_->open_download(file_id);
            if (stream) {
                return stream;
            }
            if (auto terminal = handle_failure(request, stream.error(), attempt)) {
                return unexpected(std::move(*terminal));
            }
        }
    }

    auto transfer(const download_request& request, media_download_stream& stream)
        -> result<download_outcome> {
        std::error_code ec;
        if (request.destination.has_parent_path()) {
            std::filesystem::create_directories(request.destination.parent_path(), ec);
            if (ec) {
                return unexpected(error{error_code::file_write_error,
                                        "cannot create directory " +
                                            request.destination.parent_path().string() +
                                            ": " + ec.message()});
            }
        }

        auto part_path = request.destination;
        part_path += ".part";

        std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot open " + part_path.string() + " for writing"});
        }

        std::vector<std::byte> buffer(config_.chunk_size);
        uint64_t written = 0;
        std::size_t attempt = 0;

        while (stream.has_more()) {
            auto chunk = stream.read(buffer);
            if (chunk && chunk.value() == 0) {
                chunk = unexpected(error{error_code::connection_lost,
                                         "source returned an empty chunk"});
            }
            if (!chunk) {
                if (auto terminal = handle_failure(request, chunk.error(), attempt)) {
                    out.close();
                    discard(part_path);
                    return unexpected(std::move(*terminal));
                }
                continue;
            }

            out.write(reinterpret_cast<const char*>(buffer.data()),
                      static_cast<std::streamsize>(chunk.value()));
            if (!out) {
                out.close();
                discard(part_path);
                return unexpected(error{error_code::file_write_error,
                                        "write failed: " + part_path.string()});
            }
            written += chunk.value();
            attempt = 0;

            progress_event event;
            event.item_id = request.item_id;
            event.direction = transfer_direction::download;
            event.bytes_transferred = written;
            event.total_bytes = stream.total_size();
            event.percent = stream.progress() * 100.0;
            progress_->on_progress(event);
        }

        out.close();
        if (!out) {
            discard(part_path);
            return unexpected(error{error_code::file_write_error,
                                    "failed to close " + part_path.string()});
        }

        const auto expected = stream.total_size();
        if (expected > 0 && written != expected) {
            discard(part_path);
            MR_LOG_ERROR(log_category::download,
                "Downloaded " + std::to_string(written) + " bytes, source reported " +
                std::to_string(expected));
            return unexpected(error{error_code::file_size_mismatch,
                                    "downloaded " + std::to_string(written) +
                                        " bytes, expected " + std::to_string(expected)});
        }

        std::filesystem::rename(part_path, request.destination, ec);
        if (ec) {
            discard(part_path);
            return unexpected(error{error_code::file_write_error,
                                    "cannot move download into place: " + ec.message()});
        }

        item_log_context ctx;
        ctx.item_id = request.item_id;
        ctx.filename = request.destination.filename().string();
        ctx.file_size = written;
        MR_LOG_INFO_CTX(log_category::download,
            "Successfully downloaded to " + request.destination.string(), ctx);
        return download_outcome{request.destination, written, false};
    }

    static void discard(const std::filesystem::path& path) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            MR_LOG_WARN(log_category::download,
                "Failed to remove partial file " + path.string() + ": " + ec.message());
        }
    }
};

// ============================================================================
// chunked_downloader
// ============================================================================

chunked_downloader::chunked_downloader(std::shared_ptr<media_source> source,
                                       downloader_config config,
                                       std::shared_ptr<progress_sink> progress,
                                       sleep_function sleeper)
    : impl_(std::make_unique<impl>(std::move(source), std::move(config),
                                   std::move(progress), std::move(sleeper))) {}

chunked_downloader::~chunked_downloader() = default;

chunked_downloader::chunked_downloader(chunked_downloader&&) noexcept = default;
auto chunked_downloader::operator=(chunked_downloader&&) noexcept
    -> chunked_downloader& = default;

auto chunked_downloader::download(const download_request& request)
    -> result<download_outcome> {
    return impl_->download(request);
}

auto chunked_downloader::config() const -> const downloader_config& {
    return impl_->config_;
}

}  // namespace kcenon::media_relay
