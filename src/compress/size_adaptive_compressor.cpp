/**
 * @file size_adaptive_compressor.cpp
 * @brief Implementation of size_adaptive_compressor
 */

#include <kcenon/media_relay/compress/size_adaptive_compressor.h>
#include <kcenon/media_relay/core/logging.h>

#include <algorithm>
#include <iomanip>
#include <regex>
#include <sstream>

namespace kcenon::media_relay {

namespace {

auto format_mb(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
    return oss.str();
}

auto existing_size(const std::filesystem::path& path) -> std::optional<uint64_t> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        MR_LOG_WARN(log_category::compress,
            "Failed to remove " + path.string() + ": " + ec.message());
    }
}

}  // namespace

auto compressor_config::validate() const -> result<void> {
    if (target_ratio <= 0.0 || target_ratio > 1.0) {
        return unexpected(error{error_code::invalid_configuration,
                                "target_ratio must be in (0, 1]"});
    }
    if (accept_ratio <= 0.0 || accept_ratio > 1.0) {
        return unexpected(error{error_code::invalid_configuration,
                                "accept_ratio must be in (0, 1]"});
    }
    if (default_duration.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "default_duration must be positive"});
    }
    return {};
}

// ============================================================================
// size_adaptive_compressor::impl
// ============================================================================

class size_adaptive_compressor::impl {
public:
    impl(std::shared_ptr<encoder_tool> encoder, compressor_config cfg)
        : encoder_(std::move(encoder)), config_(std::move(cfg)) {}

    auto compress(std::string_view item_id,
                  const std::filesystem::path& input,
                  const std::filesystem::path& output) -> compression_outcome {
        compression_outcome outcome;
        outcome.path = input;

        item_log_context ctx;
        ctx.item_id = std::string(item_id);
        ctx.filename = input.filename().string();

        auto input_size = existing_size(input);
        if (!input_size) {
            return keep_original(outcome, ctx, "input is not readable");
        }
        outcome.input_size = *input_size;
        outcome.output_size = *input_size;
        ctx.file_size = *input_size;

        if (!config_.enabled) {
            return keep_original(outcome, ctx, "compression disabled");
        }

        if (auto previous = existing_size(output);
            previous && *previous >= config_.min_valid_size && *previous < *input_size) {
            MR_LOG_INFO_CTX(log_category::compress,
                "Found existing compressed video at " + output.string() + " (" +
                format_mb(*previous) + ")", ctx);
            outcome.path = output;
            outcome.compressed = true;
            outcome.reused = true;
            outcome.output_size = *previous;
            return outcome;
        }

        if (!encoder_ || !encoder_->is_available()) {
            return keep_original(outcome, ctx, to_string(error_code::encoder_unavailable));
        }

        MR_LOG_INFO_CTX(log_category::compress,
            "Original video size: " + format_mb(*input_size), ctx);
        if (*input_size < config_.min_input_size) {
            return keep_original(outcome, ctx,
                "video already small (" + format_mb(*input_size) + ")");
        }

        auto duration = config_.default_duration;
        if (auto diagnostics = encoder_->analyze(input)) {
            if (auto parsed = parse_duration(diagnostics.value())) {
                duration = *parsed;
            } else {
                MR_LOG_DEBUG(log_category::compress,
                    "Duration not found, assuming " +
                    std::to_string(config_.default_duration.count()) + "s");
            }
        } else {
            MR_LOG_WARN(log_category::compress,
                "Duration analysis failed: " + diagnostics.error().message);
        }

        const auto target_size = compute_target_size(*input_size, config_);
        const auto bitrate = compute_target_bitrate(*input_size, duration, config_);

        encode_request request;
        request.input = input;
        request.output = encoding_path_for(output);
        request.video_bitrate = bitrate;
        request.max_rate = static_cast<uint64_t>(static_cast<double>(bitrate) * 1.5);
        request.buffer_size = bitrate * 2;

        MR_LOG_INFO_CTX(log_category::compress,
            "Compressing video to target size: " + format_mb(target_size) +
            " (bitrate: " + std::to_string(bitrate / 1000) + " kbps)", ctx);

        auto exit_code = encoder_->encode(request);
        if (!exit_code) {
            remove_quietly(request.output);
            return keep_original(outcome, ctx, exit_code.error().message);
        }
        if (exit_code.value() != 0) {
            remove_quietly(request.output);
            return keep_original(outcome, ctx,
                std::string(to_string(error_code::encoding_failed)) + " (exit code " +
                std::to_string(exit_code.value()) + ")");
        }

        auto produced = existing_size(request.output);
        if (!produced) {
            return keep_original(outcome, ctx, "encoder produced no output");
        }

        MR_LOG_INFO_CTX(log_category::compress,
            "Compressed video size: " + format_mb(*produced), ctx);

        const auto limit = static_cast<double>(*input_size) * config_.accept_ratio;
        if (static_cast<double>(*produced) > limit) {
            remove_quietly(request.output);
            return keep_original(outcome, ctx, to_string(error_code::encoding_not_smaller));
        }
        if (*produced < config_.min_valid_size) {
            remove_quietly(request.output);
            return keep_original(outcome, ctx,
                "encoder output too small (" + format_mb(*produced) + ")");
        }

        std::error_code ec;
        std::filesystem::rename(request.output, output, ec);
        if (ec) {
            remove_quietly(request.output);
            return keep_original(outcome, ctx, "cannot move output into place: " + ec.message());
        }

        outcome.path = output;
        outcome.compressed = true;
        outcome.output_size = *produced;
        return outcome;
    }

    std::shared_ptr<encoder_tool> encoder_;
    compressor_config config_;

private:
    static auto keep_original(compression_outcome& outcome,
                              item_log_context& ctx,
                              std::string reason) -> compression_outcome {
        ctx.error_message = reason;
        MR_LOG_INFO_CTX(log_category::compress,
            "Using original video file: " + reason, ctx);
        outcome.compressed = false;
        outcome.output_size = outcome.input_size;
        outcome.reason = std::move(reason);
        return outcome;
    }
};

// ============================================================================
// size_adaptive_compressor
// ============================================================================

size_adaptive_compressor::size_adaptive_compressor(std::shared_ptr<encoder_tool> encoder,
                                                   compressor_config config)
    : impl_(std::make_unique<impl>(std::move(encoder), std::move(config))) {}

size_adaptive_compressor::~size_adaptive_compressor() = default;

size_adaptive_compressor::size_adaptive_compressor(size_adaptive_compressor&&) noexcept = default;
auto size_adaptive_compressor::operator=(size_adaptive_compressor&&) noexcept
    -> size_adaptive_compressor& = default;

auto size_adaptive_compressor::compress(std::string_view item_id,
                                        const std::filesystem::path& input,
                                        const std::filesystem::path& output)
    -> compression_outcome {
    return impl_->compress(item_id, input, output);
}

auto size_adaptive_compressor::parse_duration(std::string_view diagnostics)
    -> std::optional<std::chrono::seconds> {
    static const std::regex duration_pattern(R"(Duration: (\d{2}):(\d{2}):(\d{2}))");

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(diagnostics.begin(), diagnostics.end(), match, duration_pattern)) {
        return std::nullopt;
    }

    auto hours = std::stoi(match[1].str());
    auto minutes = std::stoi(match[2].str());
    auto seconds = std::stoi(match[3].str());
    auto total = hours * 3600 + minutes * 60 + seconds;
    if (total <= 0) {
        return std::nullopt;
    }
    return std::chrono::seconds(total);
}

auto size_adaptive_compressor::compute_target_size(uint64_t input_size,
                                                   const compressor_config& config)
    -> uint64_t {
    const auto scaled =
        static_cast<uint64_t>(static_cast<double>(input_size) * config.target_ratio);
    return std::max(config.min_target_size, scaled);
}

auto size_adaptive_compressor::compute_target_bitrate(uint64_t input_size,
                                                      std::chrono::seconds duration,
                                                      const compressor_config& config)
    -> uint64_t {
    const auto seconds = duration.count() > 0 ? duration.count()
                                              : config.default_duration.count();
    return compute_target_size(input_size, config) * 8 / static_cast<uint64_t>(seconds);
}

auto size_adaptive_compressor::encoding_path_for(const std::filesystem::path& output)
    -> std::filesystem::path {
    auto temp = output;
    temp.replace_filename(output.stem().string() + ".encoding.mp4");
    return temp;
}

auto size_adaptive_compressor::config() const -> const compressor_config& {
    return impl_->config_;
}

}  // namespace kcenon::media_relay
