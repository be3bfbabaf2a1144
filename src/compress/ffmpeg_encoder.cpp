/**
 * @file ffmpeg_encoder.cpp
 * @brief Implementation of ffmpeg_encoder
 */

#include <kcenon/media_relay/compress/ffmpeg_encoder.h>
#include <kcenon/media_relay/core/logging.h>
#include <kcenon/media_relay/core/process_runner.h>

namespace kcenon::media_relay {

ffmpeg_encoder::ffmpeg_encoder(std::string executable)
    : executable_(std::move(executable)) {}

auto ffmpeg_encoder::is_available() -> bool {
    auto probe = process_runner::run({executable_, "-version"});
    if (!probe) {
        MR_LOG_DEBUG(log_category::compress,
            "ffmpeg probe failed: " + probe.error().message);
        return false;
    }
    return probe.value().exit_code == 0;
}

auto ffmpeg_encoder::analyze(const std::filesystem::path& input) -> result<std::string> {
    auto run = process_runner::run({executable_, "-i", input.string(), "-f", "null", "-"});
    if (!run) {
        return unexpected(run.error());
    }
    return std::move(run.value().output);
}

auto ffmpeg_encoder::build_encode_command(const encode_request& request) const
    -> std::vector<std::string> {
    return {
        executable_,
        "-i", request.input.string(),
        "-c:v", request.video_codec,
        "-preset", request.preset,
        "-b:v", std::to_string(request.video_bitrate),
        "-maxrate", std::to_string(request.max_rate),
        "-bufsize", std::to_string(request.buffer_size),
        "-c:a", request.audio_codec,
        "-b:a", request.audio_bitrate,
        "-y",
        request.output.string(),
    };
}

auto ffmpeg_encoder::encode(const encode_request& request) -> result<int> {
    auto run = process_runner::run(build_encode_command(request));
    if (!run) {
        return unexpected(error{error_code::encoder_unavailable, run.error().message});
    }
    if (run.value().exit_code != 0) {
        auto& output = run.value().output;
        constexpr std::size_t tail = 2000;
        MR_LOG_WARN(log_category::compress,
            "ffmpeg exited with " + std::to_string(run.value().exit_code) + ": " +
            (output.size() > tail ? output.substr(output.size() - tail) : output));
    }
    return run.value().exit_code;
}

}  // namespace kcenon::media_relay
