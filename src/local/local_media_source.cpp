/**
 * @file local_media_source.cpp
 * @brief Implementation of local_media_source
 */

#include <kcenon/media_relay/local/local_media_source.h>

#include <algorithm>
#include <fstream>

namespace kcenon::media_relay {

namespace {

class local_download_stream final : public media_download_stream {
public:
    local_download_stream(std::ifstream file, uint64_t size)
        : file_(std::move(file)), total_size_(size) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        const auto remaining = total_size_ - bytes_read_;
        const auto want = static_cast<std::size_t>(
            std::min<uint64_t>(remaining, buffer.size()));
        if (want == 0) {
            return std::size_t{0};
        }

        file_.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(file_.gcount());
        if (got != want) {
            return unexpected(error{error_code::file_read_error,
                                    "short read from local source"});
        }
        bytes_read_ += got;
        return got;
    }

    [[nodiscard]] auto has_more() const -> bool override { return bytes_read_ < total_size_; }

    [[nodiscard]] auto bytes_read() const -> uint64_t override { return bytes_read_; }

    [[nodiscard]] auto total_size() const -> uint64_t override { return total_size_; }

    [[nodiscard]] auto progress() const -> double override {
        if (total_size_ == 0) {
            return 1.0;
        }
        return static_cast<double>(bytes_read_) / static_cast<double>(total_size_);
    }

private:
    std::ifstream file_;
    uint64_t total_size_;
    uint64_t bytes_read_ = 0;
};

}  // namespace

local_media_source::local_media_source(std::filesystem::path root)
    : root_(std::move(root)) {}

auto local_media_source::open_download(std::string_view file_id)
    -> result<std::unique_ptr<media_download_stream>> {
    if (file_id.empty() || file_id.find('/') != std::string_view::npos ||
        file_id.find('\\') != std::string_view::npos || file_id == "." || file_id == "..") {
        return unexpected(error{error_code::source_access_denied,
                                "invalid file id: " + std::string(file_id)});
    }

    std::error_code ec;
    auto path = root_ / std::string(file_id);
    if (!std::filesystem::is_regular_file(path, ec)) {
        path = root_ / (std::string(file_id) + ".mp4");
        if (!std::filesystem::is_regular_file(path, ec)) {
            return unexpected(error{error_code::source_not_found,
                                    "no such file in " + root_.string() + ": " +
                                        std::string(file_id)});
        }
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::source_access_denied,
                                "cannot stat " + path.string() + ": " + ec.message()});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::source_access_denied,
                                "cannot open " + path.string()});
    }

    std::unique_ptr<media_download_stream> stream =
        std::make_unique<local_download_stream>(std::move(file), size);
    return stream;
}

auto local_media_source::name() const -> std::string {
    return "local:" + root_.string();
}

}  // namespace kcenon::media_relay
