/**
 * @file local_video_destination.cpp
 * @brief Implementation of local_video_destination
 */

#include <kcenon/media_relay/local/local_video_destination.h>
#include <kcenon/media_relay/core/json.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <vector>

namespace kcenon::media_relay {

namespace {

auto metadata_to_json(const publish_metadata& metadata, const std::string& source)
    -> json_value {
    auto tags = json_value::make_array();
    for (const auto& tag : metadata.tags) {
        tags.push_back(json_value::make_string(tag));
    }

    auto snippet = json_value::make_object();
    snippet.set("title", json_value::make_string(metadata.title));
    snippet.set("description", json_value::make_string(metadata.description));
    snippet.set("tags", std::move(tags));
    snippet.set("categoryId", json_value::make_string(metadata.category_id));

    auto status = json_value::make_object();
    status.set("privacyStatus", json_value::make_string(metadata.privacy_status));
    status.set("selfDeclaredMadeForKids", json_value::make_bool(metadata.made_for_kids));

    auto doc = json_value::make_object();
    doc.set("snippet", std::move(snippet));
    doc.set("status", std::move(status));
    doc.set("source", json_value::make_string(source));
    return doc;
}

class local_upload_session final : public video_upload_session {
public:
    local_upload_session(std::filesystem::path source,
                         std::ifstream in,
                         uint64_t total_size,
                         std::filesystem::path target,
                         std::string remote_id,
                         json_value metadata,
                         std::size_t chunk_size)
        : source_(std::move(source))
        , in_(std::move(in))
        , total_size_(total_size)
        , target_(std::move(target))
        , remote_id_(std::move(remote_id))
        , metadata_(std::move(metadata))
        , buffer_(chunk_size) {
        part_ = target_;
        part_ += ".part";
    }

    ~local_upload_session() override {
        if (done_) {
            return;
        }
        // Abandoned before confirmation: release the reserved identifier
        out_.close();
        std::error_code ec;
        std::filesystem::remove(part_, ec);
    }

    local_upload_session(const local_upload_session&) = delete;
    auto operator=(const local_upload_session&) -> local_upload_session& = delete;

    auto next_chunk() -> result<upload_chunk_status> override {
        if (done_) {
            return upload_chunk_status{1.0, remote_id_};
        }

        if (!out_.is_open()) {
            out_.open(part_, std::ios::binary | std::ios::trunc);
            if (!out_) {
                return unexpected(error{error_code::remote_client_error,
                                        "cannot create " + part_.string()});
            }
        }

        const auto remaining = total_size_ - bytes_sent_;
        const auto want = static_cast<std::size_t>(
            std::min<uint64_t>(remaining, buffer_.size()));
        if (want > 0) {
            in_.read(buffer_.data(), static_cast<std::streamsize>(want));
            if (static_cast<std::size_t>(in_.gcount()) != want) {
                return unexpected(error{error_code::remote_client_error,
                                        "short read from " + source_.string()});
            }
            out_.write(buffer_.data(), static_cast<std::streamsize>(want));
            if (!out_) {
                return unexpected(error{error_code::remote_server_error,
                                        "write failed: " + part_.string()});
            }
            bytes_sent_ += want;
        }

        if (bytes_sent_ < total_size_) {
            return upload_chunk_status{progress(), std::nullopt};
        }
        return finalize();
    }

    [[nodiscard]] auto bytes_sent() const -> uint64_t override { return bytes_sent_; }

    [[nodiscard]] auto total_size() const -> uint64_t override { return total_size_; }

private:
    [[nodiscard]] auto progress() const -> double {
        if (total_size_ == 0) {
            return 1.0;
        }
        return static_cast<double>(bytes_sent_) / static_cast<double>(total_size_);
    }

    auto finalize() -> result<upload_chunk_status> {
        out_.close();
        if (!out_) {
            return unexpected(error{error_code::remote_server_error,
                                    "failed to close " + part_.string()});
        }

        auto json_path = target_;
        json_path.replace_extension(".json");
        {
            std::ofstream meta(json_path, std::ios::trunc);
            meta << metadata_.dump(2) << "\n";
            if (!meta) {
                return unexpected(error{error_code::remote_server_error,
                                        "failed to write " + json_path.string()});
            }
        }

        std::error_code ec;
        std::filesystem::rename(part_, target_, ec);
        if (ec) {
            return unexpected(error{error_code::remote_server_error,
                                    "failed to publish " + target_.string() + ": " +
                                        ec.message()});
        }
        done_ = true;
        return upload_chunk_status{1.0, remote_id_};
    }

    std::filesystem::path source_;
    std::ifstream in_;
    uint64_t total_size_;
    std::filesystem::path target_;
    std::filesystem::path part_;
    std::string remote_id_;
    json_value metadata_;
    std::vector<char> buffer_;
    std::ofstream out_;
    uint64_t bytes_sent_ = 0;
    bool done_ = false;
};

}  // namespace

local_video_destination::local_video_destination(std::filesystem::path root)
    : root_(std::move(root)) {}

auto local_video_destination::next_remote_id() -> std::string {
    uint64_t highest = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end;
         it.increment(ec)) {
        auto stem = it->path().filename().string();
        stem = stem.substr(0, stem.find('.'));
        uint64_t value = 0;
        auto [ptr, parse_ec] = std::from_chars(stem.data(), stem.data() + stem.size(), value);
        if (parse_ec == std::errc{} && ptr == stem.data() + stem.size()) {
            highest = std::max(highest, value);
        }
    }
    return std::to_string(highest + 1);
}

auto local_video_destination::create_upload_session(const std::filesystem::path& path,
                                                    const publish_metadata& metadata,
                                                    std::size_t chunk_size)
    -> result<std::unique_ptr<video_upload_session>> {
    if (chunk_size == 0) {
        return unexpected(error{error_code::remote_client_error, "chunk size must be positive"});
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::remote_client_error,
                                "cannot stat " + path.string() + ": " + ec.message()});
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return unexpected(error{error_code::remote_client_error,
                                "cannot open " + path.string()});
    }

    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return unexpected(error{error_code::remote_server_error,
                                "cannot create " + root_.string() + ": " + ec.message()});
    }

    std::lock_guard lock(id_mutex_);
    auto remote_id = next_remote_id();
    auto target = root_ / (remote_id + ".mp4");

    // Reserve the identifier so a concurrent session does not reuse it
    {
        std::ofstream reserve(target.string() + ".part", std::ios::binary | std::ios::trunc);
        if (!reserve) {
            return unexpected(error{error_code::remote_server_error,
                                    "cannot create " + target.string() + ".part"});
        }
    }

    std::unique_ptr<video_upload_session> session = std::make_unique<local_upload_session>(
        path, std::move(in), size, target, remote_id,
        metadata_to_json(metadata, path.filename().string()), chunk_size);
    return session;
}

auto local_video_destination::name() const -> std::string {
    return "local:" + root_.string();
}

}  // namespace kcenon::media_relay
