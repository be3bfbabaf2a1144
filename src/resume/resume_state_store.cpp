/**
 * @file resume_state_store.cpp
 * @brief Implementation of resume_state_store
 */

#include <kcenon/media_relay/resume/resume_state_store.h>
#include <kcenon/media_relay/catalog/item.h>
#include <kcenon/media_relay/core/json.h>
#include <kcenon/media_relay/core/logging.h>

#include <ctime>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>

namespace kcenon::media_relay {

// ============================================================================
// Free functions
// ============================================================================

auto stage_from_string(std::string_view name) -> std::optional<pipeline_stage> {
    if (name == "downloading") return pipeline_stage::downloading;
    if (name == "compressing") return pipeline_stage::compressing;
    if (name == "uploading") return pipeline_stage::uploading;
    return std::nullopt;
}

resume_record::resume_record(std::string id, pipeline_stage entered, std::string name)
    : item_id(std::move(id))
    , stage(entered)
    , stage_entry_time(std::chrono::system_clock::now())
    , display_name(std::move(name)) {
}

auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

auto parse_iso8601(std::string_view text)
    -> std::optional<std::chrono::system_clock::time_point> {
    if (text.size() < 19) {
        return std::nullopt;
    }

    std::tm tm_buf{};
    std::istringstream iss(std::string(text.substr(0, 19)));
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm_buf));
}

// ============================================================================
// JSON mapping
// ============================================================================

namespace {

auto record_to_json(const resume_record& record) -> json_value {
    auto obj = json_value::make_object();
    obj.set("stage", json_value::make_string(to_string(record.stage)));
    obj.set("stage_entry_time",
            json_value::make_string(format_iso8601(record.stage_entry_time)));
    obj.set("display_name", json_value::make_string(record.display_name));
    if (record.source_size) {
        obj.set("source_size",
                json_value::make_number(static_cast<int64_t>(*record.source_size)));
    }
    if (record.stage == pipeline_stage::uploading) {
        if (record.local_path) {
            obj.set("local_path", json_value::make_string(record.local_path->string()));
        }
        if (record.artifact_size) {
            obj.set("artifact_size",
                    json_value::make_number(static_cast<int64_t>(*record.artifact_size)));
        }
        if (record.artifact_sha256) {
            obj.set("artifact_sha256", json_value::make_string(*record.artifact_sha256));
        }
        if (record.published_remote_id) {
            obj.set("published_remote_id",
                    json_value::make_string(*record.published_remote_id));
        }
    }
    return obj;
}

auto text_member(const json_value& obj, std::string_view key,
                 std::string_view legacy = {}) -> std::optional<std::string> {
    const auto* v = obj.find(key);
    if (!v && !legacy.empty()) {
        v = obj.find(legacy);
    }
    if (!v || !v->is_string() || v->as_string().empty()) {
        return std::nullopt;
    }
    return v->as_string();
}

auto size_member(const json_value& obj, std::string_view key) -> std::optional<uint64_t> {
    const auto* v = obj.find(key);
    if (!v) {
        return std::nullopt;
    }
    if (auto n = v->as_int64(); n && *n >= 0) {
        return static_cast<uint64_t>(*n);
    }
    return std::nullopt;
}

auto record_from_json(const std::string& id, const json_value& obj)
    -> result<resume_record> {
    if (!obj.is_object()) {
        return unexpected(error{error_code::state_corrupted, "record is not an object"});
    }

    auto stage_name = text_member(obj, "stage", "status");
    if (!stage_name) {
        return unexpected(error{error_code::state_corrupted, "record has no stage"});
    }
    auto stage = stage_from_string(*stage_name);
    if (!stage) {
        return unexpected(error{error_code::state_corrupted,
                                "unknown stage '" + *stage_name + "'"});
    }

    resume_record record;
    record.item_id = id;
    record.stage = *stage;
    record.display_name = text_member(obj, "display_name", "dish_name").value_or("");

    if (auto when = text_member(obj, "stage_entry_time", "start_time")) {
        if (auto tp = parse_iso8601(*when)) {
            record.stage_entry_time = *tp;
        }
    }

    record.source_size = size_member(obj, "source_size");
    if (record.stage == pipeline_stage::uploading) {
        if (auto path = text_member(obj, "local_path", "video_path")) {
            record.local_path = std::filesystem::path(*path);
        }
        record.artifact_size = size_member(obj, "artifact_size");
        record.artifact_sha256 = text_member(obj, "artifact_sha256");
        record.published_remote_id = text_member(obj, "published_remote_id");
    }
    return record;
}

}  // namespace

// ============================================================================
// resume_state_store::impl
// ============================================================================

class resume_state_store::impl {
public:
    impl(std::shared_ptr<state_backend> backend, std::string document)
        : backend_(std::move(backend)), document_(std::move(document)) {}

    auto load() -> result<void> {
        auto content = backend_->read(document_);
        if (!content) {
            return unexpected(content.error());
        }

        std::map<std::string, resume_record, item_id_less> loaded;
        if (content.value()) {
            auto parsed = json_value::parse(*content.value());
            if (!parsed || !parsed.value().is_object()) {
                MR_LOG_WARN(log_category::resume,
                    "Resume state " + backend_->describe(document_) +
                    " is malformed; starting with no resume data");
            } else {
                for (const auto& [id, value] : parsed.value().as_object()) {
                    auto record = record_from_json(id, value);
                    if (!record) {
                        MR_LOG_WARN(log_category::resume,
                            "Ignoring resume record " + id + ": " + record.error().message);
                        continue;
                    }
                    loaded.emplace(id, std::move(record.value()));
                }
            }
        }

        std::lock_guard lock(mutex_);
        records_ = std::move(loaded);
        MR_LOG_INFO(log_category::resume,
            "Loaded resume data for " + std::to_string(records_.size()) + " items");
        return {};
    }

    auto upsert(const resume_record& record) -> result<void> {
        std::lock_guard lock(mutex_);

        if (record.stage == pipeline_stage::uploading && record.local_path) {
            for (const auto& [id, other] : records_) {
                if (id != record.item_id && other.stage == pipeline_stage::uploading &&
                    other.local_path) {
                    MR_LOG_WARN(log_category::resume,
                        "Item " + id + " is also mid-upload; resume state is shared "
                        "by more than one driver");
                }
            }
        }

        std::optional<resume_record> previous;
        if (auto it = records_.find(record.item_id); it != records_.end()) {
            previous = it->second;
        }
        records_[record.item_id] = record;

        auto persisted = persist_locked();
        if (!persisted) {
            if (previous) {
                records_[record.item_id] = *previous;
            } else {
                records_.erase(record.item_id);
            }
            MR_LOG_ERROR(log_category::resume,
                "Failed to persist resume record " + record.item_id + ": " +
                persisted.error().message);
            return persisted;
        }

        MR_LOG_DEBUG(log_category::resume,
            "Item " + record.item_id + " entered stage " + to_string(record.stage));
        return {};
    }

    auto remove(std::string_view id) -> result<void> {
        std::lock_guard lock(mutex_);
        auto it = records_.find(std::string(id));
        if (it == records_.end()) {
            return {};
        }
        auto previous = it->second;
        records_.erase(it);

        auto persisted = persist_locked();
        if (!persisted) {
            records_.emplace(previous.item_id, previous);
            return persisted;
        }
        return {};
    }

    auto clear() -> result<void> {
        std::lock_guard lock(mutex_);
        auto previous = std::move(records_);
        records_.clear();

        auto persisted = persist_locked();
        if (!persisted) {
            records_ = std::move(previous);
            return persisted;
        }
        MR_LOG_INFO(log_category::resume, "Resume data cleared");
        return {};
    }

    auto get(std::string_view id) const -> std::optional<resume_record> {
        std::lock_guard lock(mutex_);
        auto it = records_.find(std::string(id));
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto records() const -> std::vector<resume_record> {
        std::lock_guard lock(mutex_);
        std::vector<resume_record> out;
        out.reserve(records_.size());
        for (const auto& [id, record] : records_) {
            out.push_back(record);
        }
        return out;
    }

    auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

private:
    auto persist_locked() -> result<void> {
        auto doc = json_value::make_object();
        for (const auto& [id, record] : records_) {
            doc.set(id, record_to_json(record));
        }
        return backend_->write(document_, doc.dump(2));
    }

    std::shared_ptr<state_backend> backend_;
    std::string document_;
    mutable std::mutex mutex_;
    std::map<std::string, resume_record, item_id_less> records_;
};

// ============================================================================
// resume_state_store
// ============================================================================

resume_state_store::resume_state_store(std::shared_ptr<state_backend> backend,
                                       std::string document)
    : impl_(std::make_unique<impl>(std::move(backend), std::move(document))) {}

resume_state_store::~resume_state_store() = default;

resume_state_store::resume_state_store(resume_state_store&&) noexcept = default;
auto resume_state_store::operator=(resume_state_store&&) noexcept
    -> resume_state_store& = default;

auto resume_state_store::load() -> result<void> {
    return impl_->load();
}

auto resume_state_store::upsert(const resume_record& record) -> result<void> {
    return impl_->upsert(record);
}

auto resume_state_store::remove(std::string_view id) -> result<void> {
    return impl_->remove(id);
}

auto resume_state_store::clear() -> result<void> {
    return impl_->clear();
}

auto resume_state_store::get(std::string_view id) const -> std::optional<resume_record> {
    return impl_->get(id);
}

auto resume_state_store::records() const -> std::vector<resume_record> {
    return impl_->records();
}

auto resume_state_store::size() const -> std::size_t {
    return impl_->size();
}

}  // namespace kcenon::media_relay
