/**
 * @file resume_state_store.h
 * @brief Persisted per-item pipeline progress for crash recovery
 * @version 0.1.0
 *
 * The store maps an item identifier to the pipeline stage it was last
 * entered. It is written on every stage transition so a killed process can
 * pick the item up where it stopped.
 */

#ifndef KCENON_MEDIA_RELAY_RESUME_RESUME_STATE_STORE_H
#define KCENON_MEDIA_RELAY_RESUME_RESUME_STATE_STORE_H

#include <kcenon/media_relay/core/types.h>
#include <kcenon/media_relay/storage/state_backend.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Non-terminal pipeline stages recorded in resume state
 */
enum class pipeline_stage {
    downloading,
    compressing,
    uploading
};

[[nodiscard]] constexpr auto to_string(pipeline_stage stage) -> const char* {
    switch (stage) {
        case pipeline_stage::downloading: return "downloading";
        case pipeline_stage::compressing: return "compressing";
        case pipeline_stage::uploading: return "uploading";
        default: return "unknown";
    }
}

/**
 * @brief Parse a stage name
 * @return Stage, or nullopt for an unknown name
 */
[[nodiscard]] auto stage_from_string(std::string_view name) -> std::optional<pipeline_stage>;

/**
 * @brief Resume record for one item
 *
 * local_path, artifact_size, artifact_sha256 and published_remote_id are
 * only meaningful when stage is uploading. source_size is the size of the
 * downloaded original once the download finished. published_remote_id is set
 * once the platform confirmed the upload and the item only awaits its ledger
 * commit.
 */
struct resume_record {
    std::string item_id;                                   ///< Item identifier
    pipeline_stage stage = pipeline_stage::downloading;    ///< Last stage entered
    std::chrono::system_clock::time_point stage_entry_time;///< When the stage began
    std::string display_name;                              ///< Item display name
    std::optional<std::filesystem::path> local_path;       ///< Upload artifact
    std::optional<uint64_t> artifact_size;                 ///< Upload artifact size
    std::optional<std::string> artifact_sha256;            ///< Upload artifact digest
    std::optional<uint64_t> source_size;                   ///< Downloaded original size
    std::optional<std::string> published_remote_id;        ///< Confirmed remote identifier

    resume_record() = default;

    /**
     * @brief Create a record entering a stage now
     */
    resume_record(std::string id, pipeline_stage entered, std::string name);
};

/**
 * @brief Format a time point as ISO-8601 UTC ("2025-01-31T12:00:00Z")
 */
[[nodiscard]] auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Parse an ISO-8601 timestamp; fractional seconds and offsets are ignored
 */
[[nodiscard]] auto parse_iso8601(std::string_view text)
    -> std::optional<std::chrono::system_clock::time_point>;

/**
 * @brief Persisted map of item identifier to resume_record
 *
 * Persisted form is a JSON object keyed by identifier. Records written by
 * the earlier batch tool (status, start_time, dish_name, video_path) are
 * accepted on load. An absent or malformed document loads as empty with a
 * warning, since losing resume state only costs repeated work.
 *
 * @code
 * resume_state_store store(backend);
 * store.load();
 * store.upsert(resume_record("7", pipeline_stage::downloading, "Pancakes"));
 * @endcode
 */
class resume_state_store {
public:
    static constexpr const char* default_document = "resume_data.json";

    explicit resume_state_store(std::shared_ptr<state_backend> backend,
                                std::string document = default_document);
    ~resume_state_store();

    resume_state_store(const resume_state_store&) = delete;
    auto operator=(const resume_state_store&) -> resume_state_store& = delete;
    resume_state_store(resume_state_store&&) noexcept;
    auto operator=(resume_state_store&&) noexcept -> resume_state_store&;

    // ========================================================================
    // Persistence
    // ========================================================================

    /**
     * @brief Load records; malformed content is treated as empty
     * @return Success, or an error only if the backend cannot be read
     */
    [[nodiscard]] auto load() -> result<void>;

    /**
     * @brief Insert or replace a record and persist
     * @return Success or state_write_error (the change is rolled back)
     */
    [[nodiscard]] auto upsert(const resume_record& record) -> result<void>;

    /**
     * @brief Remove a record and persist; removing a missing record succeeds
     */
    [[nodiscard]] auto remove(std::string_view id) -> result<void>;

    /**
     * @brief Remove all records and persist
     */
    [[nodiscard]] auto clear() -> result<void>;

    // ========================================================================
    // Query
    // ========================================================================

    [[nodiscard]] auto get(std::string_view id) const -> std::optional<resume_record>;

    /**
     * @brief All records in item order
     */
    [[nodiscard]] auto records() const -> std::vector<resume_record>;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_RESUME_RESUME_STATE_STORE_H
