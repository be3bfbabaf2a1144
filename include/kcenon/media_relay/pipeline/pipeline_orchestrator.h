/**
 * @file pipeline_orchestrator.h
 * @brief Drives one catalog item through download, compression and upload
 *
 * The orchestrator owns the per-item state machine. Each stage transition is
 * written to the resume store before the stage does any work, so a process
 * killed at any point restarts from the last recorded stage. An item is added
 * to the completion ledger only after the destination confirms the upload.
 */

#ifndef KCENON_MEDIA_RELAY_PIPELINE_PIPELINE_ORCHESTRATOR_H
#define KCENON_MEDIA_RELAY_PIPELINE_PIPELINE_ORCHESTRATOR_H

#include <kcenon/media_relay/catalog/catalog_store.h>
#include <kcenon/media_relay/compress/encoder_tool.h>
#include <kcenon/media_relay/compress/size_adaptive_compressor.h>
#include <kcenon/media_relay/core/progress_sink.h>
#include <kcenon/media_relay/core/retry_policy.h>
#include <kcenon/media_relay/core/types.h>
#include <kcenon/media_relay/ledger/completion_ledger.h>
#include <kcenon/media_relay/resume/resume_state_store.h>
#include <kcenon/media_relay/transfer/chunked_downloader.h>
#include <kcenon/media_relay/transfer/chunked_uploader.h>
#include <kcenon/media_relay/transfer/media_source.h>
#include <kcenon/media_relay/transfer/publish_metadata_builder.h>
#include <kcenon/media_relay/transfer/video_destination.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Lifecycle of one item within a single process_item call
 */
enum class item_state {
    selected,
    downloading,
    compressing,
    uploading,
    published,
    failed
};

[[nodiscard]] constexpr auto to_string(item_state state) -> const char* {
    switch (state) {
        case item_state::selected: return "selected";
        case item_state::downloading: return "downloading";
        case item_state::compressing: return "compressing";
        case item_state::uploading: return "uploading";
        case item_state::published: return "published";
        case item_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Orchestrator configuration
 */
struct orchestrator_config {
    std::filesystem::path temp_dir = "temp_videos";  ///< Local artifact directory

    /// Number of leading eligible items considered for a random pick
    std::size_t random_window = 10;
    /// Probability of picking randomly within the window
    double random_pick_probability = 0.2;
    /// Fixed seed for the selection random source
    std::optional<uint64_t> random_seed;

    /// Delay between items in batch mode
    std::chrono::seconds inter_item_delay{60};

    /// Verify the recorded SHA-256 before resuming an upload
    bool verify_artifact_checksum = true;
    /// Minimum size of a resumable artifact that has no recorded size
    uint64_t min_valid_artifact_size = 1024 * 1024;

    /// Estimated wall time per item for status reports
    std::chrono::hours estimated_time_per_item{2};
    /// Number of upcoming items listed in a status report
    std::size_t status_preview_count = 10;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Result of processing one item
 */
struct process_report {
    std::string item_id;
    std::string display_name;
    std::optional<std::string> remote_id;
    item_state state = item_state::selected;
    bool resumed_upload = false;   ///< Upload resumed from a recorded artifact
    bool compressed = false;       ///< Uploaded artifact is the compressed one
    std::optional<error> failure;  ///< Set when state is failed
};

/**
 * @brief Result of run_batch
 */
struct batch_summary {
    std::size_t attempted = 0;
    std::size_t published = 0;
    std::size_t failed = 0;
    bool exhausted = false;   ///< Stopped because nothing was eligible
    std::vector<process_report> reports;
};

/**
 * @brief Entry in the upcoming-items list of a status report
 */
struct pending_item {
    std::string id;
    std::string display_name;
};

/**
 * @brief Snapshot of catalog progress
 */
struct pipeline_status {
    std::chrono::system_clock::time_point generated_at;
    std::size_t total = 0;        ///< Items in the catalog
    std::size_t published = 0;    ///< Catalog items present in the ledger
    std::size_t remaining = 0;    ///< Catalog items not in the ledger
    std::vector<pending_item> next_items;      ///< Upcoming items in selection order
    std::vector<pending_item> all_remaining;   ///< Every remaining item in order
    std::vector<resume_record> in_flight;      ///< Records of interrupted items
    std::optional<std::chrono::hours> estimated_remaining;
};

/**
 * @brief Render a status snapshot as a plain-text report
 * @param status Snapshot to render
 * @param include_all_remaining Append the full remaining-items list
 */
[[nodiscard]] auto render_status_report(const pipeline_status& status,
                                        bool include_all_remaining = true) -> std::string;

/**
 * @brief Sequences the transfer stages for catalog items
 *
 * @code
 * auto orchestrator = pipeline_orchestrator::builder()
 *     .with_catalog(catalog)
 *     .with_ledger(ledger)
 *     .with_resume_store(resume)
 *     .with_source(std::make_shared<local_media_source>("drive"))
 *     .with_destination(std::make_shared<local_video_destination>("published"))
 *     .build();
 * if (orchestrator.has_value()) {
 *     auto report = orchestrator.value().process_item(std::nullopt);
 * }
 * @endcode
 */
class pipeline_orchestrator {
public:
    /**
     * @brief Builder assembling the orchestrator from collaborators
     *
     * Catalog, ledger and resume store are expected to be loaded already.
     */
    class builder {
    public:
        builder();

        auto with_catalog(std::shared_ptr<catalog_store> catalog) -> builder&;
        auto with_ledger(std::shared_ptr<completion_ledger> ledger) -> builder&;
        auto with_resume_store(std::shared_ptr<resume_state_store> resume) -> builder&;
        auto with_source(std::shared_ptr<media_source> source) -> builder&;
        auto with_destination(std::shared_ptr<video_destination> destination) -> builder&;

        /**
         * @brief Set the re-encoding tool
         * @param encoder Tool, or nullptr to always upload the original
         */
        auto with_encoder(std::shared_ptr<encoder_tool> encoder) -> builder&;

        auto with_config(orchestrator_config config) -> builder&;
        auto with_downloader_config(downloader_config config) -> builder&;
        auto with_compressor_config(compressor_config config) -> builder&;
        auto with_uploader_config(uploader_config config) -> builder&;
        auto with_publish_template(publish_template tmpl) -> builder&;
        auto with_progress_sink(std::shared_ptr<progress_sink> progress) -> builder&;

        /**
         * @brief Replace the sleep used for retry backoff and inter-item delay
         */
        auto with_sleeper(sleep_function sleeper) -> builder&;

        /**
         * @brief Validate configuration and build the orchestrator
         * @return Orchestrator, or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<pipeline_orchestrator>;

    private:
        std::shared_ptr<catalog_store> catalog_;
        std::shared_ptr<completion_ledger> ledger_;
        std::shared_ptr<resume_state_store> resume_;
        std::shared_ptr<media_source> source_;
        std::shared_ptr<video_destination> destination_;
        std::shared_ptr<encoder_tool> encoder_;
        orchestrator_config config_;
        downloader_config downloader_config_;
        compressor_config compressor_config_;
        uploader_config uploader_config_;
        publish_template template_;
        std::shared_ptr<progress_sink> progress_;
        sleep_function sleeper_;
    };

    ~pipeline_orchestrator();

    pipeline_orchestrator(const pipeline_orchestrator&) = delete;
    auto operator=(const pipeline_orchestrator&) -> pipeline_orchestrator& = delete;
    pipeline_orchestrator(pipeline_orchestrator&&) noexcept;
    auto operator=(pipeline_orchestrator&&) noexcept -> pipeline_orchestrator&;

    // ========================================================================
    // Selection
    // ========================================================================

    /**
     * @brief Choose the next item to process
     *
     * Interrupted items with a resume record come first, lowest identifier
     * first. Otherwise the lowest unpublished identifier, or occasionally a
     * random pick among the first random_window eligible items.
     *
     * @param exclude Identifiers to skip
     * @return Selected item, or no_eligible_item
     */
    [[nodiscard]] auto select_next(const std::set<std::string>& exclude = {})
        -> result<media_item>;

    // ========================================================================
    // Processing
    // ========================================================================

    /**
     * @brief Run one item through the pipeline
     * @param id Requested item, or nullopt to select one
     * @return Report (state published or failed), or a selection error:
     *         item_not_found, already_published, no_eligible_item
     */
    [[nodiscard]] auto process_item(const std::optional<std::string>& id)
        -> result<process_report>;

    /**
     * @brief Process up to max_items items in sequence
     *
     * Items that fail are skipped for the rest of the batch.
     */
    [[nodiscard]] auto run_batch(std::size_t max_items) -> batch_summary;

    // ========================================================================
    // Maintenance
    // ========================================================================

    [[nodiscard]] auto status() const -> pipeline_status;

    /**
     * @brief Write the status report to a file
     */
    [[nodiscard]] auto write_status_report(const std::filesystem::path& path) const
        -> result<void>;

    /**
     * @brief Delete local artifacts and clear the resume store
     * @return Number of files removed
     */
    [[nodiscard]] auto purge() -> result<std::size_t>;

    /**
     * @brief Artifact path for an item and role ("original" or "compressed")
     */
    [[nodiscard]] auto artifact_path(std::string_view role, std::string_view id) const
        -> std::filesystem::path;

    [[nodiscard]] auto config() const -> const orchestrator_config&;

private:
    class impl;
    explicit pipeline_orchestrator(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_PIPELINE_PIPELINE_ORCHESTRATOR_H
