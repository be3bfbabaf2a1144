/**
 * @file pipeline_orchestrator.cpp
 * @brief Implementation of pipeline_orchestrator
 */

#include <kcenon/media_relay/pipeline/pipeline_orchestrator.h>
#include <kcenon/media_relay/core/checksum.h>
#include <kcenon/media_relay/core/logging.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::media_relay {

namespace {

auto format_local_time(std::chrono::system_clock::time_point tp, const char* pattern)
    -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, pattern);
    return oss.str();
}

auto file_size_of(const std::filesystem::path& path) -> std::optional<uint64_t> {
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

auto item_context(const media_item& item) -> item_log_context {
    item_log_context ctx;
    ctx.item_id = item.id;
    return ctx;
}

}  // namespace

auto orchestrator_config::validate() const -> result<void> {
    if (temp_dir.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "temp_dir must not be empty"});
    }
    if (random_pick_probability < 0.0 || random_pick_probability > 1.0) {
        return unexpected(error{error_code::invalid_configuration,
                                "random_pick_probability must be in [0, 1]"});
    }
    if (random_pick_probability > 0.0 && random_window == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "random_window must be positive when random picks are enabled"});
    }
    if (inter_item_delay.count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "inter_item_delay must not be negative"});
    }
    return {};
}

// ============================================================================
// Status report
// ============================================================================

auto render_status_report(const pipeline_status& status, bool include_all_remaining)
    -> std::string {
    std::ostringstream out;
    out << "Media Relay Status Report - "
        << format_local_time(status.generated_at, "%Y-%m-%d %H:%M:%S") << "\n\n";
    out << "Total items in catalog: " << status.total << "\n";
    out << "Published items: " << status.published << "\n";
    out << "Remaining items: " << status.remaining << "\n";

    if (status.estimated_remaining) {
        const auto hours = status.estimated_remaining->count();
        const auto completion = status.generated_at + *status.estimated_remaining;
        out << "Estimated time remaining: " << std::fixed << std::setprecision(1)
            << static_cast<double>(hours) / 24.0 << " days (" << hours << " hours)\n";
        out << "Estimated completion: " << format_local_time(completion, "%Y-%m-%d") << "\n";
    } else {
        out << "Unable to estimate completion time yet\n";
    }

    if (!status.in_flight.empty()) {
        out << "\nIn-progress items:\n";
        for (const auto& record : status.in_flight) {
            out << "  ID " << record.item_id << ": " << record.display_name
                << " - Stage: " << to_string(record.stage)
                << " (Started: " << format_iso8601(record.stage_entry_time) << ")\n";
        }
    }

    if (!status.next_items.empty()) {
        out << "\nNext " << status.next_items.size() << " items to process:\n";
        std::size_t index = 1;
        for (const auto& item : status.next_items) {
            out << "  " << index++ << ". ID " << item.id << ": " << item.display_name << "\n";
        }
    }

    if (include_all_remaining && !status.all_remaining.empty()) {
        out << "\nAll remaining items:\n";
        for (const auto& item : status.all_remaining) {
            out << "  ID " << item.id << ": " << item.display_name << "\n";
        }
    }
    return out.str();
}

// ============================================================================
// pipeline_orchestrator::impl
// ============================================================================

class pipeline_orchestrator::impl {
public:
    impl(std::shared_ptr<catalog_store> catalog,
         std::shared_ptr<completion_ledger> ledger,
         std::shared_ptr<resume_state_store> resume,
         orchestrator_config cfg,
         chunked_downloader downloader,
         size_adaptive_compressor compressor,
         chunked_uploader uploader,
         publish_metadata_builder metadata,
         sleep_function sleeper)
        : catalog_(std::move(catalog))
        , ledger_(std::move(ledger))
        , resume_(std::move(resume))
        , config_(std::move(cfg))
        , downloader_(std::move(downloader))
        , compressor_(std::move(compressor))
        , uploader_(std::move(uploader))
        , metadata_(std::move(metadata))
        , sleep_(std::move(sleeper))
        , rng_(config_.random_seed ? *config_.random_seed : std::random_device{}()) {}

    // ========================================================================
    // Selection
    // ========================================================================

    auto select_next(const std::set<std::string>& exclude) -> result<media_item> {
        for (const auto& record : resume_->records()) {
            if (exclude.count(record.item_id) > 0 || ledger_->contains(record.item_id)) {
                continue;
            }
            if (const auto* item = catalog_->find(record.item_id)) {
                MR_LOG_INFO(log_category::pipeline,
                    "Resuming item " + item->id + " (" + item->display_name +
                    ") from stage " + to_string(record.stage));
                return *item;
            }
        }

        auto eligible = eligible_items(exclude);
        if (eligible.empty()) {
            return unexpected(error{error_code::no_eligible_item,
                                    "all catalog items have been published"});
        }

        std::size_t index = 0;
        if (eligible.size() > config_.random_window && config_.random_pick_probability > 0.0) {
            std::bernoulli_distribution pick_random(config_.random_pick_probability);
            if (pick_random(rng_)) {
                std::uniform_int_distribution<std::size_t> within(0, config_.random_window - 1);
                index = within(rng_);
                MR_LOG_DEBUG(log_category::pipeline,
                    "Random pick within the first " + std::to_string(config_.random_window) +
                    " eligible items");
            }
        }

        const auto* item = eligible[index];
        MR_LOG_INFO(log_category::pipeline,
            "Selected item " + item->id + ": " + item->display_name);
        return *item;
    }

    // ========================================================================
    // Processing
    // ========================================================================

    auto process_item(const std::optional<std::string>& id) -> result<process_report> {
        prune_stale_records();

        media_item item;
        if (id) {
            const auto* found = catalog_->find(*id);
            if (!found) {
                MR_LOG_ERROR(log_category::pipeline, "Item " + *id + " not found in catalog");
                return unexpected(error{error_code::item_not_found,
                                        "item " + *id + " not found in catalog"});
            }
            if (ledger_->contains(*id)) {
                MR_LOG_ERROR(log_category::pipeline, "Item " + *id + " was already published");
                return unexpected(error{error_code::already_published,
                                        "item " + *id + " was already published"});
            }
            item = *found;
        } else {
            auto selected = select_next({});
            if (!selected) {
                return unexpected(selected.error());
            }
            item = std::move(selected.value());
        }
        return run_pipeline(item);
    }

    auto run_batch(std::size_t max_items) -> batch_summary {
        batch_summary summary;
        std::set<std::string> failed_ids;

        for (std::size_t n = 0; n < max_items; ++n) {
            if (n > 0 && config_.inter_item_delay.count() > 0) {
                MR_LOG_INFO(log_category::pipeline,
                    "Waiting " + std::to_string(config_.inter_item_delay.count()) +
                    " seconds before the next item");
                sleep_(std::chrono::duration_cast<std::chrono::milliseconds>(
                    config_.inter_item_delay));
            }

            prune_stale_records();
            auto selected = select_next(failed_ids);
            if (!selected) {
                if (selected.error().code == error_code::no_eligible_item) {
                    MR_LOG_INFO(log_category::pipeline, "No eligible items remain");
                    summary.exhausted = true;
                } else {
                    MR_LOG_ERROR(log_category::pipeline,
                        "Selection failed: " + selected.error().message);
                }
                break;
            }

            MR_LOG_INFO(log_category::pipeline,
                "Processing item " + std::to_string(n + 1) + " of " +
                std::to_string(max_items));

            auto report = run_pipeline(selected.value());
            ++summary.attempted;
            if (report.state == item_state::published) {
                ++summary.published;
            } else {
                ++summary.failed;
                failed_ids.insert(report.item_id);
            }
            summary.reports.push_back(std::move(report));
        }

        MR_LOG_INFO(log_category::pipeline,
            "Batch finished: " + std::to_string(summary.published) + " published, " +
            std::to_string(summary.failed) + " failed");
        return summary;
    }

    // ========================================================================
    // Maintenance
    // ========================================================================

    auto status() const -> pipeline_status {
        pipeline_status snapshot;
        snapshot.generated_at = std::chrono::system_clock::now();
        snapshot.total = catalog_->size();

        for (const auto& record : resume_->records()) {
            if (!ledger_->contains(record.item_id)) {
                snapshot.in_flight.push_back(record);
            }
        }

        std::vector<pending_item> ordered;
        std::set<std::string> listed;
        for (const auto& record : snapshot.in_flight) {
            if (const auto* item = catalog_->find(record.item_id)) {
                ordered.push_back({item->id, item->display_name});
                listed.insert(item->id);
            }
        }
        for (const auto* item : eligible_items({})) {
            if (listed.count(item->id) == 0) {
                ordered.push_back({item->id, item->display_name});
            }
        }

        snapshot.remaining = ordered.size();
        snapshot.published = snapshot.total - snapshot.remaining;

        const auto preview = std::min(config_.status_preview_count, ordered.size());
        snapshot.next_items.assign(ordered.begin(),
                                   ordered.begin() + static_cast<std::ptrdiff_t>(preview));
        snapshot.all_remaining = std::move(ordered);

        if (snapshot.published > 0) {
            snapshot.estimated_remaining = std::chrono::hours(
                config_.estimated_time_per_item.count() *
                static_cast<std::chrono::hours::rep>(snapshot.remaining));
        }
        return snapshot;
    }

    auto write_status_report(const std::filesystem::path& path) const -> result<void> {
        auto snapshot = status();
        auto text = render_status_report(snapshot);

        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot open " + path.string() + " for writing"});
        }
        out << text;
        out.close();
        if (!out) {
            return unexpected(error{error_code::file_write_error,
                                    "failed to write " + path.string()});
        }

        MR_LOG_INFO(log_category::pipeline, "Status report written to " + path.string());
        return {};
    }

    auto purge() -> result<std::size_t> {
        std::size_t removed = 0;
        std::error_code ec;

        if (std::filesystem::exists(config_.temp_dir, ec)) {
            for (auto it = std::filesystem::directory_iterator(config_.temp_dir, ec);
                 !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
                std::error_code remove_ec;
                auto count = std::filesystem::remove_all(it->path(), remove_ec);
                if (remove_ec) {
                    return unexpected(error{error_code::file_write_error,
                                            "cannot remove " + it->path().string() + ": " +
                                                remove_ec.message()});
                }
                removed += static_cast<std::size_t>(count);
            }
            if (ec) {
                return unexpected(error{error_code::file_read_error,
                                        "cannot list " + config_.temp_dir.string() + ": " +
                                            ec.message()});
            }
        }

        auto cleared = resume_->clear();
        if (!cleared) {
            return unexpected(cleared.error());
        }

        MR_LOG_INFO(log_category::pipeline,
            "Purged " + std::to_string(removed) + " files from " +
            config_.temp_dir.string() + " and cleared resume data");
        return removed;
    }

    auto artifact_path(std::string_view role, std::string_view id) const
        -> std::filesystem::path {
        return config_.temp_dir /
               (std::string(role) + "_" + std::string(id) + ".mp4");
    }

    std::shared_ptr<catalog_store> catalog_;
    std::shared_ptr<completion_ledger> ledger_;
    std::shared_ptr<resume_state_store> resume_;
    orchestrator_config config_;

private:
    auto eligible_items(const std::set<std::string>& exclude) const
        -> std::vector<const media_item*> {
        std::vector<const media_item*> eligible;
        for (const auto& item : catalog_->items()) {
            if (!ledger_->contains(item.id) && exclude.count(item.id) == 0) {
                eligible.push_back(&item);
            }
        }
        std::stable_sort(eligible.begin(), eligible.end(),
            [](const media_item* lhs, const media_item* rhs) {
                return compare_item_ids(lhs->id, rhs->id) < 0;
            });
        return eligible;
    }

    /**
     * @brief Drop resume records of items that already reached the ledger
     *
     * A crash between the ledger commit and the record removal leaves such a
     * record behind.
     */
    void prune_stale_records() {
        for (const auto& record : resume_->records()) {
            if (!ledger_->contains(record.item_id)) {
                continue;
            }
            auto removed = resume_->remove(record.item_id);
            if (removed) {
                MR_LOG_INFO(log_category::pipeline,
                    "Removed stale resume record for published item " + record.item_id);
            } else {
                MR_LOG_WARN(log_category::pipeline,
                    "Cannot remove stale resume record " + record.item_id + ": " +
                    removed.error().message);
            }
        }
    }

    auto enter_stage(process_report& report, const media_item& item,
                     pipeline_stage stage,
                     std::optional<uint64_t> source_size = std::nullopt) -> result<void> {
        resume_record record(item.id, stage, item.display_name);
        record.source_size = source_size;
        report.state = stage == pipeline_stage::downloading ? item_state::downloading
                                                           : item_state::compressing;
        return resume_->upsert(record);
    }

    auto fail(process_report& report, const error& err) -> process_report {
        item_log_context ctx;
        ctx.item_id = report.item_id;
        ctx.error_message = err.message;
        ctx.stage = to_string(report.state);
        MR_LOG_ERROR_CTX(log_category::pipeline,
            "Item " + report.item_id + " did not complete during " +
            to_string(report.state) + ": " + err.message, ctx);

        report.failure = err;
        report.state = item_state::failed;
        return report;
    }

    /**
     * @brief Check that a recorded upload artifact is still the one recorded
     */
    auto artifact_matches(const resume_record& record) const -> bool {
        if (!record.local_path) {
            return false;
        }
        auto size = file_size_of(*record.local_path);
        if (!size) {
            MR_LOG_WARN(log_category::pipeline,
                "Recorded artifact " + record.local_path->string() + " no longer exists");
            return false;
        }

        if (record.artifact_size) {
            if (*size != *record.artifact_size) {
                MR_LOG_WARN(log_category::pipeline,
                    "Recorded artifact " + record.local_path->string() + " has " +
                    std::to_string(*size) + " bytes, expected " +
                    std::to_string(*record.artifact_size));
                return false;
            }
        } else if (*size < config_.min_valid_artifact_size) {
            MR_LOG_WARN(log_category::pipeline,
                "Recorded artifact " + record.local_path->string() +
                " is too small to be complete");
            return false;
        }

        if (config_.verify_artifact_checksum && record.artifact_sha256) {
            if (!checksum::verify_sha256(*record.local_path, *record.artifact_sha256)) {
                MR_LOG_WARN(log_category::pipeline,
                    "Recorded artifact " + record.local_path->string() +
                    " failed checksum verification");
                return false;
            }
        }
        return true;
    }

    auto run_pipeline(const media_item& item) -> process_report {
        process_report report;
        report.item_id = item.id;
        report.display_name = item.display_name;

        auto ctx = item_context(item);
        MR_LOG_INFO_CTX(log_category::pipeline,
            "Processing item " + item.id + ": " + item.display_name, ctx);

        std::filesystem::path upload_path;
        const auto compressed_path = artifact_path("compressed", item.id);

        auto record = resume_->get(item.id);
        if (record && record->stage == pipeline_stage::uploading &&
            record->published_remote_id) {
            report.state = item_state::uploading;
            report.remote_id = record->published_remote_id;
            report.compressed = record->local_path == compressed_path;
            MR_LOG_INFO_CTX(log_category::pipeline,
                "Upload was already confirmed as " + *record->published_remote_id +
                ", recording it as published", ctx);
            return finish_published(report, ctx);
        }

        resume_record pending;
        if (record && record->stage == pipeline_stage::uploading && artifact_matches(*record)) {
            pending = *record;
            upload_path = *record->local_path;
            report.resumed_upload = true;
            report.compressed = upload_path == compressed_path;
            MR_LOG_INFO_CTX(log_category::pipeline,
                "Resuming upload from " + upload_path.string(), ctx);
        } else {
            if (record) {
                MR_LOG_INFO_CTX(log_category::pipeline,
                    std::string("Restarting item from download (last stage ") +
                    to_string(record->stage) + ")", ctx);
            }

            if (auto entered = enter_stage(report, item, pipeline_stage::downloading);
                !entered) {
                return fail(report, entered.error());
            }
            download_request request;
            request.item_id = item.id;
            request.locator = item.locator;
            request.destination = artifact_path("original", item.id);
            if (record) {
                request.expected_size = record->source_size;
            }
            auto downloaded = downloader_.download(request);
            if (!downloaded) {
                return fail(report, downloaded.error());
            }
            const auto source_size = downloaded.value().bytes;

            if (auto entered = enter_stage(report, item, pipeline_stage::compressing,
                                           source_size);
                !entered) {
                return fail(report, entered.error());
            }
            auto outcome = compressor_.compress(item.id, downloaded.value().path,
                                                compressed_path);
            upload_path = outcome.path;
            report.compressed = outcome.compressed;

            pending = resume_record(item.id, pipeline_stage::uploading, item.display_name);
            pending.local_path = upload_path;
            pending.artifact_size = outcome.output_size;
            pending.source_size = source_size;
            if (config_.verify_artifact_checksum) {
                auto digest = checksum::sha256_file(upload_path);
                if (digest) {
                    pending.artifact_sha256 = digest.value();
                } else {
                    MR_LOG_WARN_CTX(log_category::pipeline,
                        "Cannot checksum upload artifact: " + digest.error().message, ctx);
                }
            }
            report.state = item_state::uploading;
            if (auto entered = resume_->upsert(pending); !entered) {
                return fail(report, entered.error());
            }
        }

        report.state = item_state::uploading;
        auto metadata = metadata_.build(item);
        auto receipt = uploader_.upload(item.id, upload_path, std::move(metadata));
        if (!receipt) {
            return fail(report, receipt.error());
        }
        report.remote_id = receipt.value().remote_id;

        // Persist the confirmation ahead of the ledger commit
        pending.published_remote_id = receipt.value().remote_id;
        if (auto confirmed = resume_->upsert(pending); !confirmed) {
            MR_LOG_WARN_CTX(log_category::pipeline,
                "Cannot record upload confirmation: " + confirmed.error().message, ctx);
        }
        return finish_published(report, ctx);
    }

    /**
     * @brief Commit a confirmed upload to the ledger, then release its state
     */
    auto finish_published(process_report& report, const item_log_context& ctx)
        -> process_report {
        const auto& remote_id = *report.remote_id;
        if (auto committed = ledger_->add(report.item_id); !committed) {
            MR_LOG_FATAL(log_category::pipeline,
                "Item " + report.item_id + " was published as " + remote_id +
                " but the ledger could not be updated: " + committed.error().message);
            return fail(report, committed.error());
        }

        if (auto removed = resume_->remove(report.item_id); !removed) {
            MR_LOG_WARN_CTX(log_category::pipeline,
                "Cannot remove resume record: " + removed.error().message, ctx);
        }
        cleanup_artifacts(report.item_id);

        report.state = item_state::published;
        MR_LOG_INFO_CTX(log_category::pipeline,
            "Published item " + report.item_id + " as " + remote_id, ctx);
        return report;
    }

    void cleanup_artifacts(const std::string& id) {
        const auto original = artifact_path("original", id);
        const auto compressed = artifact_path("compressed", id);
        auto original_part = original;
        original_part += ".part";

        for (const auto& path : {original, compressed, original_part,
                                 size_adaptive_compressor::encoding_path_for(compressed)}) {
            std::error_code ec;
            if (std::filesystem::remove(path, ec)) {
                MR_LOG_DEBUG(log_category::pipeline, "Removed " + path.string());
            } else if (ec) {
                MR_LOG_WARN(log_category::pipeline,
                    "Failed to remove " + path.string() + ": " + ec.message());
            }
        }
    }

    chunked_downloader downloader_;
    size_adaptive_compressor compressor_;
    chunked_uploader uploader_;
    publish_metadata_builder metadata_;
    sleep_function sleep_;
    std::mt19937_64 rng_;
};

// ============================================================================
// pipeline_orchestrator::builder
// ============================================================================

pipeline_orchestrator::builder::builder() = default;

auto pipeline_orchestrator::builder::with_catalog(std::shared_ptr<catalog_store> catalog)
    -> builder& {
    catalog_ = std::move(catalog);
    return *this;
}

auto pipeline_orchestrator::builder::with_ledger(std::shared_ptr<completion_ledger> ledger)
    -> builder& {
    ledger_ = std::move(ledger);
    return *this;
}

auto pipeline_orchestrator::builder::with_resume_store(
    std::shared_ptr<resume_state_store> resume) -> builder& {
    resume_ = std::move(resume);
    return *this;
}

auto pipeline_orchestrator::builder::with_source(std::shared_ptr<media_source> source)
    -> builder& {
    source_ = std::move(source);
    return *this;
}

auto pipeline_orchestrator::builder::with_destination(
    std::shared_ptr<video_destination> destination) -> builder& {
    destination_ = std::move(destination);
    return *this;
}

auto pipeline_orchestrator::builder::with_encoder(std::shared_ptr<encoder_tool> encoder)
    -> builder& {
    encoder_ = std::move(encoder);
    return *this;
}

auto pipeline_orchestrator::builder::with_config(orchestrator_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto pipeline_orchestrator::builder::with_downloader_config(downloader_config config)
    -> builder& {
    downloader_config_ = std::move(config);
    return *this;
}

auto pipeline_orchestrator::builder::with_compressor_config(compressor_config config)
    -> builder& {
    compressor_config_ = std::move(config);
    return *this;
}

auto pipeline_orchestrator::builder::with_uploader_config(uploader_config config)
    -> builder& {
    uploader_config_ = std::move(config);
    return *this;
}

auto pipeline_orchestrator::builder::with_publish_template(publish_template tmpl)
    -> builder& {
    template_ = std::move(tmpl);
    return *this;
}

auto pipeline_orchestrator::builder::with_progress_sink(
    std::shared_ptr<progress_sink> progress) -> builder& {
    progress_ = std::move(progress);
    return *this;
}

auto pipeline_orchestrator::builder::with_sleeper(sleep_function sleeper) -> builder& {
    sleeper_ = std::move(sleeper);
    return *this;
}

auto pipeline_orchestrator::builder::build() -> result<pipeline_orchestrator> {
    if (!catalog_ || !ledger_ || !resume_) {
        return unexpected(error{error_code::invalid_configuration,
                                "catalog, ledger and resume store are required"});
    }
    if (!source_ || !destination_) {
        return unexpected(error{error_code::invalid_configuration,
                                "media source and video destination are required"});
    }

    for (auto validated : {config_.validate(), downloader_config_.validate(),
                           compressor_config_.validate(), uploader_config_.validate(),
                           template_.validate()}) {
        if (!validated) {
            return unexpected(validated.error());
        }
    }

    auto sleeper = sleeper_ ? sleeper_ : thread_sleeper();
    auto progress = progress_ ? progress_ : std::make_shared<logging_progress_sink>();

    chunked_downloader downloader(source_, downloader_config_, progress, sleeper);
    size_adaptive_compressor compressor(encoder_, compressor_config_);
    chunked_uploader uploader(destination_, uploader_config_, progress, sleeper);

    return pipeline_orchestrator{std::make_unique<impl>(
        catalog_, ledger_, resume_, config_,
        std::move(downloader), std::move(compressor), std::move(uploader),
        publish_metadata_builder(template_), std::move(sleeper))};
}

// ============================================================================
// pipeline_orchestrator
// ============================================================================

pipeline_orchestrator::pipeline_orchestrator(std::unique_ptr<impl> state)
    : impl_(std::move(state)) {}

pipeline_orchestrator::~pipeline_orchestrator() = default;

pipeline_orchestrator::pipeline_orchestrator(pipeline_orchestrator&&) noexcept = default;
auto pipeline_orchestrator::operator=(pipeline_orchestrator&&) noexcept
    -> pipeline_orchestrator& = default;

auto pipeline_orchestrator::select_next(const std::set<std::string>& exclude)
    -> result<media_item> {
    return impl_->select_next(exclude);
}

auto pipeline_orchestrator::process_item(const std::optional<std::string>& id)
    -> result<process_report> {
    return impl_->process_item(id);
}

auto pipeline_orchestrator::run_batch(std::size_t max_items) -> batch_summary {
    return impl_->run_batch(max_items);
}

auto pipeline_orchestrator::status() const -> pipeline_status {
    return impl_->status();
}

auto pipeline_orchestrator::write_status_report(const std::filesystem::path& path) const
    -> result<void> {
    return impl_->write_status_report(path);
}

auto pipeline_orchestrator::purge() -> result<std::size_t> {
    return impl_->purge();
}

auto pipeline_orchestrator::artifact_path(std::string_view role, std::string_view id) const
    -> std::filesystem::path {
    return impl_->artifact_path(role, id);
}

auto pipeline_orchestrator::config() const -> const orchestrator_config& {
    return impl_->config_;
}

}  // namespace kcenon::media_relay
