/**
 * @file test_pipeline_orchestrator.cpp
 * @brief Unit tests for item selection, stage sequencing and recovery
 */

#include <gtest/gtest.h>

#include <kcenon/media_relay/core/json.h>
#include <kcenon/media_relay/pipeline/pipeline_orchestrator.h>
#include <kcenon/media_relay/storage/state_backend.h>

#include "test_doubles.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace kcenon::media_relay::test {

using std::chrono::milliseconds;

namespace {

/**
 * @brief Backend that keeps every successfully written document version
 */
class recording_backend final : public state_backend {
public:
    auto read(std::string_view name) -> result<std::optional<std::string>> override {
        return inner_.read(name);
    }

    auto write(std::string_view name, std::string_view content) -> result<void> override {
        auto written = inner_.write(name, content);
        if (written) {
            history.emplace_back(content);
        }
        return written;
    }

    auto remove(std::string_view name) -> result<void> override { return inner_.remove(name); }

    auto describe(std::string_view name) const -> std::string override {
        return inner_.describe(name);
    }

    void set_read_only(bool read_only) { inner_.set_read_only(read_only); }

    std::vector<std::string> history;

private:
    memory_state_backend inner_;
};

constexpr const char* three_item_catalog = R"({"recipes": [
    {"id": 7, "dish_name": "Pho", "public_url": "https://drive.google.com/file/d/F7/view",
     "ingredients": ["rice noodles", "beef"]},
    {"id": 12, "dish_name": "Tacos", "public_url": "https://drive.google.com/file/d/F12/view"},
    {"id": 3, "dish_name": "Ramen", "public_url": "https://drive.google.com/file/d/F3/view"}
]})";

auto numbered_catalog(int count) -> std::string {
    std::string text = R"({"recipes": [)";
    for (int i = 1; i <= count; ++i) {
        if (i > 1) {
            text += ",";
        }
        auto id = std::to_string(i);
        text += R"({"id": )" + id + R"(, "dish_name": "Dish )" + id +
                R"(", "public_url": "https://drive.google.com/file/d/F)" + id + R"(/view"})";
    }
    return text + "]}";
}

}  // namespace

class PipelineOrchestratorTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        ledger_backend_ = std::make_shared<memory_state_backend>();
        resume_backend_ = std::make_shared<recording_backend>();

        catalog_ = std::make_shared<catalog_store>(catalog_config{});
        ASSERT_TRUE(catalog_->load_from_string(three_item_catalog).has_value());

        ledger_ = std::make_shared<completion_ledger>(ledger_backend_);
        ASSERT_TRUE(ledger_->load().has_value());
        resume_ = std::make_shared<resume_state_store>(resume_backend_);
        ASSERT_TRUE(resume_->load().has_value());

        source_ = std::make_shared<scripted_media_source>();
        source_->add_file("F7", make_bytes(3000, 1));
        source_->add_file("F12", make_bytes(2000, 2));
        source_->add_file("F3", make_bytes(2500, 3));
        destination_ = std::make_shared<scripted_destination>();
        progress_ = std::make_shared<recording_progress_sink>();

        config_.temp_dir = test_dir_ / "temp";
        config_.random_pick_probability = 0.0;
        config_.inter_item_delay = std::chrono::seconds{5};
        config_.min_valid_artifact_size = 100;

        downloader_config_.chunk_size = 1024;
        uploader_config_.chunk_size = 1024;
        compressor_config_.min_input_size = 1000;
        compressor_config_.min_target_size = 100;
        compressor_config_.min_valid_size = 100;
    }

    auto make_builder() -> pipeline_orchestrator::builder {
        pipeline_orchestrator::builder builder;
        builder.with_catalog(catalog_)
            .with_ledger(ledger_)
            .with_resume_store(resume_)
            .with_source(source_)
            .with_destination(destination_)
            .with_encoder(encoder_)
            .with_config(config_)
            .with_downloader_config(downloader_config_)
            .with_compressor_config(compressor_config_)
            .with_uploader_config(uploader_config_)
            .with_progress_sink(progress_)
            .with_sleeper(sleeper_.function());
        return builder;
    }

    auto make_orchestrator() -> pipeline_orchestrator {
        auto built = make_builder().build();
        EXPECT_TRUE(built.has_value()) << built.error().message;
        return std::move(built).value();
    }

    auto temp_path(const std::string& name) const -> std::filesystem::path {
        return test_dir_ / "temp" / name;
    }

    /**
     * @brief Stage recorded for an item in each persisted resume document
     */
    auto stage_history(const std::string& id) const -> std::vector<std::string> {
        std::vector<std::string> stages;
        for (const auto& content : resume_backend_->history) {
            auto doc = json_value::parse(content);
            EXPECT_TRUE(doc.has_value());
            if (!doc) {
                continue;
            }
            const auto* record = doc.value().find(id);
            stages.push_back(record ? record->find("stage")->as_string() : "<none>");
        }
        return stages;
    }

    std::shared_ptr<memory_state_backend> ledger_backend_;
    std::shared_ptr<recording_backend> resume_backend_;
    std::shared_ptr<catalog_store> catalog_;
    std::shared_ptr<completion_ledger> ledger_;
    std::shared_ptr<resume_state_store> resume_;
    std::shared_ptr<scripted_media_source> source_;
    std::shared_ptr<scripted_destination> destination_;
    std::shared_ptr<scripted_encoder> encoder_;
    std::shared_ptr<recording_progress_sink> progress_;
    recording_sleeper sleeper_;

    orchestrator_config config_;
    downloader_config downloader_config_;
    compressor_config compressor_config_;
    uploader_config uploader_config_;
};

// =============================================================================
// Builder
// =============================================================================

TEST_F(PipelineOrchestratorTest, BuilderRequiresCollaborators) {
    auto built = pipeline_orchestrator::builder()
                     .with_catalog(catalog_)
                     .with_ledger(ledger_)
                     .with_resume_store(resume_)
                     .build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(PipelineOrchestratorTest, BuilderValidatesConfiguration) {
    config_.random_pick_probability = 1.5;
    auto built = make_builder().build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);

    config_.random_pick_probability = 0.0;
    uploader_config_.chunk_size = 0;
    EXPECT_FALSE(make_builder().build().has_value());
}

TEST_F(PipelineOrchestratorTest, ArtifactPaths) {
    auto orchestrator = make_orchestrator();
    EXPECT_EQ(orchestrator.artifact_path("original", "7"), temp_path("original_7.mp4"));
    EXPECT_EQ(orchestrator.artifact_path("compressed", "7"), temp_path("compressed_7.mp4"));
}

// =============================================================================
// Full pipeline
// =============================================================================

TEST_F(PipelineOrchestratorTest, PublishesItemThroughAllStages) {
    auto orchestrator = make_orchestrator();

    auto report = orchestrator.process_item(std::string("7"));
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(report.value().state, item_state::published);
    EXPECT_EQ(report.value().item_id, "7");
    EXPECT_EQ(report.value().display_name, "Pho");
    EXPECT_EQ(report.value().remote_id, std::optional<std::string>{"remote-1"});
    EXPECT_FALSE(report.value().resumed_upload);
    EXPECT_FALSE(report.value().failure.has_value());

    EXPECT_TRUE(ledger_->contains("7"));
    EXPECT_FALSE(resume_->get("7").has_value());
    EXPECT_EQ(stage_history("7"),
              (std::vector<std::string>{"downloading", "compressing", "uploading", "uploading",
                                        "<none>"}));

    EXPECT_FALSE(std::filesystem::exists(temp_path("original_7.mp4")));
    EXPECT_EQ(source_->requested_ids, (std::vector<std::string>{"F7"}));
    EXPECT_EQ(destination_->last_metadata.title.rfind("Pho Recipe - ", 0), 0u);
}

TEST_F(PipelineOrchestratorTest, UploadingRecordDescribesArtifact) {
    auto orchestrator = make_orchestrator();
    ASSERT_TRUE(orchestrator.process_item(std::string("7")).has_value());

    ASSERT_GE(resume_backend_->history.size(), 4u);
    auto compressing = json_value::parse(resume_backend_->history[1]);
    ASSERT_TRUE(compressing.has_value());
    EXPECT_EQ(compressing.value().find("7")->find("source_size")->as_int64(), 3000);

    auto doc = json_value::parse(resume_backend_->history[2]);
    ASSERT_TRUE(doc.has_value());
    const auto* record = doc.value().find("7");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->find("stage")->as_string(), "uploading");
    EXPECT_EQ(record->find("local_path")->as_string(), temp_path("original_7.mp4").string());
    EXPECT_EQ(record->find("artifact_size")->as_int64(), 3000);
    EXPECT_EQ(record->find("artifact_sha256")->as_string().size(), 64u);
    EXPECT_EQ(record->find("published_remote_id"), nullptr);

    auto confirmed = json_value::parse(resume_backend_->history[3]);
    ASSERT_TRUE(confirmed.has_value());
    EXPECT_EQ(confirmed.value().find("7")->find("published_remote_id")->as_string(), "remote-1");
}

TEST_F(PipelineOrchestratorTest, UploadsCompressedArtifactWhenSmaller) {
    encoder_ = std::make_shared<scripted_encoder>();
    encoder_->output_size = 1000;
    auto orchestrator = make_orchestrator();

    auto report = orchestrator.process_item(std::string("7"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().state, item_state::published);
    EXPECT_TRUE(report.value().compressed);
    ASSERT_EQ(destination_->uploaded_paths.size(), 1u);
    EXPECT_EQ(destination_->uploaded_paths.front(), temp_path("compressed_7.mp4"));

    EXPECT_FALSE(std::filesystem::exists(temp_path("compressed_7.mp4")));
    EXPECT_FALSE(std::filesystem::exists(temp_path("original_7.mp4")));
}

TEST_F(PipelineOrchestratorTest, UploadsOriginalWhenEncoderUnavailable) {
    encoder_ = std::make_shared<scripted_encoder>();
    encoder_->available = false;
    auto orchestrator = make_orchestrator();

    auto report = orchestrator.process_item(std::string("7"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().state, item_state::published);
    EXPECT_FALSE(report.value().compressed);
    EXPECT_EQ(destination_->uploaded_paths.front(), temp_path("original_7.mp4"));
}

// =============================================================================
// Recovery
// =============================================================================

TEST_F(PipelineOrchestratorTest, ResumesUploadWithoutRedoingEarlierStages) {
    create_test_file("temp/compressed_7.mp4", 2000);
    resume_record record("7", pipeline_stage::uploading, "Pho");
    record.local_path = temp_path("compressed_7.mp4");
    ASSERT_TRUE(resume_->upsert(record).has_value());

    encoder_ = std::make_shared<scripted_encoder>();
    auto orchestrator = make_orchestrator();

    auto report = orchestrator.process_item(std::nullopt);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().item_id, "7");
    EXPECT_EQ(report.value().state, item_state::published);
    EXPECT_TRUE(report.value().resumed_upload);
    EXPECT_TRUE(report.value().compressed);

    EXPECT_EQ(source_->open_calls, 0u);
    EXPECT_EQ(encoder_->encode_calls, 0u);
    EXPECT_EQ(destination_->uploaded_paths.front(), temp_path("compressed_7.mp4"));
    EXPECT_TRUE(ledger_->contains("7"));
    EXPECT_FALSE(resume_->get("7").has_value());
}

TEST_F(PipelineOrchestratorTest, ChangedArtifactRestartsFromDownload) {
    create_test_file("temp/compressed_7.mp4", 2000);
    resume_record record("7", pipeline_stage::uploading, "Pho");
    record.local_path = temp_path("compressed_7.mp4");
    record.artifact_size = 1999;
    ASSERT_TRUE(resume_->upsert(record).has_value());

    auto orchestrator = make_orchestrator();
    auto report = orchestrator.process_item(std::nullopt);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().state, item_state::published);
    EXPECT_FALSE(report.value().resumed_upload);
    EXPECT_EQ(source_->open_calls, 1u);
}

TEST_F(PipelineOrchestratorTest, ChecksumMismatchRestartsFromDownload) {
    create_test_file("temp/compressed_7.mp4", 2000);
    resume_record record("7", pipeline_stage::uploading, "Pho");
    record.local_path = temp_path("compressed_7.mp4");
    record.artifact_size = 2000;
    record.artifact_sha256 = std::string(64, '0');
    ASSERT_TRUE(resume_->upsert(record).has_value());

    auto orchestrator = make_orchestrator();
    auto report = orchestrator.process_item(std::nullopt);
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report.value().resumed_upload);
    EXPECT_EQ(source_->open_calls, 1u);
}

TEST_F(PipelineOrchestratorTest, UndersizedUnrecordedArtifactIsNotTrusted) {
    create_test_file("temp/compressed_7.mp4", 50);
    resume_record record("7", pipeline_stage::uploading, "Pho");
    record.local_path = temp_path("compressed_7.mp4");
    ASSERT_TRUE(resume_->upsert(record).has_value());

    auto orchestrator = make_orchestrator();
    auto report = orchestrator.process_item(std::nullopt);
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report.value().resumed_upload);
    EXPECT_EQ(source_->open_calls, 1u);
}

TEST_F(PipelineOrchestratorTest, RecordedSourceSizeAllowsReuseOfOriginal) {
    create_test_file("temp/original_7.mp4", 3000);
    resume_record record("7", pipeline_stage::compressing, "Pho");
    record.source_size = 3000;
    ASSERT_TRUE(resume_->upsert(record).has_value());

    auto orchestrator = make_orchestrator();
    auto report = orchestrator.process_item(std::nullopt);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().state, item_state::published);
    EXPECT_EQ(source_->open_calls, 0u);
    EXPECT_EQ(destination_->uploaded_paths.front(), temp_path("original_7.mp4"));
}

TEST_F(PipelineOrchestratorTest, OriginalOfWrongSizeIsDownloadedAgain) {
    create_test_file("temp/original_7.mp4", 2500);
    resume_record record("7", pipeline_stage::compressing, "Pho");
    record.source_size = 3000;
    ASSERT_TRUE(resume_->upsert(record).has_value());

    auto orchestrator = make_orchestrator();
    auto report = orchestrator.process_item(std::nullopt);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().state, item_state::published);
    EXPECT_EQ(source_->open_calls, 1u);
}

TEST_F(PipelineOrchestratorTest, InterruptedDownloadRestartsItem) {
    ASSERT_TRUE(resume_->upsert(resume_record("12", pipeline_stage::downloading, "Tacos"))
                    .has_value());

    auto orchestrator = make_orchestrator();
    auto report = orchestrator.process_item(std::nullopt);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().item_id, "12");
    EXPECT_EQ(report.value().state, item_state::published);
    EXPECT_EQ(source_->requested_ids, (std::vector<std::string>{"F12"}));
}

TEST_F(PipelineOrchestratorTest, ClientErrorLeavesItemResumable) {
    destination_->steps = {upload_step::fail(error_code::remote_client_error)};
    auto orchestrator = make_orchestrator();

    auto report = orchestrator.process_item(std::string("7"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().state, item_state::failed);
    ASSERT_TRUE(report.value().failure.has_value());
    EXPECT_EQ(report.value().failure->code, error_code::remote_client_error);
    EXPECT_FALSE(report.value().remote_id.has_value());

    EXPECT_FALSE(ledger_->contains("7"));
    auto record = resume_->get("7");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->stage, pipeline_stage::uploading);
    EXPECT_TRUE(std::filesystem::exists(temp_path("original_7.mp4")));
    EXPECT_TRUE(sleeper_.delays().empty());

    auto retried = orchestrator.process_item(std::nullopt);
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ(retried.value().item_id, "7");
    EXPECT_EQ(retried.value().state, item_state::published);
    EXPECT_TRUE(retried.value().resumed_upload);
    EXPECT_EQ(source_->open_calls, 1u);
    EXPECT_EQ(destination_->session_calls, 2u);
}

TEST_F(PipelineOrchestratorTest, DownloadFailureIsReported) {
    source_->open_failures = {error_code::source_not_found};
    auto orchestrator = make_orchestrator();

    auto report = orchestrator.process_item(std::string("7"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().state, item_state::failed);
    EXPECT_EQ(report.value().failure->code, error_code::source_not_found);
    EXPECT_EQ(resume_->get("7")->stage, pipeline_stage::downloading);
    EXPECT_FALSE(ledger_->contains("7"));
    EXPECT_EQ(destination_->session_calls, 0u);
}

TEST_F(PipelineOrchestratorTest, ResumeWriteFailureStopsBeforeDownload) {
    resume_backend_->set_read_only(true);
    auto orchestrator = make_orchestrator();

    auto report = orchestrator.process_item(std::string("7"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().state, item_state::failed);
    EXPECT_EQ(report.value().failure->code, error_code::state_write_error);
    EXPECT_EQ(source_->open_calls, 0u);
}

TEST_F(PipelineOrchestratorTest, LedgerWriteFailureIsNotReportedAsPublished) {
    ledger_backend_->set_read_only(true);
    auto orchestrator = make_orchestrator();

    auto report = orchestrator.process_item(std::string("7"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().state, item_state::failed);
    EXPECT_EQ(report.value().failure->code, error_code::state_write_error);
    EXPECT_EQ(report.value().remote_id, std::optional<std::string>{"remote-1"});
    EXPECT_FALSE(ledger_->contains("7"));
    ASSERT_TRUE(resume_->get("7").has_value());
    EXPECT_EQ(resume_->get("7")->published_remote_id, std::optional<std::string>{"remote-1"});
}

TEST_F(PipelineOrchestratorTest, ConfirmedUploadIsCommittedWithoutUploadingAgain) {
    ledger_backend_->set_read_only(true);
    {
        auto orchestrator = make_orchestrator();
        auto report = orchestrator.process_item(std::string("7"));
        ASSERT_TRUE(report.has_value());
        ASSERT_EQ(report.value().state, item_state::failed);
    }

    ledger_backend_->set_read_only(false);
    auto orchestrator = make_orchestrator();
    auto report = orchestrator.process_item(std::string("7"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().state, item_state::published);
    EXPECT_EQ(report.value().remote_id, std::optional<std::string>{"remote-1"});

    EXPECT_EQ(destination_->session_calls, 1u);
    EXPECT_EQ(source_->open_calls, 1u);
    EXPECT_TRUE(ledger_->contains("7"));
    EXPECT_FALSE(resume_->get("7").has_value());
    EXPECT_FALSE(std::filesystem::exists(temp_path("original_7.mp4")));
}

TEST_F(PipelineOrchestratorTest, ConfirmedUploadWaitsForWritableLedger) {
    ledger_backend_->set_read_only(true);
    auto orchestrator = make_orchestrator();
    ASSERT_TRUE(orchestrator.process_item(std::string("7")).has_value());

    auto next = orchestrator.process_item(std::nullopt);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value().item_id, "7");
    EXPECT_EQ(next.value().state, item_state::failed);
    EXPECT_EQ(next.value().failure->code, error_code::state_write_error);

    EXPECT_EQ(destination_->session_calls, 1u);
    EXPECT_TRUE(resume_->get("7")->published_remote_id.has_value());
    EXPECT_TRUE(std::filesystem::exists(temp_path("original_7.mp4")));
}

TEST_F(PipelineOrchestratorTest, StaleRecordOfPublishedItemIsPruned) {
    ASSERT_TRUE(ledger_->add("3").has_value());
    ASSERT_TRUE(resume_->upsert(resume_record("3", pipeline_stage::uploading, "Ramen"))
                    .has_value());

    auto orchestrator = make_orchestrator();
    auto report = orchestrator.process_item(std::nullopt);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().item_id, "7");
    EXPECT_FALSE(resume_->get("3").has_value());
}

// =============================================================================
// Selection
// =============================================================================

TEST_F(PipelineOrchestratorTest, RequestedItemMustExist) {
    auto orchestrator = make_orchestrator();

    auto report = orchestrator.process_item(std::string("99"));
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::item_not_found);
}

TEST_F(PipelineOrchestratorTest, RequestedItemMustNotBePublished) {
    ASSERT_TRUE(ledger_->add("7").has_value());
    auto orchestrator = make_orchestrator();

    auto report = orchestrator.process_item(std::string("7"));
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::already_published);
    EXPECT_EQ(source_->open_calls, 0u);
}

TEST_F(PipelineOrchestratorTest, SelectsLowestUnpublishedId) {
    auto orchestrator = make_orchestrator();

    auto first = orchestrator.select_next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().id, "3");

    ASSERT_TRUE(ledger_->add("3").has_value());
    EXPECT_EQ(orchestrator.select_next().value().id, "7");
    EXPECT_EQ(orchestrator.select_next({"7"}).value().id, "12");
}

TEST_F(PipelineOrchestratorTest, InterruptedItemsComeFirst) {
    ASSERT_TRUE(resume_->upsert(resume_record("12", pipeline_stage::compressing, "Tacos"))
                    .has_value());
    auto orchestrator = make_orchestrator();

    EXPECT_EQ(orchestrator.select_next().value().id, "12");
    EXPECT_EQ(orchestrator.select_next({"12"}).value().id, "3");
}

TEST_F(PipelineOrchestratorTest, RecordsForUnknownItemsAreIgnored) {
    ASSERT_TRUE(resume_->upsert(resume_record("404", pipeline_stage::uploading, "Gone"))
                    .has_value());
    auto orchestrator = make_orchestrator();

    EXPECT_EQ(orchestrator.select_next().value().id, "3");
}

TEST_F(PipelineOrchestratorTest, NothingEligible) {
    for (const char* id : {"3", "7", "12"}) {
        ASSERT_TRUE(ledger_->add(id).has_value());
    }
    auto orchestrator = make_orchestrator();

    auto selected = orchestrator.select_next();
    ASSERT_FALSE(selected.has_value());
    EXPECT_EQ(selected.error().code, error_code::no_eligible_item);

    auto report = orchestrator.process_item(std::nullopt);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::no_eligible_item);
}

TEST_F(PipelineOrchestratorTest, RandomPickStaysWithinWindow) {
    ASSERT_TRUE(catalog_->load_from_string(numbered_catalog(15)).has_value());
    config_.random_pick_probability = 1.0;
    config_.random_window = 3;
    config_.random_seed = 42;
    auto orchestrator = make_orchestrator();

    const std::set<std::string> window = {"1", "2", "3"};
    for (int i = 0; i < 50; ++i) {
        auto selected = orchestrator.select_next();
        ASSERT_TRUE(selected.has_value());
        EXPECT_EQ(window.count(selected.value().id), 1u) << selected.value().id;
    }
}

TEST_F(PipelineOrchestratorTest, SmallEligibleSetIsStrictlyOrdered) {
    config_.random_pick_probability = 1.0;
    config_.random_seed = 1;
    auto orchestrator = make_orchestrator();

    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(orchestrator.select_next().value().id, "3");
    }
}

TEST_F(PipelineOrchestratorTest, EveryItemIsEventuallySelected) {
    ASSERT_TRUE(catalog_->load_from_string(numbered_catalog(15)).has_value());
    config_.random_pick_probability = 0.5;
    config_.random_window = 4;
    config_.random_seed = 7;
    auto orchestrator = make_orchestrator();

    std::set<std::string> selected_ids;
    for (int i = 0; i < 15; ++i) {
        auto selected = orchestrator.select_next();
        ASSERT_TRUE(selected.has_value());
        EXPECT_TRUE(selected_ids.insert(selected.value().id).second);
        ASSERT_TRUE(ledger_->add(selected.value().id).has_value());
    }

    EXPECT_EQ(selected_ids.size(), 15u);
    EXPECT_EQ(orchestrator.select_next().error().code, error_code::no_eligible_item);
}

// =============================================================================
// Batch mode
// =============================================================================

TEST_F(PipelineOrchestratorTest, BatchPublishesUntilExhausted) {
    auto orchestrator = make_orchestrator();

    auto summary = orchestrator.run_batch(5);
    EXPECT_EQ(summary.attempted, 3u);
    EXPECT_EQ(summary.published, 3u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_TRUE(summary.exhausted);
    ASSERT_EQ(summary.reports.size(), 3u);
    EXPECT_EQ(summary.reports[0].item_id, "3");
    EXPECT_EQ(summary.reports[1].item_id, "7");
    EXPECT_EQ(summary.reports[2].item_id, "12");

    EXPECT_EQ(ledger_->size(), 3u);
    EXPECT_EQ(sleeper_.delays(), std::vector<milliseconds>(3, milliseconds{5000}));
}

TEST_F(PipelineOrchestratorTest, BatchStopsAtLimit) {
    auto orchestrator = make_orchestrator();

    auto summary = orchestrator.run_batch(2);
    EXPECT_EQ(summary.attempted, 2u);
    EXPECT_FALSE(summary.exhausted);
    EXPECT_EQ(sleeper_.delays(), std::vector<milliseconds>(1, milliseconds{5000}));
    EXPECT_FALSE(ledger_->contains("12"));
}

TEST_F(PipelineOrchestratorTest, BatchSkipsFailedItems) {
    source_->open_failures = {error_code::source_not_found};
    auto orchestrator = make_orchestrator();

    auto summary = orchestrator.run_batch(10);
    EXPECT_EQ(summary.attempted, 3u);
    EXPECT_EQ(summary.published, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_TRUE(summary.exhausted);
    EXPECT_EQ(summary.reports[0].item_id, "3");
    EXPECT_EQ(summary.reports[0].state, item_state::failed);
    EXPECT_FALSE(ledger_->contains("3"));
}

TEST_F(PipelineOrchestratorTest, BatchWithoutDelay) {
    config_.inter_item_delay = std::chrono::seconds{0};
    auto orchestrator = make_orchestrator();

    auto summary = orchestrator.run_batch(3);
    EXPECT_EQ(summary.published, 3u);
    EXPECT_TRUE(sleeper_.delays().empty());
}

// =============================================================================
// Status and maintenance
// =============================================================================

TEST_F(PipelineOrchestratorTest, StatusBeforeAnyPublish) {
    auto orchestrator = make_orchestrator();

    auto snapshot = orchestrator.status();
    EXPECT_EQ(snapshot.total, 3u);
    EXPECT_EQ(snapshot.published, 0u);
    EXPECT_EQ(snapshot.remaining, 3u);
    EXPECT_FALSE(snapshot.estimated_remaining.has_value());

    auto text = render_status_report(snapshot);
    EXPECT_NE(text.find("Unable to estimate completion time yet"), std::string::npos);
    EXPECT_NE(text.find("  1. ID 3: Ramen"), std::string::npos);
}

TEST_F(PipelineOrchestratorTest, StatusListsInFlightItemsFirst) {
    ASSERT_TRUE(ledger_->add("3").has_value());
    ASSERT_TRUE(resume_->upsert(resume_record("12", pipeline_stage::downloading, "Tacos"))
                    .has_value());
    auto orchestrator = make_orchestrator();

    auto snapshot = orchestrator.status();
    EXPECT_EQ(snapshot.total, 3u);
    EXPECT_EQ(snapshot.published, 1u);
    EXPECT_EQ(snapshot.remaining, 2u);
    ASSERT_EQ(snapshot.in_flight.size(), 1u);
    EXPECT_EQ(snapshot.in_flight[0].item_id, "12");
    ASSERT_EQ(snapshot.next_items.size(), 2u);
    EXPECT_EQ(snapshot.next_items[0].id, "12");
    EXPECT_EQ(snapshot.next_items[1].id, "7");
    EXPECT_EQ(snapshot.estimated_remaining, std::optional<std::chrono::hours>{4});

    auto text = render_status_report(snapshot);
    EXPECT_NE(text.find("Total items in catalog: 3\n"), std::string::npos);
    EXPECT_NE(text.find("Published items: 1\n"), std::string::npos);
    EXPECT_NE(text.find("Remaining items: 2\n"), std::string::npos);
    EXPECT_NE(text.find("Estimated time remaining: 0.2 days (4 hours)"), std::string::npos);
    EXPECT_NE(text.find("Estimated completion: "), std::string::npos);
    EXPECT_NE(text.find("  ID 12: Tacos - Stage: downloading"), std::string::npos);
    EXPECT_NE(text.find("Next 2 items to process:\n  1. ID 12: Tacos\n  2. ID 7: Pho\n"),
              std::string::npos);
    EXPECT_NE(text.find("All remaining items:"), std::string::npos);

    EXPECT_EQ(render_status_report(snapshot, false).find("All remaining items:"),
              std::string::npos);
}

TEST_F(PipelineOrchestratorTest, StatusPreviewIsBounded) {
    config_.status_preview_count = 1;
    auto orchestrator = make_orchestrator();

    auto snapshot = orchestrator.status();
    EXPECT_EQ(snapshot.next_items.size(), 1u);
    EXPECT_EQ(snapshot.all_remaining.size(), 3u);
}

TEST_F(PipelineOrchestratorTest, WritesStatusReport) {
    auto orchestrator = make_orchestrator();
    auto path = test_dir_ / "reports" / "relay_status.txt";

    ASSERT_TRUE(orchestrator.write_status_report(path).has_value());
    auto text = read_text(path);
    EXPECT_EQ(text.rfind("Media Relay Status Report - ", 0), 0u);
    EXPECT_NE(text.find("Total items in catalog: 3"), std::string::npos);
}

TEST_F(PipelineOrchestratorTest, PurgeClearsArtifactsAndResumeButNotLedger) {
    create_test_file("temp/original_7.mp4", 10);
    create_test_file("temp/compressed_7.mp4", 10);
    ASSERT_TRUE(ledger_->add("3").has_value());
    ASSERT_TRUE(resume_->upsert(resume_record("7", pipeline_stage::compressing, "Pho"))
                    .has_value());
    auto orchestrator = make_orchestrator();

    auto removed = orchestrator.purge();
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed.value(), 2u);
    EXPECT_TRUE(std::filesystem::is_empty(test_dir_ / "temp"));
    EXPECT_EQ(resume_->size(), 0u);
    EXPECT_TRUE(ledger_->contains("3"));
}

TEST_F(PipelineOrchestratorTest, PurgeWithoutTempDirectory) {
    auto orchestrator = make_orchestrator();

    auto removed = orchestrator.purge();
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed.value(), 0u);
}

}  // namespace kcenon::media_relay::test
