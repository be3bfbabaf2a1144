/**
 * @file main.cpp
 * @brief media_relay command-line driver
 *
 * Commands:
 * - run:    publish the next eligible item, a requested item, or a batch
 * - status: print progress totals and write a status report
 * - purge:  delete local artifacts and clear resume data
 */

#include <kcenon/media_relay/media_relay.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::media_relay;

namespace {

constexpr int exit_success = 0;
constexpr int exit_item_failure = 1;
constexpr int exit_usage = 2;

struct cli_options {
    std::string command;
    std::optional<std::string> item_id;
    std::size_t count = 1;
    std::optional<std::filesystem::path> report;
    std::filesystem::path catalog = "recipes.json";
    std::filesystem::path state_dir = ".";
    std::filesystem::path temp_dir = "temp_videos";
    std::filesystem::path source_dir = "drive";
    std::filesystem::path publish_dir = "published";
    std::string ffmpeg = "ffmpeg";
    bool compress = true;
    std::optional<std::chrono::seconds> delay;
    log_level level = log_level::info;
    bool log_json = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <command> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  run [--id ID] [--count N]   Publish the next item, item ID, or N items" << std::endl;
    std::cout << "  status [--report FILE]      Show progress and write a status report" << std::endl;
    std::cout << "  purge                       Delete local artifacts and resume data" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --catalog FILE      Catalog document (default: recipes.json)" << std::endl;
    std::cout << "  --state-dir DIR     Ledger and resume data directory (default: .)" << std::endl;
    std::cout << "  --temp-dir DIR      Local artifact directory (default: temp_videos)" << std::endl;
    std::cout << "  --source-dir DIR    Directory serving source files (default: drive)" << std::endl;
    std::cout << "  --publish-dir DIR   Directory receiving published videos (default: published)"
              << std::endl;
    std::cout << "  --ffmpeg PATH       Encoder executable (default: ffmpeg)" << std::endl;
    std::cout << "  --no-compress       Upload downloaded files without re-encoding" << std::endl;
    std::cout << "  --delay SEC         Seconds between items in batch mode (default: 60)"
              << std::endl;
    std::cout << "  --log-level LEVEL   trace, debug, info, warn, error, fatal (default: info)"
              << std::endl;
    std::cout << "  --log-json          Emit log records as JSON" << std::endl;
}

auto parse_count(const std::string& text) -> std::optional<std::size_t> {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    auto value = std::strtoull(text.c_str(), nullptr, 10);
    if (value == 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(value);
}

auto parse_arguments(int argc, char* argv[]) -> result<cli_options> {
    if (argc < 2) {
        return unexpected(error{error_code::invalid_configuration, "missing command"});
    }

    cli_options options;
    options.command = argv[1];
    if (options.command != "run" && options.command != "status" &&
        options.command != "purge") {
        return unexpected(error{error_code::invalid_configuration,
                                "unknown command: " + options.command});
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--no-compress") {
            options.compress = false;
            continue;
        }
        if (arg == "--log-json") {
            options.log_json = true;
            continue;
        }

        if (i + 1 >= argc) {
            return unexpected(error{error_code::invalid_configuration,
                                    "missing value for " + arg});
        }
        std::string value = argv[++i];

        if (arg == "--id") {
            options.item_id = value;
        } else if (arg == "--count") {
            auto count = parse_count(value);
            if (!count) {
                return unexpected(error{error_code::invalid_configuration,
                                        "--count expects a positive integer"});
            }
            options.count = *count;
        } else if (arg == "--report") {
            options.report = value;
        } else if (arg == "--catalog") {
            options.catalog = value;
        } else if (arg == "--state-dir") {
            options.state_dir = value;
        } else if (arg == "--temp-dir") {
            options.temp_dir = value;
        } else if (arg == "--source-dir") {
            options.source_dir = value;
        } else if (arg == "--publish-dir") {
            options.publish_dir = value;
        } else if (arg == "--ffmpeg") {
            options.ffmpeg = value;
        } else if (arg == "--delay") {
            auto seconds = value == "0" ? std::optional<std::size_t>{0} : parse_count(value);
            if (!seconds) {
                return unexpected(error{error_code::invalid_configuration,
                                        "--delay expects a non-negative integer"});
            }
            options.delay = std::chrono::seconds(static_cast<int64_t>(*seconds));
        } else if (arg == "--log-level") {
            auto level = log_level_from_string(value);
            if (!level) {
                return unexpected(error{error_code::invalid_configuration,
                                        "unknown log level: " + value});
            }
            options.level = *level;
        } else {
            return unexpected(error{error_code::invalid_configuration,
                                    "unknown option: " + arg});
        }
    }

    if (options.item_id && options.count != 1) {
        return unexpected(error{error_code::invalid_configuration,
                                "--id and --count cannot be combined"});
    }
    return options;
}

auto default_report_path() -> std::filesystem::path {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);

    std::ostringstream oss;
    oss << "relay_status_" << std::put_time(&tm_buf, "%Y%m%d") << ".txt";
    return oss.str();
}

auto build_orchestrator(const cli_options& options) -> result<pipeline_orchestrator> {
    catalog_config catalog_cfg;
    catalog_cfg.path = options.catalog;
    auto catalog = std::make_shared<catalog_store>(catalog_cfg);
    if (auto loaded = catalog->load(); !loaded) {
        return unexpected(loaded.error());
    }

    auto backend = std::make_shared<file_state_backend>(options.state_dir);
    auto ledger = std::make_shared<completion_ledger>(backend);
    if (auto loaded = ledger->load(); !loaded) {
        return unexpected(loaded.error());
    }
    auto resume = std::make_shared<resume_state_store>(backend);
    if (auto loaded = resume->load(); !loaded) {
        return unexpected(loaded.error());
    }

    orchestrator_config config;
    config.temp_dir = options.temp_dir;
    if (options.delay) {
        config.inter_item_delay = *options.delay;
    }

    compressor_config compression;
    compression.enabled = options.compress;

    return pipeline_orchestrator::builder()
        .with_catalog(catalog)
        .with_ledger(ledger)
        .with_resume_store(resume)
        .with_source(std::make_shared<local_media_source>(options.source_dir))
        .with_destination(std::make_shared<local_video_destination>(options.publish_dir))
        .with_encoder(std::make_shared<ffmpeg_encoder>(options.ffmpeg))
        .with_config(config)
        .with_compressor_config(compression)
        .build();
}

void print_report(const process_report& report) {
    std::cout << "Item " << report.item_id << " (" << report.display_name << "): "
              << to_string(report.state);
    if (report.remote_id) {
        std::cout << " as " << *report.remote_id;
    }
    if (report.failure) {
        std::cout << " - " << report.failure->message;
    }
    std::cout << std::endl;
}

auto run_command(pipeline_orchestrator& orchestrator, const cli_options& options) -> int {
    if (options.count > 1) {
        auto summary = orchestrator.run_batch(options.count);
        for (const auto& report : summary.reports) {
            print_report(report);
        }
        std::cout << "Published " << summary.published << " of " << summary.attempted
                  << " items" << std::endl;
        return summary.failed > 0 ? exit_item_failure : exit_success;
    }

    auto report = orchestrator.process_item(options.item_id);
    if (!report) {
        if (report.error().code == error_code::no_eligible_item) {
            std::cout << "All items have been published." << std::endl;
            return exit_success;
        }
        std::cerr << "Error: " << report.error().message << std::endl;
        return exit_item_failure;
    }

    print_report(report.value());
    return report.value().state == item_state::published ? exit_success : exit_item_failure;
}

auto status_command(const pipeline_orchestrator& orchestrator, const cli_options& options)
    -> int {
    auto snapshot = orchestrator.status();
    std::cout << render_status_report(snapshot, false);

    auto path = options.report ? *options.report : default_report_path();
    auto written = orchestrator.write_status_report(path);
    if (!written) {
        std::cerr << "Error: " << written.error().message << std::endl;
        return exit_item_failure;
    }
    std::cout << std::endl << "Detailed status report saved to " << path.string() << std::endl;
    return exit_success;
}

auto purge_command(pipeline_orchestrator& orchestrator) -> int {
    auto removed = orchestrator.purge();
    if (!removed) {
        std::cerr << "Error: " << removed.error().message << std::endl;
        return exit_item_failure;
    }
    std::cout << "Removed " << removed.value() << " files and cleared resume data" << std::endl;
    return exit_success;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = parse_arguments(argc, argv);
    if (!options) {
        std::cerr << "Error: " << options.error().message << std::endl;
        print_usage(argv[0]);
        return exit_usage;
    }

    auto& logger = get_logger();
    logger.set_level(options.value().level);
    logger.enable_json_output(options.value().log_json);
    logger.initialize();

    auto orchestrator = build_orchestrator(options.value());
    if (!orchestrator) {
        MR_LOG_ERROR(log_category::cli, "Startup failed: " + orchestrator.error().message);
        std::cerr << "Error: " << orchestrator.error().message << std::endl;
        logger.shutdown();
        return exit_usage;
    }

    int exit_code = exit_success;
    const auto& command = options.value().command;
    if (command == "run") {
        exit_code = run_command(orchestrator.value(), options.value());
    } else if (command == "status") {
        exit_code = status_command(orchestrator.value(), options.value());
    } else {
        exit_code = purge_command(orchestrator.value());
    }

    logger.flush();
    logger.shutdown();
    return exit_code;
}
