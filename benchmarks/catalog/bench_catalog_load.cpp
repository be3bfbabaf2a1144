/**
 * @file bench_catalog_load.cpp
 * @brief Benchmarks for catalog loading, ledger loading and item selection
 *
 * Every relay invocation loads the full catalog and ledger before choosing
 * an item, so these costs are paid once per published video.
 */

#include <benchmark/benchmark.h>

#include <kcenon/media_relay/media_relay.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <string>

namespace kcenon::media_relay::benchmark {

namespace {

void quiet_logs() {
    get_logger().set_level(log_level::error);
}

}  // namespace

/**
 * @brief Parse a catalog document held in memory
 */
static void BM_Catalog_LoadFromString(::benchmark::State& state) {
    quiet_logs();
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto text = make_catalog_document(count, 42);

    for (auto _ : state) {
        catalog_store catalog(catalog_config{});
        auto loaded = catalog.load_from_string(text);
        if (!loaded) {
            state.SkipWithError(loaded.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(catalog.size());
    }

    state.SetBytesProcessed(static_cast<int64_t>(text.size()) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(text.size()));
}

/**
 * @brief Read and parse a catalog file
 */
static void BM_Catalog_LoadFromFile(::benchmark::State& state) {
    quiet_logs();
    const auto count = static_cast<std::size_t>(state.range(0));
    relay_workspace workspace;
    auto path = workspace.write_text(
        "recipes.json", make_catalog_document(count, 42));

    for (auto _ : state) {
        catalog_store catalog(catalog_config{path});
        auto loaded = catalog.load();
        if (!loaded) {
            state.SkipWithError(loaded.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(catalog.size());
    }

    state.counters["items"] = static_cast<double>(count);
}

/**
 * @brief Load a ledger of already published items
 */
static void BM_Ledger_Load(::benchmark::State& state) {
    quiet_logs();
    const auto count = static_cast<std::size_t>(state.range(0));
    auto backend = std::make_shared<memory_state_backend>();
    auto stored = backend->write(completion_ledger::default_document,
                                 make_ledger_document(count));
    if (!stored) {
        state.SkipWithError(stored.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        completion_ledger ledger(backend);
        auto loaded = ledger.load();
        if (!loaded) {
            state.SkipWithError(loaded.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(ledger.size());
    }
}

/**
 * @brief Choose the next item with half the catalog already published
 */
static void BM_Selection_SelectNext(::benchmark::State& state) {
    quiet_logs();
    const auto count = static_cast<std::size_t>(state.range(0));
    relay_workspace workspace;

    auto catalog = std::make_shared<catalog_store>(catalog_config{});
    auto backend = std::make_shared<memory_state_backend>();
    auto ledger = std::make_shared<completion_ledger>(backend);
    auto resume = std::make_shared<resume_state_store>(backend);
    if (!catalog->load_from_string(make_catalog_document(count, 42)) ||
        !backend->write(completion_ledger::default_document,
                        make_ledger_document(count / 2)) ||
        !ledger->load() || !resume->load()) {
        state.SkipWithError("Failed to prepare state");
        return;
    }

    orchestrator_config config;
    config.temp_dir = workspace.root() / "temp";
    config.random_seed = 42;

    auto built = pipeline_orchestrator::builder()
                     .with_catalog(catalog)
                     .with_ledger(ledger)
                     .with_resume_store(resume)
                     .with_source(std::make_shared<local_media_source>(workspace.root()))
                     .with_destination(std::make_shared<local_video_destination>(
                         workspace.root() / "published"))
                     .with_config(config)
                     .build();
    if (!built) {
        state.SkipWithError(built.error().message.c_str());
        return;
    }
    auto& orchestrator = built.value();

    for (auto _ : state) {
        auto selected = orchestrator.select_next();
        if (!selected) {
            state.SkipWithError(selected.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(selected.value());
    }

    state.counters["eligible"] = static_cast<double>(count - count / 2);
}

BENCHMARK(BM_Catalog_LoadFromString)->Arg(100)->Arg(1000)->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);
BENCHMARK(BM_Catalog_LoadFromFile)->Arg(1000)->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);
BENCHMARK(BM_Ledger_Load)->Arg(1000)->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);
BENCHMARK(BM_Selection_SelectNext)->Arg(1000)->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::media_relay::benchmark
