/**
 * @file bench_download_throughput.cpp
 * @brief Benchmarks for chunked download and artifact checksumming
 */

#include <benchmark/benchmark.h>

#include <kcenon/media_relay/media_relay.h>

#include "utils/benchmark_helpers.h"

#include <filesystem>
#include <memory>

namespace kcenon::media_relay::benchmark {

/**
 * @brief Stream a clip through the chunked downloader
 *
 * Measures the copy loop including part-file handling and the final rename.
 */
static void BM_Download_ChunkedThroughput(::benchmark::State& state) {
    get_logger().set_level(log_level::error);
    const auto file_size = static_cast<std::size_t>(state.range(0));

    relay_workspace workspace;
    workspace.write_random("drive/CLIP", file_size, 42);

    downloader_config config;
    config.chunk_size = sizes::download_chunk;
    chunked_downloader downloader(
        std::make_shared<local_media_source>(workspace.root() / "drive"), config);

    download_request request;
    request.item_id = "1";
    request.locator = "https://drive.google.com/file/d/CLIP/view";
    request.destination = workspace.root() / "temp" / "original_1.mp4";

    for (auto _ : state) {
        state.PauseTiming();
        std::error_code ec;
        std::filesystem::remove(request.destination, ec);
        state.ResumeTiming();

        auto outcome = downloader.download(request);
        if (!outcome) {
            state.SkipWithError(outcome.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(outcome.value().bytes);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(file_size));
}

/**
 * @brief SHA-256 over an upload artifact, paid when recording and resuming uploads
 */
static void BM_Checksum_Sha256File(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    relay_workspace workspace;
    auto artifact = workspace.write_random("compressed_1.mp4", file_size, 7);

    for (auto _ : state) {
        auto digest = checksum::sha256_file(artifact);
        if (!digest) {
            state.SkipWithError(digest.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["throughput"] = ::benchmark::Counter(
        static_cast<double>(file_size), ::benchmark::Counter::kIsIterationInvariantRate,
        ::benchmark::Counter::kIs1024);
}

BENCHMARK(BM_Download_ChunkedThroughput)
    ->Arg(static_cast<int64_t>(sizes::short_clip))
    ->Arg(static_cast<int64_t>(sizes::long_clip))
    ->Unit(::benchmark::kMillisecond);
BENCHMARK(BM_Checksum_Sha256File)
    ->Arg(static_cast<int64_t>(sizes::short_clip))
    ->Arg(static_cast<int64_t>(sizes::long_clip))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::media_relay::benchmark
