/**
 * @file bench_zero_scan.cpp
 * @brief Benchmarks for detecting all-zero page ranges
 *
 * Performance Targets:
 * - Zero scan of an all-zero range: >= 5 GB/s
 * - Non-zero range: exits within the first word
 */

#include <benchmark/benchmark.h>

#include <kcenon/blob_upload/core/zero_scan.h>

#include "utils/benchmark_helpers.h"

#include <span>
#include <vector>

namespace kcenon::blob_upload::benchmark {

/**
 * @brief Worst case: every byte must be read
 */
static void BM_ZeroScan_AllZero(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    std::vector<std::byte> data(size, std::byte{0});

    for (auto _ : state) {
        bool zero = is_all_zero(std::span<const std::byte>(data));
        ::benchmark::DoNotOptimize(zero);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Single non-zero byte at the end of the range
 */
static void BM_ZeroScan_LastByteSet(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    std::vector<std::byte> data(size, std::byte{0});
    data.back() = std::byte{1};

    for (auto _ : state) {
        bool zero = is_all_zero(std::span<const std::byte>(data));
        ::benchmark::DoNotOptimize(zero);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_ZeroScan_RandomData(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(size, 42);

    for (auto _ : state) {
        bool zero = is_all_zero(std::span<const std::byte>(data));
        ::benchmark::DoNotOptimize(zero);
    }
}

/**
 * @brief Scan a disk image chunk by chunk, as the page worker does
 */
static void BM_ZeroScan_SparseImage(::benchmark::State& state) {
    const auto chunk = static_cast<std::size_t>(state.range(0));
    const auto image_size = 64 * sizes::MB;
    auto data = test_data_generator::generate_sparse_data(image_size, 0.7, 42);
    std::span<const std::byte> image(data);

    for (auto _ : state) {
        std::size_t skipped = 0;
        for (std::size_t offset = 0; offset < image_size; offset += chunk) {
            if (is_all_zero(image.subspan(offset, std::min(chunk, image_size - offset)))) {
                ++skipped;
            }
        }
        ::benchmark::DoNotOptimize(skipped);
    }

    state.SetBytesProcessed(static_cast<int64_t>(image_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ZeroScan_AllZero)
    ->Arg(static_cast<int64_t>(sizes::page))
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(4 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ZeroScan_LastByteSet)
    ->Arg(static_cast<int64_t>(sizes::page + 7))
    ->Arg(static_cast<int64_t>(4 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ZeroScan_RandomData)
    ->Arg(static_cast<int64_t>(4 * sizes::MB))
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_ZeroScan_SparseImage)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(4 * sizes::MB))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::blob_upload::benchmark
