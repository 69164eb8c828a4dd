/**
 * @file bench_chunk_engine.cpp
 * @brief Benchmarks for planning and completion bookkeeping
 */

#include <benchmark/benchmark.h>

#include <kcenon/blob_upload/cloud/cloud_utils.h>
#include <kcenon/blob_upload/core/block_id_table.h>
#include <kcenon/blob_upload/core/chunk_planner.h>
#include <kcenon/blob_upload/core/completion_coordinator.h>

#include "utils/benchmark_helpers.h"

#include <limits>
#include <string>
#include <vector>

namespace kcenon::blob_upload::benchmark {

/**
 * @brief Plan a source of range(0) MB in default-size blocks
 */
static void BM_Planner_BlockList(::benchmark::State& state) {
    engine_config config;
    chunk_planner planner(config);
    const auto source_size = static_cast<uint64_t>(state.range(0)) * sizes::MB;

    for (auto _ : state) {
        auto plan = planner.plan(source_size, 4 * sizes::MB, false);
        if (!plan) {
            state.SkipWithError("planning failed");
            return;
        }
        ::benchmark::DoNotOptimize(plan.value().chunks.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_Planner_Validate(::benchmark::State& state) {
    engine_config config;
    chunk_planner planner(config);
    auto plan = planner.plan(static_cast<uint64_t>(state.range(0)) * sizes::MB,
                             4 * sizes::MB, false);

    for (auto _ : state) {
        auto valid = chunk_planner::validate(plan.value());
        ::benchmark::DoNotOptimize(valid);
    }
}

/**
 * @brief range(0) chunk reports per iteration from state.threads() workers
 *
 * The total is never reached; this measures the contended increment.
 */
static void BM_Coordinator_Contended(::benchmark::State& state) {
    static completion_coordinator coordinator;
    const auto chunks = static_cast<uint32_t>(state.range(0));

    if (state.thread_index() == 0) {
        coordinator.set_total(std::numeric_limits<uint32_t>::max());
    }

    for (auto _ : state) {
        for (uint32_t i = 0; i < chunks; ++i) {
            auto completion = coordinator.report_chunk_done();
            ::benchmark::DoNotOptimize(completion);
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * chunks);
}

static void BM_BlockId_Generate(::benchmark::State& state) {
    for (auto _ : state) {
        auto id = cloud_utils::make_block_id();
        ::benchmark::DoNotOptimize(id);
    }
}

static void BM_BlockIdTable_Fill(::benchmark::State& state) {
    const auto count = static_cast<uint32_t>(state.range(0));
    std::vector<std::string> ids;
    ids.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        ids.push_back(cloud_utils::make_block_id());
    }

    for (auto _ : state) {
        block_id_table table(count);
        for (uint32_t i = 0; i < count; ++i) {
            table.set(i, ids[i]);
        }
        ::benchmark::DoNotOptimize(table.is_complete());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * count);
}

BENCHMARK(BM_Planner_BlockList)
    ->Arg(64)
    ->Arg(4 * 1024)
    ->Arg(190 * 1024)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Planner_Validate)->Arg(4 * 1024)->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Coordinator_Contended)->Arg(1000)->Threads(1)->Threads(4)->Threads(16);

BENCHMARK(BM_BlockId_Generate)->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_BlockIdTable_Fill)->Arg(1000)->Arg(50000)->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::blob_upload::benchmark
