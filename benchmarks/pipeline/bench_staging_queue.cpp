/**
 * @file bench_staging_queue.cpp
 * @brief Hand-off cost of the bounded staging queue between the stages
 */

#include <benchmark/benchmark.h>

#include <kcenon/cloud_backup/pipeline/staging_queue.h>

#include <thread>
#include <vector>

namespace kcenon::cloud_backup::benchmark {

// state.range(0) producers, state.range(1) consumers, capacity 2 * producers
static void BM_Staging_Handoff(::benchmark::State& state) {
    const auto producers = static_cast<int>(state.range(0));
    const auto consumers = static_cast<int>(state.range(1));
    constexpr int items_per_producer = 10000;

    for (auto _ : state) {
        staging_queue<int> queue(static_cast<std::size_t>(producers) * 2);
        std::vector<std::thread> threads;

        for (int p = 0; p < producers; ++p) {
            threads.emplace_back([&queue] {
                for (int i = 0; i < items_per_producer; ++i) {
                    if (!queue.reserve()) {
                        return;
                    }
                    queue.push(i);
                }
            });
        }
        std::vector<std::thread> readers;
        for (int c = 0; c < consumers; ++c) {
            readers.emplace_back([&queue] {
                while (auto item = queue.pop()) {
                    ::benchmark::DoNotOptimize(*item);
                    queue.release();
                }
            });
        }

        for (auto& t : threads) {
            t.join();
        }
        queue.close();
        for (auto& t : readers) {
            t.join();
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(producers) * items_per_producer *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Staging_Handoff)
    ->Args({1, 1})
    ->Args({4, 2})
    ->Args({8, 4})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::cloud_backup::benchmark
