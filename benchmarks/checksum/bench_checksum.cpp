/**
 * @file bench_checksum.cpp
 * @brief Benchmarks for the per-chunk SHA-256 and MD5 passes
 *
 * Every chunk is hashed twice: SHA-256 over the plaintext and MD5 over the
 * ciphertext. Both passes read the file from disk.
 */

#include <benchmark/benchmark.h>

#include <kcenon/cloud_backup/core/checksum.h>

#include "utils/benchmark_helpers.h"

#include <span>

namespace kcenon::cloud_backup::benchmark {

// ============================================================================
// In-memory digests
// ============================================================================

static void BM_SHA256_Memory(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = chunk_payload(size, 42);

    for (auto _ : state) {
        auto digest = checksum::sha256(std::span<const std::byte>(data));
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_MD5_Memory(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = chunk_payload(size, 42);

    for (auto _ : state) {
        auto digest = checksum::md5(std::span<const std::byte>(data));
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

// ============================================================================
// File digests
// ============================================================================

static void BM_SHA256_File(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    chunk_directory chunks;
    auto path = chunks.write_chunk(1, size);

    for (auto _ : state) {
        auto digest = checksum::sha256_file(path);
        if (!digest) {
            state.SkipWithError("sha256_file failed");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_MD5_File(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    chunk_directory chunks;
    auto path = chunks.write_chunk(2, size);

    for (auto _ : state) {
        auto digest = checksum::md5_file(path);
        if (!digest) {
            state.SkipWithError("md5_file failed");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_SHA256_Memory)
    ->Arg(static_cast<int64_t>(sizes::small_chunk))
    ->Arg(static_cast<int64_t>(sizes::default_chunk))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_MD5_Memory)
    ->Arg(static_cast<int64_t>(sizes::small_chunk))
    ->Arg(static_cast<int64_t>(sizes::default_chunk))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_SHA256_File)
    ->Arg(static_cast<int64_t>(sizes::default_chunk))
    ->Arg(static_cast<int64_t>(sizes::large_chunk))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_MD5_File)
    ->Arg(static_cast<int64_t>(sizes::default_chunk))
    ->Arg(static_cast<int64_t>(sizes::large_chunk))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::cloud_backup::benchmark
