/**
 * @file benchmark_helpers.h
 * @brief Chunk fixtures shared by the benchmarks
 */

#ifndef KCENON_CLOUD_BACKUP_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_CLOUD_BACKUP_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace kcenon::cloud_backup::benchmark {

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_chunk = 256 * KB;
constexpr std::size_t default_chunk = 4 * MB;
constexpr std::size_t large_chunk = 64 * MB;
}  // namespace sizes

/// Deterministic incompressible payload; the same seed gives the same bytes
auto chunk_payload(std::size_t size, uint32_t seed) -> std::vector<std::byte>;

/**
 * @brief Scratch directory of numbered chunk files
 *
 * Each instance gets its own directory under the system temp path, removed
 * with everything in it on destruction.
 */
class chunk_directory {
public:
    chunk_directory();
    ~chunk_directory();

    chunk_directory(const chunk_directory&) = delete;
    auto operator=(const chunk_directory&) -> chunk_directory& = delete;

    /// Writes chunk @p sequence (named like "000003") and returns its path
    auto write_chunk(uint32_t sequence, std::size_t size) -> std::filesystem::path;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

}  // namespace kcenon::cloud_backup::benchmark

#endif  // KCENON_CLOUD_BACKUP_BENCHMARKS_BENCHMARK_HELPERS_H
