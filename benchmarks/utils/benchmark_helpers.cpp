/**
 * @file benchmark_helpers.cpp
 * @brief Chunk fixtures shared by the benchmarks
 */

#include "utils/benchmark_helpers.h"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

#include <unistd.h>

namespace kcenon::cloud_backup::benchmark {

auto chunk_payload(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> payload(size);
    std::mt19937_64 engine(seed);

    std::size_t offset = 0;
    while (offset < size) {
        auto word = engine();
        for (int shift = 0; shift < 64 && offset < size; shift += 8) {
            payload[offset++] = static_cast<std::byte>((word >> shift) & 0xff);
        }
    }
    return payload;
}

chunk_directory::chunk_directory() {
    static std::atomic<unsigned> counter{0};
    root_ = std::filesystem::temp_directory_path() /
            ("cloud_backup_bench_" + std::to_string(::getpid()) + "_" +
             std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(root_);
}

chunk_directory::~chunk_directory() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

auto chunk_directory::write_chunk(uint32_t sequence, std::size_t size)
    -> std::filesystem::path {
    char name[16];
    std::snprintf(name, sizeof(name), "%06u", sequence);
    auto file = root_ / name;

    auto payload = chunk_payload(size, sequence);
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(payload.data()),
              static_cast<std::streamsize>(payload.size()));
    if (!out) {
        throw std::runtime_error("cannot write benchmark chunk " + file.string());
    }
    return file;
}

}  // namespace kcenon::cloud_backup::benchmark
