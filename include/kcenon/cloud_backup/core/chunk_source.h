/**
 * @file chunk_source.h
 * @brief Enumerates the chunk and parity files produced by the upstream archiver
 */

#ifndef KCENON_CLOUD_BACKUP_CORE_CHUNK_SOURCE_H
#define KCENON_CLOUD_BACKUP_CORE_CHUNK_SOURCE_H

#include <kcenon/cloud_backup/core/chunk_types.h>
#include <kcenon/cloud_backup/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief Arguments handed over by the upstream archiver for one job
 *
 * The tar, split and parity tool paths, the split size and the file list
 * describe how the archive was made; they are recorded for logging and
 * are not executed here.
 */
struct job_spec {
    std::filesystem::path tar_path;
    std::filesystem::path split_path;
    std::filesystem::path parity_path;
    std::string host;
    uint64_t backup_number = 0;
    std::string compression = "none";      ///< Compression kind, e.g. "gzip"
    std::string compression_extension;     ///< File extension, e.g. ".gz"
    uint64_t split_size = 0;               ///< 0 when the archive is not split
    std::filesystem::path archive_destination;
    std::string parity_filename;           ///< Restricts parity matches when set
    std::vector<std::string> file_list;

    std::vector<std::filesystem::path> chunk_paths;   ///< Explicit data chunks, in order
    std::vector<std::filesystem::path> parity_paths;  ///< Explicit parity files

    /**
     * @brief Archive base name: <host>.<num>.tar<ext>
     */
    [[nodiscard]] auto archive_base_name() const -> std::string;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Convert a two-letter split suffix to a 1-based sequence (aa=1, ab=2)
 */
[[nodiscard]] auto split_suffix_sequence(std::string_view suffix) -> std::optional<uint32_t>;

/**
 * @brief Produces the ordered chunk list for one archive job
 *
 * @code
 * chunk_source source(spec);
 * auto chunks = source.enumerate();
 * if (chunks) {
 *     // chunks.value()[0].sequence == 1
 * }
 * @endcode
 */
class chunk_source {
public:
    explicit chunk_source(job_spec spec);

    /**
     * @brief Enumerate data chunks followed by parity files
     *
     * Checksums are left empty; encryption workers compute them in parallel.
     */
    [[nodiscard]] auto enumerate() const -> result<std::vector<chunk>>;

    [[nodiscard]] auto spec() const -> const job_spec& { return spec_; }

private:
    [[nodiscard]] auto find_data_files() const -> result<std::vector<std::filesystem::path>>;
    [[nodiscard]] auto find_parity_files() const -> result<std::vector<std::filesystem::path>>;

    job_spec spec_;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_CORE_CHUNK_SOURCE_H
