#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace clipstash {

/**
 * @brief Content-addressed image artifact directory
 *
 * Every artifact is named "<fingerprint-hex>.<extension>" so the mapping from
 * entry to file survives without the database. Writes are durable before
 * they return: data goes to a temporary sibling, is fsync'd, then renamed
 * into place and the directory is fsync'd.
 *
 * Thread-safety: stateless apart from the directory path; concurrent writes
 * of the same fingerprint race on rename, which is atomic and produces
 * identical content.
 */
class ArtifactStore {
public:
    ArtifactStore(std::filesystem::path directory, std::string extension);

    /// Create the directory tree if missing
    [[nodiscard]] Status ensure_directory() const;

    [[nodiscard]] std::filesystem::path path_for(const std::string& fingerprint_hex) const;

    /**
     * @brief Write bytes under the fingerprint's name
     * @return true when a new file was created, false when it already existed
     */
    [[nodiscard]] Result<bool> write(const std::string& fingerprint_hex,
                                     std::span<const uint8_t> bytes) const;

    [[nodiscard]] Result<std::vector<uint8_t>> read(const std::filesystem::path& path) const;

    /**
     * @brief Delete an artifact; a missing file is not an error
     *
     * Paths outside the artifact directory are refused so a corrupt row can
     * never point the store at an arbitrary file.
     */
    [[nodiscard]] Status remove(const std::filesystem::path& path) const;

    [[nodiscard]] bool exists(const std::filesystem::path& path) const;

    /// True if path names a file directly inside the artifact directory
    [[nodiscard]] bool owns(const std::filesystem::path& path) const;

    /// Sum of artifact file sizes
    [[nodiscard]] uint64_t total_bytes() const;

    [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }
    [[nodiscard]] const std::string& extension() const { return extension_; }

private:
    std::filesystem::path directory_;
    std::string extension_;
};

} // namespace clipstash
