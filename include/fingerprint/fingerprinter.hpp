#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <string>
#include <string_view>

namespace clipstash {

/**
 * @brief Content fingerprinter - type-tagged SHA-256 digests for deduplication
 *
 * Digest input is: content type tag || 0x00 || payload bytes
 *
 * The tag ("text", "image", "file") makes a text entry and an image entry with
 * byte-identical payloads hash differently by construction.
 *
 * Example:
 *   fingerprint(TEXT, "hello")  -> sha256("text\0hello")
 *   fingerprint(IMAGE, "hello") -> sha256("image\0hello")
 */
class Fingerprinter {
public:
    /**
     * @brief Fingerprint an in-memory payload
     * @param type Content type used as the domain tag
     * @param payload Normalized payload bytes
     */
    [[nodiscard]] static ContentFingerprint fingerprint(ContentType type, std::string_view payload);

    /**
     * @brief Fingerprint a file's contents without loading it whole
     * @return STORAGE_IO_ERROR when the file cannot be opened or read
     */
    [[nodiscard]] static Result<ContentFingerprint> fingerprint_file(
        ContentType type, const std::string& path);

private:
    static constexpr size_t kReadChunk = 64 * 1024;
};

} // namespace clipstash
