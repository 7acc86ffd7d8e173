#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "storage/artifact_store.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace clipstash {

/**
 * @brief Output of classification: what the payload is and how to show it
 */
struct ClassifiedPayload {
    ContentType content_type = ContentType::TEXT;
    std::string normalized;             // bytes that get fingerprinted
    std::string raw_payload;            // value persisted in the entry
    std::string display_text;
    ContentFingerprint fingerprint;

    // Image only
    std::string artifact_path;
    bool artifact_created = false;      // this capture wrote the file

    // Set when a recognized payload was malformed and a generic label was used
    std::optional<std::string> degradation;
};

/**
 * @brief Content classifier - maps a raw capture onto an entry shape
 *
 * Per variant alternative:
 * - TextPayload:  payload is the text; display is a single-line UTF-8 safe preview
 * - ImagePayload: bytes go to the content-addressed artifact directory before
 *                 anything else sees the entry; display is "[Image: WxH]" from
 *                 header-only parsing, "[Image]" when the header is unreadable
 * - FilePayload:  payload is the newline-joined path list; display names the
 *                 first file and the count
 *
 * Never throws. Returns nullopt for captures that should be skipped (empty or
 * oversized); returns an error only when the artifact cannot be written.
 */
class ContentClassifier {
public:
    struct Config {
        size_t preview_length = 60;
        size_t max_text_bytes = 1'000'000;
        size_t max_image_bytes = 10'000'000;
    };

    ContentClassifier(const Config& config, std::shared_ptr<const ArtifactStore> artifacts);

    [[nodiscard]] Result<std::optional<ClassifiedPayload>> classify(const RawCapture& capture) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Result<std::optional<ClassifiedPayload>> classify_text(const TextPayload& payload) const;
    Result<std::optional<ClassifiedPayload>> classify_image(const ImagePayload& payload) const;
    Result<std::optional<ClassifiedPayload>> classify_files(const FilePayload& payload) const;

    Config config_;
    std::shared_ptr<const ArtifactStore> artifacts_;
};

} // namespace clipstash
