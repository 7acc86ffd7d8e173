#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace clipstash {

// ============================================================================
// Basic Enums
// ============================================================================

enum class ContentType {
    TEXT,
    IMAGE,
    FILE_REFERENCE
};

/// Stable name used as the database value and the fingerprint tag
[[nodiscard]] inline constexpr std::string_view content_type_name(ContentType type) noexcept {
    switch (type) {
        case ContentType::TEXT:           return "text";
        case ContentType::IMAGE:          return "image";
        case ContentType::FILE_REFERENCE: return "file";
    }
    return "text";
}

[[nodiscard]] inline std::optional<ContentType> parse_content_type(std::string_view name) {
    if (name == "text") return ContentType::TEXT;
    if (name == "image") return ContentType::IMAGE;
    if (name == "file") return ContentType::FILE_REFERENCE;
    return std::nullopt;
}

enum class SensitiveType {
    API_KEY,
    PASSWORD,
    SSN,
    CREDIT_CARD,
    PRIVATE_KEY,
    CERTIFICATE,
    TOKEN
};

[[nodiscard]] inline constexpr std::string_view sensitive_type_name(SensitiveType type) noexcept {
    switch (type) {
        case SensitiveType::API_KEY:     return "api key";
        case SensitiveType::PASSWORD:    return "password";
        case SensitiveType::SSN:         return "ssn";
        case SensitiveType::CREDIT_CARD: return "credit card";
        case SensitiveType::PRIVATE_KEY: return "private key";
        case SensitiveType::CERTIFICATE: return "certificate";
        case SensitiveType::TOKEN:       return "token";
    }
    return "unknown";
}

// ============================================================================
// Raw Clipboard Capture (what the external source hands us)
// ============================================================================

struct TextPayload {
    std::string text;
};

struct ImagePayload {
    std::vector<uint8_t> bytes;
    std::string mime_type;      // e.g. "image/png"; informational only
};

struct FilePayload {
    std::vector<std::string> paths;
};

/// Stored file-reference payloads join paths with NUL, a byte no path can contain
inline constexpr char kPathSeparator = '\0';

using RawCapture = std::variant<TextPayload, ImagePayload, FilePayload>;

// ============================================================================
// Content Fingerprint
// ============================================================================

struct ContentFingerprint {
    static constexpr size_t kDigestSize = 32;   // SHA-256

    std::array<uint8_t, kDigestSize> digest{};
    std::string hex;                            // 64 lowercase hex chars

    bool operator==(const ContentFingerprint& other) const { return digest == other.digest; }
};

// ============================================================================
// Redaction
// ============================================================================

struct SensitiveMatch {
    SensitiveType type;
    size_t start = 0;           // byte offset into the scanned text
    size_t end = 0;             // one past the last byte
    std::string original;
    std::string masked;
};

struct RedactionResult {
    bool is_sensitive = false;
    std::string masked_preview;             // empty when not sensitive
    std::string summary;                    // "api key, password"
    std::vector<SensitiveMatch> matches;    // non-overlapping, ordered by start
};

// ============================================================================
// History Entries
// ============================================================================

/**
 * @brief A classified, redacted, fingerprinted capture ready for the store
 */
struct EntryCandidate {
    ContentType content_type = ContentType::TEXT;
    std::string raw_payload;        // text, artifact path, or newline-joined paths
    std::string display_text;
    bool is_sensitive = false;
    std::string masked_preview;
    std::string sensitive_kinds;
    std::string content_hash;       // fingerprint hex
    int64_t byte_size = 0;
    std::chrono::system_clock::time_point captured_at;
};

struct ClipboardEntry {
    int64_t id = 0;
    ContentType content_type = ContentType::TEXT;
    std::string raw_payload;
    std::string display_text;
    bool is_sensitive = false;
    std::string masked_preview;
    std::string sensitive_kinds;
    std::string content_hash;
    int64_t byte_size = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_seen_at;
    bool pinned = false;

    // Set at read time when an image row's artifact is gone
    bool integrity_degraded = false;

    /// Text safe to show in a glanceable list
    [[nodiscard]] const std::string& preview() const {
        return (is_sensitive && !masked_preview.empty()) ? masked_preview : display_text;
    }

    [[nodiscard]] bool is_text() const { return content_type == ContentType::TEXT; }
    [[nodiscard]] bool is_image() const { return content_type == ContentType::IMAGE; }
    [[nodiscard]] bool is_file_reference() const { return content_type == ContentType::FILE_REFERENCE; }
};

} // namespace clipstash
