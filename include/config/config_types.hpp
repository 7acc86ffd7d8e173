#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace clipstash {

// ============================================================================
// Storage Config
// ============================================================================

struct StorageConfig {
    std::string data_dir;                       // resolved; "${HOME}/.local/share/clipstash" by default
    std::string database_file = "clipstash.db";
    std::string images_dir = "images";
    std::string artifact_extension = "img";
    size_t max_entries = 500;

    [[nodiscard]] std::filesystem::path database_path() const {
        return std::filesystem::path(data_dir) / database_file;
    }

    [[nodiscard]] std::filesystem::path images_path() const {
        return std::filesystem::path(data_dir) / images_dir;
    }
};

// ============================================================================
// Capture Config
// ============================================================================

struct CaptureConfig {
    int64_t poll_interval_ms = 500;
    size_t max_text_bytes = 1'000'000;
    size_t max_image_bytes = 10'000'000;
    size_t preview_length = 60;
    bool redact_sensitive = true;

    [[nodiscard]] std::chrono::milliseconds poll_interval() const {
        return std::chrono::milliseconds{poll_interval_ms};
    }
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
    std::string file;                           // empty = stderr only
};

// ============================================================================
// Top-level
// ============================================================================

struct ClipstashConfig {
    StorageConfig storage;
    CaptureConfig capture;
    LoggingConfig logging;
};

} // namespace clipstash
