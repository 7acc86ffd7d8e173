#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace clipstash {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// Negative sizes collapse to 0 so validation reports them
size_t non_negative(int64_t value) {
    return value < 0 ? 0 : static_cast<size_t>(value);
}

bool is_valid_extension(const std::string& ext) {
    if (ext.empty() || ext.size() > 8) return false;
    return std::all_of(ext.begin(), ext.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    });
}

} // anonymous namespace

// ============================================================================
// Section Extractors
// ============================================================================

StorageConfig ConfigLoader::extract_storage(const toml::table& root) {
    StorageConfig cfg;
    cfg.data_dir = expand_env_vars(kDefaultDataDir);

    if (const auto* storage = root["storage"].as_table()) {
        const auto& s = *storage;
        cfg.data_dir = s["data_dir"].value_or(cfg.data_dir);
        cfg.database_file = s["database_file"].value_or(cfg.database_file);
        cfg.images_dir = s["images_dir"].value_or(cfg.images_dir);
        cfg.artifact_extension = s["artifact_extension"].value_or(cfg.artifact_extension);
        cfg.max_entries = non_negative(s["max_entries"].value_or(int64_t{500}));
    }

    if (const char* override_dir = std::getenv(kDataDirEnv); override_dir && *override_dir) {
        cfg.data_dir = override_dir;
    }
    return cfg;
}

CaptureConfig ConfigLoader::extract_capture(const toml::table& root) {
    CaptureConfig cfg;
    const auto* capture = root["capture"].as_table();
    if (!capture) return cfg;
    const auto& c = *capture;

    cfg.poll_interval_ms = c["poll_interval_ms"].value_or(int64_t{500});
    cfg.max_text_bytes = non_negative(c["max_text_bytes"].value_or(int64_t{1'000'000}));
    cfg.max_image_bytes = non_negative(c["max_image_bytes"].value_or(int64_t{10'000'000}));
    cfg.preview_length = non_negative(c["preview_length"].value_or(int64_t{60}));
    cfg.redact_sensitive = c["redact_sensitive"].value_or(true);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    cfg.file = l["file"].value_or(""s);
    return cfg;
}

ClipstashConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    ClipstashConfig config;
    config.storage = extract_storage(tbl);
    config.capture = extract_capture(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ClipstashConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_or_default(const std::string& config_path) {
    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec)) {
        return load_from_string("");
    }
    return load_from_file(config_path);
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

std::string ConfigLoader::default_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (std::filesystem::path(xdg) / "clipstash" / "clipstash.toml").string();
    }
    const char* home = std::getenv("HOME");
    return (std::filesystem::path(home ? home : ".") / ".config" / "clipstash" / "clipstash.toml").string();
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ClipstashConfig& config) {
    std::vector<std::string> errors;

    if (config.storage.data_dir.empty()) {
        errors.push_back("storage.data_dir must not be empty");
    }
    if (config.storage.database_file.empty()) {
        errors.push_back("storage.database_file must not be empty");
    }
    if (config.storage.images_dir.empty()) {
        errors.push_back("storage.images_dir must not be empty");
    }
    if (!is_valid_extension(config.storage.artifact_extension)) {
        errors.push_back(std::format("storage.artifact_extension must be 1-8 alphanumeric chars, got '{}'",
                                     config.storage.artifact_extension));
    }
    if (config.storage.max_entries < 1) {
        errors.push_back("storage.max_entries must be >= 1");
    }

    if (!utils::in_range<50, 5000>(config.capture.poll_interval_ms)) {
        errors.push_back(std::format("capture.poll_interval_ms must be 50-5000, got {}",
                                     config.capture.poll_interval_ms));
    }
    if (!utils::in_range<8, 500>(config.capture.preview_length)) {
        errors.push_back(std::format("capture.preview_length must be 8-500, got {}",
                                     config.capture.preview_length));
    }
    if (config.capture.max_text_bytes == 0) {
        errors.push_back("capture.max_text_bytes must be > 0");
    }
    if (config.capture.max_image_bytes == 0) {
        errors.push_back("capture.max_image_bytes must be > 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace clipstash
