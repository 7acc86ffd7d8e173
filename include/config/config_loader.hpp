#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace clipstash {

/**
 * @brief TOML configuration loader
 *
 * String values support ${VAR} environment expansion (an unclosed "${" is a
 * parse error). After parsing, CLIPSTASH_DATA_DIR overrides storage.data_dir.
 * Validation collects every problem before failing.
 */
class ConfigLoader {
public:
    static constexpr const char* kDataDirEnv = "CLIPSTASH_DATA_DIR";
    static constexpr const char* kDefaultDataDir = "${HOME}/.local/share/clipstash";

    struct LoadResult {
        bool success = false;
        std::string error_message;
        ClipstashConfig config;

        static LoadResult ok(ClipstashConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to clipstash.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load from file if it exists, otherwise defaults
     */
    [[nodiscard]] static LoadResult load_or_default(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// ~/.config/clipstash/clipstash.toml (XDG_CONFIG_HOME honoured)
    [[nodiscard]] static std::string default_config_path();

    [[nodiscard]] static std::vector<std::string> validate_config(const ClipstashConfig& config);

private:
    static StorageConfig extract_storage(const toml::table& root);
    static CaptureConfig extract_capture(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static ClipstashConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(ClipstashConfig config);
};

} // namespace clipstash
