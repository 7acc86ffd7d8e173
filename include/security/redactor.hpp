#pragma once

#include "core/types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace clipstash {

/**
 * @brief Sensitive-content redactor - detection plus display masking
 *
 * Categories are detected independently; a capture is sensitive if any
 * category matches. Detection is deliberately conservative: a false positive
 * only hides a preview, a false negative leaks a credential into a glanceable
 * history list.
 *
 * Categories (in precedence order for overlapping spans):
 * 1. API_KEY:     provider prefixes (sk-, AKIA, ghp_, xoxb-, AIza, sk_live_, ...)
 *                 and long high-entropy tokens
 * 2. PASSWORD:    password-like key followed by = : or whitespace; value only
 * 3. SSN:         ddd-dd-dddd or a bare 9-digit run, area/group/serial sanity checked
 * 4. CREDIT_CARD: 4-4-4-4 and 4-6-5 groupings that pass the Luhn checksum
 * 5. PRIVATE_KEY: PEM private key headers
 * 6. CERTIFICATE: PEM certificate headers
 * 7. TOKEN:       JWTs and "Bearer <token>"
 *
 * Masking never touches the stored payload; it only produces a preview.
 */
class Redactor {
public:
    struct Config {
        bool enabled = true;
        size_t preview_length = 60;
    };

    Redactor();
    explicit Redactor(const Config& config);

    /**
     * @brief Full redaction for a text capture
     * @return is_sensitive + truncated masked preview + category summary
     */
    [[nodiscard]] RedactionResult redact(std::string_view text) const;

    /**
     * @brief Detect sensitive spans
     * @return Non-overlapping matches sorted by start offset
     */
    [[nodiscard]] std::vector<SensitiveMatch> detect(std::string_view text) const;

    [[nodiscard]] bool is_sensitive(std::string_view text) const {
        return !detect(text).empty();
    }

    /// Replace each matched span with its mask, keeping surrounding text
    [[nodiscard]] static std::string mask_text(std::string_view text,
                                               const std::vector<SensitiveMatch>& matches);

    /// Category-specific mask for one sensitive value
    [[nodiscard]] static std::string mask_value(std::string_view value, SensitiveType type);

    /// Sorted, de-duplicated category names, e.g. "api key, password"
    [[nodiscard]] static std::string summarize(const std::vector<SensitiveMatch>& matches);

private:
    using Validator = std::function<bool(std::string_view)>;

    struct Rule {
        SensitiveType type;
        std::regex pattern;
        int group = 0;              // capture group holding the sensitive span
        Validator validate;         // optional post-match check
    };

    // Match plus the index of the rule that produced it (precedence on ties)
    struct RankedMatch {
        SensitiveMatch match;
        size_t rule_index;
    };

    // Scans text[begin, end). When the window is not the last one, the scan
    // resumes at next_begin and matches cut by the window edge are handled here.
    void scan_window(std::string_view text, size_t begin, size_t end, size_t next_begin,
                     std::vector<RankedMatch>& out) const;

    // Long lines are scanned in overlapping windows to bound regex cost
    static constexpr size_t kMaxWindow = 2048;
    static constexpr size_t kWindowOverlap = 256;

    Config config_;
    std::vector<Rule> rules_;
};

} // namespace clipstash
