#include "security/redactor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace clipstash {

namespace {

constexpr std::string_view kBullets = "••••••••";

std::string digits_only(std::string_view value) {
    std::string digits;
    digits.reserve(value.size());
    for (const char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    return digits;
}

/**
 * @brief Luhn algorithm validation for credit card numbers
 * @param number String containing digits and optional separators
 * @return true if passes Luhn check
 */
bool luhn_validate(std::string_view number) {
    const std::string digits = digits_only(number);
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[i] - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

/**
 * @brief Validate SSN is not obviously fake
 * Area cannot be 000, 666 or 900-999; group cannot be 00; serial cannot be 0000
 */
bool validate_ssn(std::string_view value) {
    const std::string digits = digits_only(value);
    if (digits.size() != 9) {
        return false;
    }

    const int area = std::stoi(digits.substr(0, 3));
    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }
    if (std::stoi(digits.substr(3, 2)) == 0) {
        return false;
    }
    if (std::stoi(digits.substr(5, 4)) == 0) {
        return false;
    }
    return true;
}

/**
 * @brief Random-looking token check: mixed case plus digits and
 * Shannon entropy of at least 4 bits per character
 */
bool looks_high_entropy(std::string_view value) {
    bool upper = false;
    bool lower = false;
    bool digit = false;
    int counts[256] = {};
    for (const char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        upper |= std::isupper(uc) != 0;
        lower |= std::islower(uc) != 0;
        digit |= std::isdigit(uc) != 0;
        ++counts[uc];
    }
    if (!upper || !lower || !digit) return false;

    const double n = static_cast<double>(value.size());
    double entropy = 0.0;
    for (const int count : counts) {
        if (count == 0) continue;
        const double p = count / n;
        entropy -= p * std::log2(p);
    }
    return entropy >= 4.0;
}

bool is_separator(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0 || c == '"' || c == '\'';
}

} // anonymous namespace

Redactor::Redactor() : Redactor(Config{}) {}

Redactor::Redactor(const Config& config) : config_(config) {
    const auto ecma = std::regex::ECMAScript | std::regex::optimize;

    // API keys with recognizable provider prefixes
    const char* api_key_patterns[] = {
        R"(sk-proj-[a-zA-Z0-9_-]{20,})",          // OpenAI project keys
        R"(sk-[a-zA-Z0-9]{20,})",                 // OpenAI
        R"(AKIA[A-Z0-9]{16})",                    // AWS access key id
        R"(ghp_[a-zA-Z0-9]{36})",                 // GitHub PAT
        R"(gho_[a-zA-Z0-9]{36})",                 // GitHub OAuth
        R"(github_pat_[a-zA-Z0-9_]{22,})",        // GitHub fine-grained PAT
        R"(xox[baprs]-[a-zA-Z0-9-]{10,})",        // Slack
        R"(AIza[a-zA-Z0-9_-]{35})",               // Google
        R"(sq0[a-z]{3}-[a-zA-Z0-9_-]{22,})",      // Square
        R"((?:sk|rk|pk)_(?:live|test)_[a-zA-Z0-9]{24,})",  // Stripe
    };
    for (const char* p : api_key_patterns) {
        rules_.push_back({SensitiveType::API_KEY, std::regex(p, ecma), 0, nullptr});
    }

    // Value of a password-like key; quotes around the value are not part of it
    rules_.push_back({SensitiveType::PASSWORD,
        std::regex(R"((?:password|passwd|pwd|pass|secret|token|api_key|apikey|auth)[=:\s]+['"]?([^\s'"]{6,}))",
                   ecma | std::regex::icase),
        1, nullptr});

    rules_.push_back({SensitiveType::SSN,
        std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)", ecma), 0, validate_ssn});
    rules_.push_back({SensitiveType::SSN,
        std::regex(R"(\b\d{9}\b)", ecma), 0, validate_ssn});

    rules_.push_back({SensitiveType::CREDIT_CARD,
        std::regex(R"(\b\d{4}[- ]?\d{4}[- ]?\d{4}[- ]?\d{4}\b)", ecma), 0, luhn_validate});
    rules_.push_back({SensitiveType::CREDIT_CARD,
        std::regex(R"(\b\d{4}[- ]?\d{6}[- ]?\d{5}\b)", ecma), 0, luhn_validate});

    rules_.push_back({SensitiveType::PRIVATE_KEY,
        std::regex(R"(-----BEGIN [A-Z ]*PRIVATE KEY-----)", ecma), 0, nullptr});

    rules_.push_back({SensitiveType::CERTIFICATE,
        std::regex(R"(-----BEGIN (?:X509 )?CERTIFICATE-----)", ecma), 0, nullptr});

    rules_.push_back({SensitiveType::TOKEN,
        std::regex(R"(eyJ[a-zA-Z0-9_-]{10,}\.[a-zA-Z0-9_-]{10,}\.[a-zA-Z0-9_-]{10,})", ecma), 0, nullptr});
    rules_.push_back({SensitiveType::TOKEN,
        std::regex(R"(Bearer\s+[a-zA-Z0-9_.~+/-]{20,}=*)", ecma), 0, nullptr});

    // Unprefixed secrets: lowest precedence so specific rules name the span first
    rules_.push_back({SensitiveType::API_KEY,
        std::regex(R"([A-Za-z0-9_+/-]{32,}={0,2})", ecma), 0, looks_high_entropy});
}

RedactionResult Redactor::redact(std::string_view text) const {
    RedactionResult result;
    if (!config_.enabled) return result;

    result.matches = detect(text);
    if (result.matches.empty()) return result;

    result.is_sensitive = true;
    result.masked_preview = utils::make_preview(mask_text(text, result.matches),
                                                config_.preview_length);
    result.summary = summarize(result.matches);
    return result;
}

std::vector<SensitiveMatch> Redactor::detect(std::string_view text) const {
    std::vector<SensitiveMatch> out;
    if (text.empty()) return out;

    std::vector<RankedMatch> found;
    size_t pos = 0;
    while (true) {
        const size_t win_end = std::min(pos + kMaxWindow, text.size());
        if (win_end >= text.size()) {
            scan_window(text, pos, win_end, win_end, found);
            break;
        }

        // A word running across the edge is rescanned whole by the next window
        size_t next = win_end - kWindowOverlap;
        if (!is_separator(text[win_end - 1]) && !is_separator(text[win_end])) {
            size_t word_start = win_end - 1;
            while (word_start > pos && !is_separator(text[word_start - 1])) {
                --word_start;
            }
            if (word_start > pos) {
                next = std::min(next, word_start);
            }
        }
        scan_window(text, pos, win_end, next, found);
        pos = next;
    }

    std::stable_sort(found.begin(), found.end(), [](const RankedMatch& a, const RankedMatch& b) {
        if (a.match.start != b.match.start) return a.match.start < b.match.start;
        return a.rule_index < b.rule_index;
    });

    // Keep the first of overlapping spans, widened to cover whatever overlaps it
    for (auto& f : found) {
        if (!out.empty() && f.match.start < out.back().end) {
            auto& kept = out.back();
            if (f.match.end > kept.end) {
                kept.original.append(text.substr(kept.end, f.match.end - kept.end));
                kept.end = f.match.end;
                kept.masked = mask_value(kept.original, kept.type);
            }
            continue;
        }
        out.push_back(std::move(f.match));
    }
    return out;
}

void Redactor::scan_window(std::string_view text, size_t begin, size_t end, size_t next_begin,
                           std::vector<RankedMatch>& out) const {
    const std::string_view window = text.substr(begin, end - begin);
    const bool cut = end < text.size() && !is_separator(text[end]);

    for (size_t r = 0; r < rules_.size(); ++r) {
        const auto& rule = rules_[r];

        for (std::cregex_iterator it(window.data(), window.data() + window.size(), rule.pattern), last;
             it != last; ++it) {
            const auto& m = *it;
            if (!m[rule.group].matched) continue;

            const size_t start = begin + static_cast<size_t>(m.position(rule.group));
            size_t stop = start + static_cast<size_t>(m.length(rule.group));

            if (cut && stop == end) {
                // The next window sees this match with its continuation
                if (begin + static_cast<size_t>(m.position(0)) >= next_begin) continue;
                // Longer than a window: mask through the end of the word
                while (stop < text.size() && !is_separator(text[stop])) {
                    ++stop;
                }
            }

            const std::string_view value = text.substr(start, stop - start);
            if (rule.validate && !rule.validate(value)) continue;

            SensitiveMatch match;
            match.type = rule.type;
            match.start = start;
            match.end = stop;
            match.original = std::string(value);
            match.masked = mask_value(value, rule.type);
            out.push_back({std::move(match), r});
        }
    }
}

std::string Redactor::mask_text(std::string_view text, const std::vector<SensitiveMatch>& matches) {
    if (matches.empty()) return std::string(text);

    std::string result;
    result.reserve(text.size());
    size_t last_pos = 0;
    for (const auto& m : matches) {
        if (m.start < last_pos || m.end > text.size()) continue;
        result.append(text.substr(last_pos, m.start - last_pos));
        result.append(m.masked);
        last_pos = m.end;
    }
    result.append(text.substr(last_pos));
    return result;
}

std::string Redactor::mask_value(std::string_view value, SensitiveType type) {
    switch (type) {
        case SensitiveType::SSN: {
            // Last 4 digits stay visible
            const std::string_view last4 = value.substr(value.size() >= 4 ? value.size() - 4 : 0);
            if (value.find('-') != std::string_view::npos) {
                return "•••-••-" + std::string(last4);
            }
            return "•••••" + std::string(last4);
        }

        case SensitiveType::CREDIT_CARD: {
            const std::string digits = digits_only(value);
            const std::string last4 = digits.substr(digits.size() >= 4 ? digits.size() - 4 : 0);
            return "••••-••••-••••-" + last4;
        }

        case SensitiveType::PRIVATE_KEY:
            return "[Private Key]";

        case SensitiveType::CERTIFICATE:
            return "[Certificate]";

        case SensitiveType::PASSWORD:
            return std::string(kBullets);

        case SensitiveType::TOKEN:
            if (value.starts_with("Bearer")) {
                return "Bearer " + std::string(kBullets);
            }
            if (value.starts_with("eyJ") && value.size() > 10) {
                // JWT: header prefix only
                return std::string(value.substr(0, 10)) + std::string(kBullets);
            }
            return std::string(kBullets);

        case SensitiveType::API_KEY:
            if (value.size() > 12) {
                const size_t prefix_len = std::min<size_t>(8, value.size() / 4);
                constexpr size_t kSuffixLen = 4;
                return std::string(value.substr(0, prefix_len)) + std::string(kBullets) +
                       std::string(value.substr(value.size() - kSuffixLen));
            }
            return std::string(kBullets);
    }
    return std::string(kBullets);
}

std::string Redactor::summarize(const std::vector<SensitiveMatch>& matches) {
    std::set<std::string_view> names;
    for (const auto& m : matches) {
        names.insert(sensitive_type_name(m.type));
    }

    std::string summary;
    for (const auto& name : names) {
        if (!summary.empty()) summary += ", ";
        summary += name;
    }
    return summary;
}

} // namespace clipstash
