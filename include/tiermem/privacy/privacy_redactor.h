#ifndef TIERMEM_PRIVACY_PRIVACY_REDACTOR_H_
#define TIERMEM_PRIVACY_PRIVACY_REDACTOR_H_

#include <cstddef>
#include <cstdint>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "tiermem/core/config.h"

namespace tiermem {
namespace privacy {

enum class PiiKind : uint8_t {
    EMAIL = 0,
    PHONE_NUMBER = 1,
    CARD_NUMBER = 2,
    NATIONAL_ID = 3,
    IP_ADDRESS = 4,
    FLAGGED_TERM = 5
};

const char* pii_kind_name(PiiKind kind);

/**
 * @brief A detected identifier, as a byte range of the scanned text
 */
struct PiiSpan {
    size_t offset;
    size_t length;
    PiiKind kind;
};

/**
 * @brief Finds personally identifying fragments in free text
 *
 * Detection is pattern based (emails, phone numbers, card-like digit runs,
 * national id numbers, IPv4 addresses) plus a list of identifiers flagged by
 * the caller, matched case-insensitively. The redactor never changes stored
 * data itself; the cold archive applies the spans it returns.
 */
class PrivacyRedactor {
public:
    explicit PrivacyRedactor(const core::PrivacyConfig& config = core::PrivacyConfig::Default());

    /**
     * @brief Detect identifiers
     * @param text Text to scan
     * @param extra_terms Identifiers flagged for this call only
     * @return Non-overlapping spans ordered by offset
     */
    std::vector<PiiSpan> detect(const std::string& text,
                                const std::vector<std::string>& extra_terms = {}) const;

    bool contains_pii(const std::string& text) const;

    /**
     * @brief Replace every detected span with the placeholder
     */
    std::string redact(const std::string& text,
                       const std::vector<std::string>& extra_terms = {}) const;

    const std::string& placeholder() const { return config_.placeholder; }
    const core::PrivacyConfig& config() const { return config_; }

private:
    void find_pattern(const std::string& text, const std::regex& pattern, PiiKind kind,
                      std::vector<PiiSpan>& spans) const;
    void find_term(const std::string& lowered_text, const std::string& term,
                   std::vector<PiiSpan>& spans) const;

    core::PrivacyConfig config_;
    std::vector<std::pair<std::regex, PiiKind>> patterns_;
};

} // namespace privacy
} // namespace tiermem

#endif // TIERMEM_PRIVACY_PRIVACY_REDACTOR_H_
