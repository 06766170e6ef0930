#include "tiermem/privacy/privacy_redactor.h"

#include <algorithm>
#include <cctype>

#include "tiermem/core/error.h"

namespace tiermem {
namespace privacy {

namespace {

const char* const kPiiKindNames[] = {
    "email", "phone_number", "card_number", "national_id", "ip_address", "flagged_term"
};

const char* const kEmailPattern =
    R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})";
const char* const kNationalIdPattern =
    R"(\b\d{3}-\d{2}-\d{4}\b)";
const char* const kCardPattern =
    R"(\b(?:\d[ -]?){12,18}\d\b)";
const char* const kIpv4Pattern =
    R"(\b(?:(?:25[0-5]|2[0-4]\d|1?\d?\d)\.){3}(?:25[0-5]|2[0-4]\d|1?\d?\d)\b)";
const char* const kPhonePattern =
    R"((?:\+\d{1,3}[ .-]?)?(?:\(\d{3}\)\s?|\b\d{3}[ .-]?)\d{3}[ .-]?\d{4}\b)";

std::string to_lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Sorts spans and folds overlapping ones into the earliest
std::vector<PiiSpan> merge_spans(std::vector<PiiSpan> spans) {
    std::sort(spans.begin(), spans.end(), [](const PiiSpan& a, const PiiSpan& b) {
        if (a.offset != b.offset) return a.offset < b.offset;
        return a.length > b.length;
    });
    std::vector<PiiSpan> merged;
    for (const auto& span : spans) {
        if (!merged.empty() && span.offset < merged.back().offset + merged.back().length) {
            size_t end = std::max(merged.back().offset + merged.back().length,
                                  span.offset + span.length);
            merged.back().length = end - merged.back().offset;
            continue;
        }
        merged.push_back(span);
    }
    return merged;
}

} // namespace

const char* pii_kind_name(PiiKind kind) {
    return kPiiKindNames[static_cast<size_t>(kind)];
}

PrivacyRedactor::PrivacyRedactor(const core::PrivacyConfig& config) : config_(config) {
    if (config_.placeholder.empty()) {
        throw core::InvalidArgumentError("Redaction placeholder must not be empty");
    }
    if (config_.detect_emails) {
        patterns_.emplace_back(std::regex(kEmailPattern), PiiKind::EMAIL);
    }
    if (config_.detect_national_ids) {
        patterns_.emplace_back(std::regex(kNationalIdPattern), PiiKind::NATIONAL_ID);
    }
    if (config_.detect_card_numbers) {
        patterns_.emplace_back(std::regex(kCardPattern), PiiKind::CARD_NUMBER);
    }
    if (config_.detect_ip_addresses) {
        patterns_.emplace_back(std::regex(kIpv4Pattern), PiiKind::IP_ADDRESS);
    }
    if (config_.detect_phone_numbers) {
        patterns_.emplace_back(std::regex(kPhonePattern), PiiKind::PHONE_NUMBER);
    }
}

void PrivacyRedactor::find_pattern(const std::string& text, const std::regex& pattern, PiiKind kind,
                                   std::vector<PiiSpan>& spans) const {
    auto begin = std::sregex_iterator(text.begin(), text.end(), pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        if (it->length(0) == 0) {
            continue;
        }
        spans.push_back(PiiSpan{static_cast<size_t>(it->position(0)),
                                static_cast<size_t>(it->length(0)), kind});
    }
}

void PrivacyRedactor::find_term(const std::string& lowered_text, const std::string& term,
                                std::vector<PiiSpan>& spans) const {
    std::string needle = to_lower(term);
    if (needle.empty()) {
        return;
    }
    size_t pos = lowered_text.find(needle);
    while (pos != std::string::npos) {
        spans.push_back(PiiSpan{pos, needle.size(), PiiKind::FLAGGED_TERM});
        pos = lowered_text.find(needle, pos + needle.size());
    }
}

std::vector<PiiSpan> PrivacyRedactor::detect(const std::string& text,
                                             const std::vector<std::string>& extra_terms) const {
    std::vector<PiiSpan> spans;
    for (const auto& [pattern, kind] : patterns_) {
        find_pattern(text, pattern, kind, spans);
    }

    if (!config_.flagged_terms.empty() || !extra_terms.empty()) {
        std::string lowered = to_lower(text);
        for (const auto& term : config_.flagged_terms) {
            find_term(lowered, term, spans);
        }
        for (const auto& term : extra_terms) {
            find_term(lowered, term, spans);
        }
    }
    return merge_spans(std::move(spans));
}

bool PrivacyRedactor::contains_pii(const std::string& text) const {
    return !detect(text).empty();
}

std::string PrivacyRedactor::redact(const std::string& text,
                                    const std::vector<std::string>& extra_terms) const {
    std::string out;
    size_t cursor = 0;
    for (const auto& span : detect(text, extra_terms)) {
        out.append(text, cursor, span.offset - cursor);
        out.append(config_.placeholder);
        cursor = span.offset + span.length;
    }
    out.append(text, cursor, std::string::npos);
    return out;
}

} // namespace privacy
} // namespace tiermem
