#include "tiermem/core/types.h"

#include <algorithm>
#include <cctype>

namespace tiermem {
namespace core {

namespace {

// Indexed by the numeric value of Tier
const TierTraits kTierTraits[] = {
    {Tier::HOT, "hot", 2.0, false},
    {Tier::WARM, "warm", 1.0, false},
    {Tier::COLD, "cold", 0.5, true},
};

std::string to_lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const TierTraits& tier_traits(Tier tier) {
    return kTierTraits[static_cast<size_t>(tier)];
}

const char* tier_name(Tier tier) {
    return tier_traits(tier).name;
}

bool MemoryItem::mentions(const std::string& hint) const {
    std::string needle = normalize_label(hint);
    if (needle.empty()) {
        return false;
    }
    if (to_lower(content.text).find(needle) != std::string::npos) {
        return true;
    }
    for (const auto& entity : content.entities) {
        if (normalize_label(entity).find(needle) != std::string::npos) {
            return true;
        }
    }
    for (const auto& topic : content.topics) {
        if (normalize_label(topic).find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string normalize_label(const std::string& label) {
    size_t begin = 0;
    size_t end = label.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(label[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(label[end - 1]))) {
        --end;
    }
    return to_lower(label.substr(begin, end - begin));
}

} // namespace core
} // namespace tiermem
