#include "tiermem/archive/delta_codec.h"

#include <algorithm>
#include <cctype>

#include "tiermem/core/error.h"

namespace tiermem {
namespace archive {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

size_t total_size(const std::vector<std::string>& segments) {
    size_t total = 0;
    for (const auto& s : segments) {
        total += s.size();
    }
    return total;
}

} // namespace

std::vector<std::string> split_segments(const std::string& payload) {
    std::vector<std::string> segments;
    size_t i = 0;
    const size_t n = payload.size();

    if (i < n && is_space(payload[i])) {
        size_t start = i;
        while (i < n && is_space(payload[i])) ++i;
        segments.push_back(payload.substr(start, i - start));
    }
    while (i < n) {
        size_t start = i;
        while (i < n && !is_space(payload[i])) ++i;
        while (i < n && is_space(payload[i])) ++i;
        segments.push_back(payload.substr(start, i - start));
    }
    return segments;
}

std::string join_segments(const std::vector<std::string>& segments) {
    std::string out;
    out.reserve(total_size(segments));
    for (const auto& s : segments) {
        out.append(s);
    }
    return out;
}

DeltaCodec::DeltaCodec(double similarity_threshold)
    : similarity_threshold_(similarity_threshold) {
    if (!(similarity_threshold_ > 0.0) || similarity_threshold_ > 1.0) {
        throw core::InvalidArgumentError("Delta similarity threshold must lie in (0, 1]");
    }
}

DeltaPlan DeltaCodec::raw(std::vector<std::string> target) {
    DeltaPlan plan;
    plan.encoding = ChunkEncoding::RAW;
    plan.stored = std::move(target);
    return plan;
}

DeltaPlan DeltaCodec::encode(const std::vector<std::string>& base,
                             const std::vector<std::string>& target) const {
    if (base.empty() || target.empty()) {
        return raw(target);
    }

    const size_t limit = std::min(base.size(), target.size());
    size_t prefix = 0;
    while (prefix < limit && base[prefix] == target[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < limit - prefix &&
           base[base.size() - 1 - suffix] == target[target.size() - 1 - suffix]) {
        ++suffix;
    }

    const size_t copied = prefix + suffix;
    const double share = static_cast<double>(copied) / std::max(base.size(), target.size());
    std::vector<std::string> middle(target.begin() + prefix, target.end() - suffix);

    if (copied == 0 || share < similarity_threshold_ || total_size(middle) >= total_size(target)) {
        return raw(target);
    }

    DeltaPlan plan;
    plan.encoding = ChunkEncoding::DELTA;
    plan.base_prefix = static_cast<uint32_t>(prefix);
    plan.base_suffix = static_cast<uint32_t>(suffix);
    plan.stored = std::move(middle);
    return plan;
}

} // namespace archive
} // namespace tiermem
