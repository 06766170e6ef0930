#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tiermem/archive/archive_chunk.h"
#include "tiermem/core/result.h"

namespace tiermem {
namespace archive {

/**
 * @brief Split a payload into segments whose concatenation is the payload
 *
 * A segment is a maximal run of non-whitespace characters followed by its
 * trailing whitespace. Leading whitespace forms a segment of its own.
 */
std::vector<std::string> split_segments(const std::string& payload);

std::string join_segments(const std::vector<std::string>& segments);

/**
 * @brief How a payload is stored relative to the previous payload
 */
struct DeltaPlan {
    ChunkEncoding encoding = ChunkEncoding::RAW;
    uint32_t base_prefix = 0;
    uint32_t base_suffix = 0;
    std::vector<std::string> stored;    // whole payload (raw) or middle (delta)
};

/**
 * @brief Segment-level splice delta between consecutive payloads
 *
 * The common leading and trailing segments of base and target are copied by
 * count and only the middle is stored. A delta is chosen when the copied
 * share of the longer payload reaches the similarity threshold and the stored
 * bytes are fewer than the raw bytes.
 */
class DeltaCodec {
public:
    explicit DeltaCodec(double similarity_threshold = 0.5);

    DeltaPlan encode(const std::vector<std::string>& base,
                     const std::vector<std::string>& target) const;

    // Raw plan, used when no base is available or a snapshot is forced
    static DeltaPlan raw(std::vector<std::string> target);

    /**
     * @brief Rebuild a payload from the previous payload and a delta
     * @return INVALID_ARGUMENT if prefix + suffix exceed the base length
     */
    template<typename T>
    static core::Result<std::vector<T>> apply(const std::vector<T>& base,
                                              uint32_t base_prefix,
                                              uint32_t base_suffix,
                                              std::vector<T> middle) {
        if (static_cast<size_t>(base_prefix) + base_suffix > base.size()) {
            return core::Result<std::vector<T>>::error(
                "delta copies more segments than its base holds",
                core::Error::Code::INVALID_ARGUMENT);
        }
        std::vector<T> out;
        out.reserve(base_prefix + middle.size() + base_suffix);
        out.insert(out.end(), base.begin(), base.begin() + base_prefix);
        for (auto& segment : middle) {
            out.push_back(std::move(segment));
        }
        out.insert(out.end(), base.end() - base_suffix, base.end());
        return core::Result<std::vector<T>>(std::move(out));
    }

private:
    double similarity_threshold_;
};

} // namespace archive
} // namespace tiermem
