#include "tiermem/archive/archive_chunk.h"

#include <cstring>
#include <iomanip>
#include <sstream>

namespace tiermem {
namespace archive {

namespace {

void put_field(std::ostringstream& oss, const char* name, const std::string& value) {
    oss << name << '=' << value.size() << ':' << value << '\n';
}

} // namespace

const char* chunk_encoding_name(ChunkEncoding encoding) {
    switch (encoding) {
        case ChunkEncoding::RAW: return "raw";
        case ChunkEncoding::DELTA: return "delta";
    }
    return "unknown";
}

uint64_t ArchiveChunk::stored_size() const {
    uint64_t total = 0;
    for (const auto& segment : segments) {
        total += segment.text.size();
    }
    for (const auto& [position, pin] : pinned) {
        total += pin.text.size();
    }
    return total;
}

std::string ArchiveChunk::canonical() const {
    // importance is hashed by its bit pattern so formatting cannot change it
    uint64_t importance_bits = 0;
    static_assert(sizeof(importance_bits) == sizeof(importance), "double must be 64-bit");
    std::memcpy(&importance_bits, &importance, sizeof(importance_bits));
    std::ostringstream bits;
    bits << std::hex << std::setw(16) << std::setfill('0') << importance_bits;

    std::ostringstream oss;
    oss << "tiermem-chunk-v1\n";
    put_field(oss, "owner_id", owner_id);
    put_field(oss, "chunk_id", std::to_string(chunk_id));
    put_field(oss, "item_id", std::to_string(item_id));
    put_field(oss, "session_id", session_id);
    put_field(oss, "timestamp", std::to_string(timestamp));
    put_field(oss, "importance", bits.str());
    put_field(oss, "encoding", chunk_encoding_name(encoding));
    put_field(oss, "base_prefix", std::to_string(base_prefix));
    put_field(oss, "base_suffix", std::to_string(base_suffix));
    put_field(oss, "segment_count", std::to_string(segments.size()));
    put_field(oss, "payload_root", payload_root);
    put_field(oss, "previous_hash", previous_hash ? *previous_hash : std::string("null"));
    put_field(oss, "raw_size", std::to_string(raw_size));
    return oss.str();
}

} // namespace archive
} // namespace tiermem
