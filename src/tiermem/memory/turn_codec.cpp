#include "tiermem/memory/turn_codec.h"

namespace tiermem {
namespace memory {

namespace {

constexpr const char* kEntitiesKey = "entities: ";
constexpr const char* kTopicsKey = "topics: ";
constexpr const char* kSeparator = ", ";

std::string join(const std::vector<std::string>& labels) {
    std::string out;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) out += kSeparator;
        out += labels[i];
    }
    return out;
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> out;
    size_t start = 0;
    const std::string separator(kSeparator);
    while (start <= line.size()) {
        size_t end = line.find(separator, start);
        if (end == std::string::npos) end = line.size();
        if (end > start) out.push_back(line.substr(start, end - start));
        start = end + separator.size();
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string encode_turn(const core::MemoryContent& content) {
    std::string out;
    out += kEntitiesKey + join(content.entities) + "\n";
    out += kTopicsKey + join(content.topics) + "\n";
    out += "\n";
    out += content.text;
    return out;
}

core::MemoryContent decode_turn(const std::string& payload) {
    core::MemoryContent content;
    size_t pos = 0;
    bool has_header = false;

    const std::string keys[] = {kEntitiesKey, kTopicsKey};
    for (size_t k = 0; k < 2; ++k) {
        size_t eol = payload.find('\n', pos);
        if (eol == std::string::npos) break;
        std::string line = payload.substr(pos, eol - pos);
        if (!starts_with(line, keys[k])) break;
        auto labels = split(line.substr(keys[k].size()));
        if (k == 0) {
            content.entities = std::move(labels);
        } else {
            content.topics = std::move(labels);
        }
        pos = eol + 1;
        has_header = true;
    }

    if (has_header && pos < payload.size() && payload[pos] == '\n') {
        ++pos;
    }
    content.text = has_header ? payload.substr(pos) : payload;
    return content;
}

} // namespace memory
} // namespace tiermem
