#include "tiermem/archive/archive_log.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include "tiermem/common/logger.h"

namespace tiermem {
namespace archive {

namespace {

constexpr uint8_t kRecordVersion = 2;
constexpr const char* kFilePrefix = "chain_";
constexpr const char* kFileSuffix = ".log";

template<typename T>
void put(std::vector<uint8_t>& out, T value) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&value);
    out.insert(out.end(), bytes, bytes + sizeof(T));
}

void put_string(std::vector<uint8_t>& out, const std::string& s) {
    put<uint32_t>(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

// Bounds-checked cursor over a record
class RecordReader {
public:
    explicit RecordReader(const std::vector<uint8_t>& data) : data_(data) {}

    template<typename T>
    bool get(T& value) {
        if (pos_ + sizeof(T) > data_.size()) return false;
        std::memcpy(&value, data_.data() + pos_, sizeof(T));
        pos_ += sizeof(T);
        return true;
    }

    bool get_string(std::string& s) {
        uint32_t len = 0;
        if (!get(len) || pos_ + len > data_.size()) return false;
        s.assign(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    bool done() const { return pos_ == data_.size(); }

private:
    const std::vector<uint8_t>& data_;
    size_t pos_ = 0;
};

std::string hex_encode(const std::string& s) {
    std::ostringstream oss;
    for (unsigned char c : s) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return oss.str();
}

} // namespace

ArchiveLog::ArchiveLog(const std::string& dir, bool flush_on_append)
    : log_dir_(dir), flush_on_append_(flush_on_append) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        if (ec) {
            throw core::StorageError("Failed to check archive directory existence: " + ec.message());
        }
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw core::StorageError("Failed to create archive directory: " + ec.message());
        }
    }
}

ArchiveLog::~ArchiveLog() {
    for (auto& [owner, file] : files_) {
        if (file && file->is_open()) {
            file->close();
        }
    }
}

std::string ArchiveLog::owner_path(const core::OwnerId& owner) const {
    return log_dir_ + "/" + kFilePrefix + hex_encode(owner) + kFileSuffix;
}

std::ofstream& ArchiveLog::stream_for(const core::OwnerId& owner) {
    auto& file = files_[owner];
    if (!file || !file->is_open()) {
        file = std::make_unique<std::ofstream>(owner_path(owner), std::ios::binary | std::ios::app);
    }
    return *file;
}

bool ArchiveLog::write_record(std::ofstream& out, const std::vector<uint8_t>& data, bool flush_now) {
    if (!out.is_open()) {
        return false;
    }

    // Write data length first
    uint32_t data_length = static_cast<uint32_t>(data.size());
    out.write(reinterpret_cast<const char*>(&data_length), sizeof(data_length));
    out.write(reinterpret_cast<const char*>(data.data()), data.size());

    if (flush_now) {
        out.flush();
    }
    return out.good();
}

core::Result<void> ArchiveLog::persist(const ArchiveChunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        const std::string path = owner_path(chunk.owner_id);
        auto& out = stream_for(chunk.owner_id);
        out.flush();
        if (!out.is_open() || !out.good()) {
            files_.erase(chunk.owner_id);
            return core::Result<void>::error("Failed to open archive log " + path,
                                             core::Error::Code::STORAGE_FAILURE);
        }
        std::error_code ec;
        const std::uintmax_t good_size = std::filesystem::file_size(path, ec);
        if (ec) {
            return core::Result<void>::error("Failed to stat archive log " + path + ": " + ec.message(),
                                             core::Error::Code::STORAGE_FAILURE);
        }

        if (!write_record(out, serialize_chunk(chunk), flush_on_append_)) {
            // Drop the stream so the next attempt reopens the file, then cut
            // whatever part of the record reached it
            files_.erase(chunk.owner_id);
            std::filesystem::resize_file(path, good_size, ec);
            if (ec) {
                TIERMEM_ERROR("Failed to roll back partial record in {}: {}", path, ec.message());
            }
            return core::Result<void>::error("Failed to write archive record for owner " + chunk.owner_id,
                                             core::Error::Code::STORAGE_FAILURE);
        }
        return core::Result<void>();
    } catch (const std::exception& e) {
        return core::Result<void>::error("Archive log append failed: " + std::string(e.what()),
                                         core::Error::Code::STORAGE_FAILURE);
    }
}

core::Result<void> ArchiveLog::rewrite(const core::OwnerId& owner,
                                       const std::vector<ArchiveChunk>& chunks) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto open = files_.find(owner);
    if (open != files_.end()) {
        if (open->second && open->second->is_open()) {
            open->second->close();
        }
        files_.erase(open);
    }

    const std::string path = owner_path(owner);
    const std::string tmp_path = path + ".tmp";
    try {
        {
            std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                return core::Result<void>::error("Failed to open archive rewrite file: " + tmp_path,
                                                 core::Error::Code::STORAGE_FAILURE);
            }
            for (const auto& chunk : chunks) {
                if (!write_record(out, serialize_chunk(chunk), false)) {
                    return core::Result<void>::error("Failed to write archive rewrite file: " + tmp_path,
                                                     core::Error::Code::STORAGE_FAILURE);
                }
            }
            out.flush();
            if (!out.good()) {
                return core::Result<void>::error("Failed to flush archive rewrite file: " + tmp_path,
                                                 core::Error::Code::STORAGE_FAILURE);
            }
        }
        std::error_code ec;
        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            return core::Result<void>::error("Failed to replace archive log " + path + ": " + ec.message(),
                                             core::Error::Code::STORAGE_FAILURE);
        }
        return core::Result<void>();
    } catch (const std::exception& e) {
        return core::Result<void>::error("Archive log rewrite failed: " + std::string(e.what()),
                                         core::Error::Code::STORAGE_FAILURE);
    }
}

core::Result<void> ArchiveLog::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [owner, file] : files_) {
        if (file && file->is_open()) {
            file->flush();
            if (!file->good()) {
                return core::Result<void>::error("Failed to flush archive log of owner " + owner,
                                                 core::Error::Code::STORAGE_FAILURE);
            }
        }
    }
    return core::Result<void>();
}

core::Result<void> ArchiveLog::replay(std::function<void(ArchiveChunk)> callback) {
    std::vector<std::string> log_files;
    try {
        if (!std::filesystem::exists(log_dir_)) {
            return core::Result<void>();  // No directory, nothing to replay
        }
        if (!std::filesystem::is_directory(log_dir_)) {
            return core::Result<void>::error("Archive path is not a directory: " + log_dir_,
                                             core::Error::Code::STORAGE_FAILURE);
        }
        {
            // Closed so a torn tail can be cut; appends reopen lazily
            std::lock_guard<std::mutex> lock(mutex_);
            files_.clear();
        }
        for (const auto& entry : std::filesystem::directory_iterator(log_dir_)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            std::string filename = entry.path().filename().string();
            if (filename.rfind(kFilePrefix, 0) == 0 &&
                entry.path().extension().string() == kFileSuffix) {
                log_files.push_back(entry.path().string());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        return core::Result<void>::error("Archive replay failed: cannot access archive directory: " +
                                         std::string(e.what()),
                                         core::Error::Code::STORAGE_FAILURE);
    }

    std::sort(log_files.begin(), log_files.end());
    for (const auto& path : log_files) {
        auto result = replay_file(path, callback);
        if (!result.ok()) {
            return result;
        }
    }
    return core::Result<void>();
}

core::Result<void> ArchiveLog::replay_file(const std::string& path,
                                           std::function<void(ArchiveChunk)> callback) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return core::Result<void>::error("Failed to open archive log for replay: " + path,
                                         core::Error::Code::STORAGE_FAILURE);
    }

    file.seekg(0, std::ios::end);
    const std::streamoff file_size = file.tellg();
    file.seekg(0, std::ios::beg);

    // Guards against a corrupted length field
    const uint32_t kMaxRecordLength = 64 * 1024 * 1024;
    std::streamoff pos = 0;
    while (pos + static_cast<std::streamoff>(sizeof(uint32_t)) <= file_size) {
        uint32_t data_length = 0;
        file.read(reinterpret_cast<char*>(&data_length), sizeof(data_length));
        if (file.gcount() != sizeof(data_length)) {
            break;
        }
        if (data_length == 0 || data_length > kMaxRecordLength ||
            pos + static_cast<std::streamoff>(sizeof(uint32_t) + data_length) > file_size) {
            TIERMEM_WARN("Archive log {} has a truncated record at offset {}", path, pos);
            break;
        }

        std::vector<uint8_t> data(data_length);
        file.read(reinterpret_cast<char*>(data.data()), data_length);
        if (file.gcount() != static_cast<std::streamsize>(data_length)) {
            TIERMEM_WARN("Archive log {} ended inside a record at offset {}", path, pos);
            break;
        }
        pos += static_cast<std::streamoff>(sizeof(uint32_t) + data_length);

        auto chunk = deserialize_chunk(data);
        if (!chunk) {
            return core::Result<void>::error("Corrupt archive record in " + path + " at offset " +
                                             std::to_string(pos - data_length - sizeof(uint32_t)),
                                             core::Error::Code::CHAIN_INTEGRITY);
        }
        callback(std::move(*chunk));
    }

    if (pos < file_size) {
        // Appends must continue from the last complete record
        file.close();
        std::error_code ec;
        std::filesystem::resize_file(path, static_cast<std::uintmax_t>(pos), ec);
        if (ec) {
            return core::Result<void>::error("Failed to truncate torn tail of " + path + ": " + ec.message(),
                                             core::Error::Code::STORAGE_FAILURE);
        }
        TIERMEM_WARN("Truncated archive log {} from {} to {} bytes", path, file_size, pos);
    }
    return core::Result<void>();
}

std::vector<uint8_t> ArchiveLog::serialize_chunk(const ArchiveChunk& chunk) {
    std::vector<uint8_t> out;
    put<uint8_t>(out, kRecordVersion);
    put<uint64_t>(out, chunk.chunk_id);
    put_string(out, chunk.owner_id);
    put<uint64_t>(out, chunk.item_id);
    put_string(out, chunk.session_id);
    put<int64_t>(out, chunk.timestamp);
    put<double>(out, chunk.importance);
    put<uint8_t>(out, static_cast<uint8_t>(chunk.encoding));
    put<uint32_t>(out, chunk.base_prefix);
    put<uint32_t>(out, chunk.base_suffix);

    put<uint32_t>(out, static_cast<uint32_t>(chunk.segments.size()));
    for (const auto& segment : chunk.segments) {
        put<uint8_t>(out, segment.redacted ? 1 : 0);
        put_string(out, segment.text);
        put_string(out, segment.leaf_digest);
    }
    put<uint32_t>(out, static_cast<uint32_t>(chunk.pinned.size()));
    for (const auto& [position, pin] : chunk.pinned) {
        put<uint32_t>(out, position);
        put<uint8_t>(out, pin.redacted ? 1 : 0);
        put_string(out, pin.text);
        put_string(out, pin.leaf_digest);
    }

    put_string(out, chunk.payload_root);
    put<uint8_t>(out, chunk.previous_hash ? 1 : 0);
    put_string(out, chunk.previous_hash ? *chunk.previous_hash : std::string());
    put_string(out, chunk.content_hash);
    put<uint8_t>(out, chunk.redacted ? 1 : 0);
    put<uint64_t>(out, chunk.raw_size);
    return out;
}

std::optional<ArchiveChunk> ArchiveLog::deserialize_chunk(const std::vector<uint8_t>& data) {
    RecordReader in(data);
    ArchiveChunk chunk;

    uint8_t version = 0;
    if (!in.get(version) || version != kRecordVersion) return std::nullopt;
    if (!in.get(chunk.chunk_id) || !in.get_string(chunk.owner_id) || !in.get(chunk.item_id) ||
        !in.get_string(chunk.session_id) || !in.get(chunk.timestamp) || !in.get(chunk.importance)) {
        return std::nullopt;
    }

    uint8_t encoding = 0;
    if (!in.get(encoding) || encoding > static_cast<uint8_t>(ChunkEncoding::DELTA)) return std::nullopt;
    chunk.encoding = static_cast<ChunkEncoding>(encoding);
    if (!in.get(chunk.base_prefix) || !in.get(chunk.base_suffix)) return std::nullopt;

    uint32_t segment_count = 0;
    if (!in.get(segment_count)) return std::nullopt;
    for (uint32_t i = 0; i < segment_count; ++i) {
        Segment segment;
        uint8_t redacted = 0;
        if (!in.get(redacted) || !in.get_string(segment.text) || !in.get_string(segment.leaf_digest)) {
            return std::nullopt;
        }
        segment.redacted = redacted != 0;
        chunk.segments.push_back(std::move(segment));
    }

    uint32_t pin_count = 0;
    if (!in.get(pin_count)) return std::nullopt;
    for (uint32_t i = 0; i < pin_count; ++i) {
        uint32_t position = 0;
        Segment pin;
        uint8_t redacted = 0;
        if (!in.get(position) || !in.get(redacted) || !in.get_string(pin.text) ||
            !in.get_string(pin.leaf_digest)) {
            return std::nullopt;
        }
        pin.redacted = redacted != 0;
        if (!chunk.pinned.emplace(position, std::move(pin)).second) return std::nullopt;
    }

    uint8_t has_previous = 0;
    std::string previous;
    uint8_t redacted = 0;
    if (!in.get_string(chunk.payload_root) || !in.get(has_previous) || !in.get_string(previous) ||
        !in.get_string(chunk.content_hash) || !in.get(redacted) || !in.get(chunk.raw_size)) {
        return std::nullopt;
    }
    if (has_previous) {
        chunk.previous_hash = std::move(previous);
    }
    chunk.redacted = redacted != 0;

    if (!in.done()) return std::nullopt;
    return chunk;
}

} // namespace archive
} // namespace tiermem
