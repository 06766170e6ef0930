#ifndef TIERMEM_ARCHIVE_ARCHIVE_LOG_H_
#define TIERMEM_ARCHIVE_ARCHIVE_LOG_H_

#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tiermem/archive/archive_sink.h"
#include "tiermem/core/result.h"

namespace tiermem {
namespace archive {

/**
 * @brief Append-only on-disk log of archive chunks, one file per owner
 *
 * Files are named chain_<hex owner id>.log and hold length-prefixed binary
 * records. A truncated tail record ends replay of that file and is cut off,
 * so later appends follow the last complete record.
 */
class ArchiveLog : public ArchiveSink {
public:
    ArchiveLog(const std::string& dir, bool flush_on_append = true);
    ~ArchiveLog() override;

    core::Result<void> persist(const ArchiveChunk& chunk) override; // Appends one record
    core::Result<void> rewrite(const core::OwnerId& owner,
                               const std::vector<ArchiveChunk>& chunks) override; // Atomic replace via rename
    core::Result<void> replay(std::function<void(ArchiveChunk)> callback) override; // Used on startup
    core::Result<void> flush() override;

    std::string owner_path(const core::OwnerId& owner) const;

    static std::vector<uint8_t> serialize_chunk(const ArchiveChunk& chunk);
    static std::optional<ArchiveChunk> deserialize_chunk(const std::vector<uint8_t>& data);

private:
    std::ofstream& stream_for(const core::OwnerId& owner);
    bool write_record(std::ofstream& out, const std::vector<uint8_t>& data, bool flush_now);
    core::Result<void> replay_file(const std::string& path,
                                   std::function<void(ArchiveChunk)> callback);

    std::string log_dir_;
    bool flush_on_append_;
    std::map<core::OwnerId, std::unique_ptr<std::ofstream>> files_;
    mutable std::mutex mutex_;  // Protects files_ and the write path
};

} // namespace archive
} // namespace tiermem

#endif // TIERMEM_ARCHIVE_ARCHIVE_LOG_H_
