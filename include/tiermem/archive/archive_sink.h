#pragma once

#include <functional>
#include <vector>

#include "tiermem/archive/archive_chunk.h"
#include "tiermem/core/result.h"

namespace tiermem {
namespace archive {

/**
 * @brief Durable destination of cold-tier chunks
 *
 * persist() must make the chunk durable before it returns; the archive only
 * publishes a chunk after persist() succeeds. rewrite() replaces every stored
 * chunk of an owner and is used after redaction so masked content does not
 * remain on disk. replay() feeds every stored chunk to the callback, owner by
 * owner in chunk order.
 */
class ArchiveSink {
public:
    virtual ~ArchiveSink() = default;

    virtual core::Result<void> persist(const ArchiveChunk& chunk) = 0;
    virtual core::Result<void> rewrite(const core::OwnerId& owner,
                                       const std::vector<ArchiveChunk>& chunks) = 0;
    virtual core::Result<void> replay(std::function<void(ArchiveChunk)> callback) = 0;
    virtual core::Result<void> flush() { return core::Result<void>(); }
};

/**
 * @brief Sink for purely in-memory engines
 */
class NullArchiveSink : public ArchiveSink {
public:
    core::Result<void> persist(const ArchiveChunk&) override { return core::Result<void>(); }
    core::Result<void> rewrite(const core::OwnerId&, const std::vector<ArchiveChunk>&) override {
        return core::Result<void>();
    }
    core::Result<void> replay(std::function<void(ArchiveChunk)>) override {
        return core::Result<void>();
    }
};

} // namespace archive
} // namespace tiermem
