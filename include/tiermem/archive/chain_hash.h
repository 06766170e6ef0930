#ifndef TIERMEM_ARCHIVE_CHAIN_HASH_H_
#define TIERMEM_ARCHIVE_CHAIN_HASH_H_

#include <string>
#include <vector>

namespace tiermem {
namespace archive {

/**
 * @brief SHA-256 helpers for the cold-tier hash chain
 *
 * All digests are lowercase hex strings. The payload commitment is a Merkle
 * root over per-segment leaf digests so that a segment can be masked later
 * without changing the root: the masked segment keeps its original leaf
 * digest.
 */
namespace chain_hash {

// Number of hex characters in a digest
constexpr size_t kDigestHexLength = 64;

std::string sha256_hex(const std::string& data);

// SHA256(0x00 || segment)
std::string leaf_digest(const std::string& segment);

/**
 * @brief Merkle root over hex leaf digests
 *
 * Internal nodes are SHA256(0x01 || left || right) over the raw 32-byte
 * digests. An odd node at the end of a level is promoted unchanged. The root
 * of an empty list is the digest of the empty string.
 */
std::string merkle_root(const std::vector<std::string>& leaf_digests);

bool is_digest(const std::string& hex);

} // namespace chain_hash
} // namespace archive
} // namespace tiermem

#endif // TIERMEM_ARCHIVE_CHAIN_HASH_H_
