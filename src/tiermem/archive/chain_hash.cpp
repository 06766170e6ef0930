#include "tiermem/archive/chain_hash.h"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tiermem {
namespace archive {
namespace chain_hash {

namespace {

constexpr unsigned char kLeafPrefix = 0x00;
constexpr unsigned char kNodePrefix = 0x01;

std::string to_hex(const unsigned char* digest, size_t length) {
    std::stringstream ss;
    for (size_t i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(digest[i]);
    }
    return ss.str();
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string from_hex(const std::string& hex) {
    if (!is_digest(hex)) {
        throw std::invalid_argument("not a SHA-256 hex digest: " + hex);
    }
    std::string raw(hex.size() / 2, '\0');
    for (size_t i = 0; i < raw.size(); ++i) {
        raw[i] = static_cast<char>(hex_value(hex[2 * i]) * 16 + hex_value(hex[2 * i + 1]));
    }
    return raw;
}

std::string digest_of(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

} // namespace

std::string sha256_hex(const std::string& data) {
    return digest_of(data);
}

std::string leaf_digest(const std::string& segment) {
    std::string framed;
    framed.reserve(segment.size() + 1);
    framed.push_back(static_cast<char>(kLeafPrefix));
    framed.append(segment);
    return digest_of(framed);
}

std::string merkle_root(const std::vector<std::string>& leaf_digests) {
    if (leaf_digests.empty()) {
        return digest_of("");
    }
    std::vector<std::string> level = leaf_digests;
    while (level.size() > 1) {
        std::vector<std::string> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i + 1 < level.size(); i += 2) {
            std::string framed;
            framed.push_back(static_cast<char>(kNodePrefix));
            framed.append(from_hex(level[i]));
            framed.append(from_hex(level[i + 1]));
            next.push_back(digest_of(framed));
        }
        if (level.size() % 2 == 1) {
            next.push_back(level.back());
        }
        level.swap(next);
    }
    return level.front();
}

bool is_digest(const std::string& hex) {
    if (hex.size() != kDigestHexLength) {
        return false;
    }
    for (char c : hex) {
        if (hex_value(c) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace chain_hash
} // namespace archive
} // namespace tiermem
