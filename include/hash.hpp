#ifndef SHARDCHUNK_HASH_HPP
#define SHARDCHUNK_HASH_HPP

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

constexpr size_t HASH_SIZE = 32;

using Hash = std::array<uint8_t, HASH_SIZE>;

// SHA-256 (OpenSSL EVP)
Hash sha256(const uint8_t* data, size_t len);
Hash sha256(const std::vector<uint8_t>& data);

// Merkle hashing with distinct prefixes, so a leaf can never pass for an
// interior node: leaf_hash = sha256(0x00 || data),
// hash_pair = sha256(0x01 || left || right)
Hash leaf_hash(const std::vector<uint8_t>& data);
Hash hash_pair(const Hash& left, const Hash& right);

std::string to_hex(const Hash& h);
// First 8 hex chars, for log lines
std::string short_hex(const Hash& h);

#endif // SHARDCHUNK_HASH_HPP
