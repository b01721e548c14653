#include "hash.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>

Hash sha256(const uint8_t* data, size_t len) {
    Hash out{};
    unsigned int out_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data, len) == 1 &&
              EVP_DigestFinal_ex(ctx, out.data(), &out_len) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok || out_len != HASH_SIZE) throw std::runtime_error("SHA-256 digest failed");
    return out;
}

Hash sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

namespace {
constexpr uint8_t LEAF_PREFIX = 0x00;
constexpr uint8_t NODE_PREFIX = 0x01;
}

Hash leaf_hash(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> buf;
    buf.reserve(data.size() + 1);
    buf.push_back(LEAF_PREFIX);
    buf.insert(buf.end(), data.begin(), data.end());
    return sha256(buf);
}

Hash hash_pair(const Hash& left, const Hash& right) {
    uint8_t buf[1 + HASH_SIZE * 2];
    buf[0] = NODE_PREFIX;
    std::copy(left.begin(), left.end(), buf + 1);
    std::copy(right.begin(), right.end(), buf + 1 + HASH_SIZE);
    return sha256(buf, sizeof(buf));
}

std::string to_hex(const Hash& h) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (uint8_t b : h) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::string short_hex(const Hash& h) {
    return to_hex(h).substr(0, 8);
}
