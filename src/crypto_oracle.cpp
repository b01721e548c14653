#include "crypto_oracle.hpp"
#include <stdexcept>
#include <iostream>

Ed25519Signer::Ed25519Signer(EVP_PKEY* pkey) : pkey_(pkey) {
    size_t len = 0;
    EVP_PKEY* key = pkey_.get();
    if (EVP_PKEY_get_raw_public_key(key, nullptr, &len) != 1)
        throw std::runtime_error("Failed to read Ed25519 public key length");
    public_key_.resize(len);
    if (EVP_PKEY_get_raw_public_key(key, public_key_.data(), &len) != 1)
        throw std::runtime_error("Failed to read Ed25519 public key");
}

std::unique_ptr<Ed25519Signer> Ed25519Signer::generate() {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (!ctx) throw std::runtime_error("EVP_PKEY_CTX_new_id failed");

    EVP_PKEY* pkey = nullptr;
    bool ok = EVP_PKEY_keygen_init(ctx) == 1 && EVP_PKEY_keygen(ctx, &pkey) == 1;
    EVP_PKEY_CTX_free(ctx);
    if (!ok || !pkey) throw std::runtime_error("Ed25519 key generation failed");

    return std::unique_ptr<Ed25519Signer>(new Ed25519Signer(pkey));
}

std::vector<uint8_t> Ed25519Signer::sign(const Hash& header_hash) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    std::vector<uint8_t> signature;
    size_t sig_len = 0;
    EVP_PKEY* key = pkey_.get();
    bool ok = EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, key) == 1 &&
              EVP_DigestSign(ctx, nullptr, &sig_len, header_hash.data(), header_hash.size()) == 1;
    if (ok) {
        signature.resize(sig_len);
        ok = EVP_DigestSign(ctx, signature.data(), &sig_len, header_hash.data(), header_hash.size()) == 1;
        signature.resize(sig_len);
    }
    EVP_MD_CTX_free(ctx);

    if (!ok) throw std::runtime_error("Ed25519 signing failed");
    return signature;
}

bool ed25519_verify(const PublicKey& key, const Hash& message, const std::vector<uint8_t>& signature) {
    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, key.data(), key.size());
    if (!pkey) return false;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    bool ok = ctx != nullptr &&
              EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, pkey) == 1 &&
              EVP_DigestVerify(ctx, signature.data(), signature.size(),
                               message.data(), message.size()) == 1;
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return ok;
}

Ed25519CryptoOracle::Ed25519CryptoOracle(ProducerKeyLookup lookup)
    : lookup_(std::move(lookup)) {}

bool Ed25519CryptoOracle::verify_signature(const ChunkHeader& header) {
    auto key = lookup_(header.shard_id, header.height);
    if (!key) {
        std::cerr << "[CRYPTO] No producer key for shard " << header.shard_id
                  << " at height " << header.height << std::endl;
        return false;
    }
    return ed25519_verify(*key, header.hash(), header.signature);
}

bool Ed25519CryptoOracle::verify_merkle_proof(const Hash& leaf, uint64_t index, uint64_t leaf_count,
                                              const MerklePath& proof, const Hash& root) {
    return verify_path(leaf, index, leaf_count, proof, root);
}
