#pragma once
#include "chunk_types.hpp"
#include <openssl/evp.h>

#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>

using PublicKey = std::vector<uint8_t>;

// Signs header hashes on behalf of a chunk producer
class HeaderSigner {
public:
    virtual ~HeaderSigner() = default;
    virtual std::vector<uint8_t> sign(const Hash& header_hash) = 0;
};

// Signature and Merkle checks the pool consults before admitting anything
class CryptoOracle {
public:
    virtual ~CryptoOracle() = default;
    virtual bool verify_signature(const ChunkHeader& header) = 0;
    // `leaf` at `index` of a tree over `leaf_count` leaves
    virtual bool verify_merkle_proof(const Hash& leaf, uint64_t index, uint64_t leaf_count,
                                     const MerklePath& proof, const Hash& root) = 0;
};

struct EVPKeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};

// Ed25519 key pair held in an OpenSSL EVP_PKEY
class Ed25519Signer : public HeaderSigner {
public:
    static std::unique_ptr<Ed25519Signer> generate();

    std::vector<uint8_t> sign(const Hash& header_hash) override;
    const PublicKey& public_key() const { return public_key_; }

private:
    explicit Ed25519Signer(EVP_PKEY* pkey);

    std::unique_ptr<EVP_PKEY, EVPKeyDeleter> pkey_;
    PublicKey public_key_;
};

bool ed25519_verify(const PublicKey& key, const Hash& message, const std::vector<uint8_t>& signature);

// Resolves the expected producer key for (shard, height); external assignment
using ProducerKeyLookup = std::function<std::optional<PublicKey>(ShardId, BlockHeight)>;

class Ed25519CryptoOracle : public CryptoOracle {
public:
    explicit Ed25519CryptoOracle(ProducerKeyLookup lookup);

    bool verify_signature(const ChunkHeader& header) override;
    bool verify_merkle_proof(const Hash& leaf, uint64_t index, uint64_t leaf_count,
                             const MerklePath& proof, const Hash& root) override;

private:
    ProducerKeyLookup lookup_;
};
